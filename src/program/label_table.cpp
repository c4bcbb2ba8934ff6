// Label table implementation
//
// Redefinition overwrites silently. Machine::rebuild() walks the program in
// ascending line order, which makes the last (highest-numbered) declaration
// of a duplicated label the one every jump resolves to.
#include "mepa/program/label_table.hpp"

namespace mepa {

void LabelTable::reset() {
    table_.clear();
}

void LabelTable::define(const std::string &name, int line) {
    table_[name] = line;
}

std::optional<int> LabelTable::lookup(const std::string &name) const {
    auto it = table_.find(name);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace mepa
