/**
 * @file label_table.hpp
 * @brief Label table for MEPA programs
 *
 * Derived mapping from label name to the line number that declares it.
 * The table is never authoritative: it is rebuilt from the program each
 * time the machine takes a snapshot. When a label is declared more than
 * once, the declaration defined last replaces the earlier one, so building
 * in ascending line order makes the highest line number win.
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace mepa {

/**
 * @brief Hash-based label storage and lookup
 */
class LabelTable {
  public:
    /**
     * @brief Remove all labels
     */
    void reset();

    /**
     * @brief Define (or redefine) a label
     * @param name Label name
     * @param line Line number declaring the label
     */
    void define(const std::string &name, int line);

    /**
     * @brief Look up the line for a label
     * @param name Label name
     * @return std::optional<int> Line number if defined
     */
    std::optional<int> lookup(const std::string &name) const;

  private:
    std::unordered_map<std::string, int> table_;
};

} // namespace mepa
