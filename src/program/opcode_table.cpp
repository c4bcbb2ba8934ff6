// Opcode table for the MEPA instruction set
//
// Single-argument instructions (AMEM, DMEM, CRCT, CRVL, ARMZ, DSVS, DSVF)
// carry arg_count 1 and are checked by the machine before execution.
// The remaining instructions ignore any operands they are given.
#include "mepa/program/opcode_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mepa {

namespace {

constexpr std::array<OpcodeInfo, 26> kOpcodes = {{
    {Opcode::None, "", -1},
    {Opcode::Unknown, "?", -1},
    {Opcode::INPP, "INPP", -1},
    {Opcode::PARA, "PARA", -1},
    {Opcode::NADA, "NADA", -1},
    {Opcode::AMEM, "AMEM", 1},
    {Opcode::DMEM, "DMEM", 1},
    {Opcode::CRCT, "CRCT", 1},
    {Opcode::CRVL, "CRVL", 1},
    {Opcode::ARMZ, "ARMZ", 1},
    {Opcode::SOMA, "SOMA", -1},
    {Opcode::SUBT, "SUBT", -1},
    {Opcode::MULT, "MULT", -1},
    {Opcode::DIVI, "DIVI", -1},
    {Opcode::INVR, "INVR", -1},
    {Opcode::CONJ, "CONJ", -1},
    {Opcode::DISJ, "DISJ", -1},
    {Opcode::CMME, "CMME", -1},
    {Opcode::CMMA, "CMMA", -1},
    {Opcode::CMIG, "CMIG", -1},
    {Opcode::CMDG, "CMDG", -1},
    {Opcode::CMEG, "CMEG", -1},
    {Opcode::CMAG, "CMAG", -1},
    {Opcode::DSVS, "DSVS", 1},
    {Opcode::DSVF, "DSVF", 1},
    {Opcode::IMPR, "IMPR", -1},
}};

} // namespace

OpcodeTable::OpcodeTable() {
    for (const auto &entry : kOpcodes) {
        if (entry.opcode == Opcode::None || entry.opcode == Opcode::Unknown) {
            continue;
        }
        by_mnemonic_[entry.mnemonic] = entry.opcode;
    }
}

Opcode OpcodeTable::lookup(const std::string &mnemonic) const {
    if (mnemonic.empty()) {
        return Opcode::None;
    }

    std::string upper = mnemonic;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    auto it = by_mnemonic_.find(upper);
    return it != by_mnemonic_.end() ? it->second : Opcode::Unknown;
}

const OpcodeInfo &OpcodeTable::info(Opcode opcode) {
    // kOpcodes is laid out in enum order
    return kOpcodes[static_cast<size_t>(opcode)];
}

const OpcodeTable &OpcodeTable::instance() {
    static const OpcodeTable table;
    return table;
}

} // namespace mepa
