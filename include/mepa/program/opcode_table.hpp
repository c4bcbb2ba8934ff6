/**
 * @file opcode_table.hpp
 * @brief MEPA opcode table
 *
 * Maps instruction mnemonics to opcodes. Mnemonic lookup is
 * case-insensitive; callers pass the text as it appears in the source.
 */

#pragma once

#include <string>
#include <unordered_map>

namespace mepa {

/**
 * @brief MEPA operation codes
 *
 * None marks an empty or label-only line. Unknown marks a mnemonic that is
 * not part of the instruction set; it is only reported when executed.
 */
enum class Opcode {
    None,
    Unknown,

    // Program control
    INPP, ///< Program start marker
    PARA, ///< Halt
    NADA, ///< No operation

    // Memory management
    AMEM, ///< Allocate n cells
    DMEM, ///< Deallocate n cells

    // Loads and stores
    CRCT, ///< Push constant
    CRVL, ///< Push memory[n]
    ARMZ, ///< Pop into memory[n]

    // Arithmetic
    SOMA,
    SUBT,
    MULT,
    DIVI,
    INVR,

    // Logic
    CONJ,
    DISJ,

    // Comparison
    CMME, ///< a < b
    CMMA, ///< a > b
    CMIG, ///< a == b
    CMDG, ///< a != b
    CMEG, ///< a <= b
    CMAG, ///< a >= b

    // Branching
    DSVS, ///< Unconditional jump
    DSVF, ///< Jump if false

    // Output
    IMPR, ///< Print top of stack (peek)
};

/**
 * @brief Static properties of an opcode
 */
struct OpcodeInfo {
    Opcode opcode{Opcode::Unknown};
    const char *mnemonic{""};
    int arg_count{0}; ///< Required argument count, -1 if unchecked
};

/**
 * @brief Mnemonic lookup table for the MEPA instruction set
 */
class OpcodeTable {
  public:
    OpcodeTable();

    /**
     * @brief Look up an opcode by mnemonic
     * @param mnemonic Mnemonic text (any case)
     * @return Opcode Matching opcode, Opcode::Unknown if not found,
     *         Opcode::None for empty text
     */
    Opcode lookup(const std::string &mnemonic) const;

    /**
     * @brief Get static info for an opcode
     * @param opcode Opcode to describe
     * @return const OpcodeInfo& Opcode info
     */
    static const OpcodeInfo &info(Opcode opcode);

    /**
     * @brief Get the canonical mnemonic for an opcode
     * @param opcode Opcode
     * @return const char* Uppercase mnemonic
     */
    static const char *mnemonic(Opcode opcode) {
        return info(opcode).mnemonic;
    }

    /**
     * @brief Shared instance
     */
    static const OpcodeTable &instance();

  private:
    std::unordered_map<std::string, Opcode> by_mnemonic_;
};

} // namespace mepa
