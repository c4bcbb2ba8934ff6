/**
 * @file tokenizer.hpp
 * @brief Instruction line tokenizer for MEPA programs
 *
 * Parses instruction text of the form "[label:] OPCODE [arg ...]" into a
 * structured Instruction. Parsing never fails; malformed text simply yields
 * an instruction the machine will reject when it executes it.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mepa/program/opcode_table.hpp"

namespace mepa {

/**
 * @brief Parsed instruction
 *
 * Immutable once produced; a changed line is reparsed from its text.
 */
struct Instruction {
    std::optional<std::string> label; ///< Label declared on this line
    Opcode opcode{Opcode::None};      ///< Decoded opcode
    std::string mnemonic;             ///< Uppercased mnemonic as written
    std::vector<std::string> args;    ///< Raw argument tokens, in order
    std::string raw_text;             ///< Original instruction text

    /**
     * @brief Check if line declares a label
     * @return bool True if label is present
     */
    bool has_label() const {
        return label.has_value();
    }

    /**
     * @brief Check if line is empty or label-only
     * @return bool True if there is no opcode
     */
    bool is_empty() const {
        return opcode == Opcode::None;
    }

    /**
     * @brief Render canonical text: "LABEL: MNEMONIC arg ..."
     * @return std::string Formatted instruction
     */
    std::string to_string() const;
};

/**
 * @brief Tokenizer for MEPA instruction text
 */
class Tokenizer {
  public:
    /**
     * @brief Parse one instruction line
     * @param text Instruction text (without the line number)
     * @return Instruction Parsed instruction
     */
    static Instruction parse_line(const std::string &text);

    /**
     * @brief Split text into words using shell-style quoting
     *
     * Single and double quotes group words. Outside quotes a backslash
     * escapes the next character; inside double quotes it escapes only
     * '"', '\\', '$' and '`'. Unbalanced quotes fall back to a plain
     * whitespace split.
     *
     * @param text Text to split
     * @return std::vector<std::string> Words
     */
    static std::vector<std::string> split_words(const std::string &text);

    /**
     * @brief Check if text is a valid label name
     * @param text Candidate label
     * @return bool True if non-empty and only alphanumerics or '_'
     */
    static bool is_label(const std::string &text);

    /**
     * @brief Trim spaces, tabs and line endings from both ends
     */
    static std::string trim(const std::string &str);

  private:
    static bool is_whitespace(char c);
    static bool is_quoted_escape(char c);
    static std::vector<std::string> split_plain(const std::string &text);
};

} // namespace mepa
