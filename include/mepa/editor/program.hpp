/**
 * @file program.hpp
 * @brief Program image: the line-numbered MEPA program buffer
 *
 * Holds the program being edited as a sparse, ordered map from line number
 * to raw instruction text. Line numbers are unique and non-negative;
 * execution order is ascending line order, not line-number arithmetic.
 * Provides the line-oriented editing operations used by the INS, DEL and
 * LIST commands, and the "<line> <text>" file format used by LOAD and SAVE.
 */

#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mepa {

/**
 * @brief Line range specification for editor commands
 *
 * Bounds are line numbers (not positions) and inclusive.
 * Nullopt values indicate open-ended ranges.
 */
struct LineRange {
    std::optional<int> start; ///< First line (nullopt = from beginning)
    std::optional<int> end;   ///< Last line (nullopt = to end)

    /**
     * @brief Parse a range string: "10", "10 20", "10,20", ",20", "10," or ""
     * @param range_str Range string to parse
     * @return LineRange Parsed range
     * @throws std::invalid_argument on malformed numbers or start > end
     */
    static LineRange parse(const std::string &range_str);

    /**
     * @brief Check if range covers all lines
     */
    bool is_all() const {
        return !start.has_value() && !end.has_value();
    }

    /**
     * @brief Check if a line number falls inside the range
     */
    bool contains(int line) const {
        return (!start || line >= *start) && (!end || line <= *end);
    }
};

/**
 * @brief A numbered program line
 */
using ProgramLine = std::pair<int, std::string>;

/**
 * @brief Sparse line-numbered program buffer
 */
class Program {
  public:
    // Line editing

    /**
     * @brief Insert or replace a line
     * @param line_num Line number (must be non-negative)
     * @param text Instruction text (stored trimmed)
     * @return bool True if an existing line was replaced
     * @throws std::out_of_range if line_num is negative
     */
    bool set_line(int line_num, const std::string &text);

    /**
     * @brief Delete a single line
     * @param line_num Line number
     * @return bool True if the line existed
     */
    bool delete_line(int line_num);

    /**
     * @brief Delete every line inside a range
     * @param range Line range
     * @return std::vector<ProgramLine> Removed lines, ascending
     */
    std::vector<ProgramLine> delete_range(const LineRange &range);

    // Access

    /**
     * @brief Get text of a line
     * @param line_num Line number
     * @return std::optional<std::string> Text if the line exists
     */
    std::optional<std::string> line(int line_num) const;

    /**
     * @brief All lines in ascending order
     */
    std::vector<ProgramLine> sorted_lines() const;

    /**
     * @brief Lines inside a range, ascending
     */
    std::vector<ProgramLine> lines_in(const LineRange &range) const;

    const std::map<int, std::string> &lines() const {
        return lines_;
    }

    bool empty() const {
        return lines_.empty();
    }

    int line_count() const {
        return static_cast<int>(lines_.size());
    }

    // Persistence

    /**
     * @brief Replace contents with text in "<line> <instruction>" format
     *
     * Blank lines and lines without a leading non-negative line number
     * are skipped. Clears the modified flag.
     *
     * @param text Program text
     * @return int Number of lines skipped
     */
    int open_buffer(const std::string &text);

    /**
     * @brief Load a program file
     * @param path File path
     * @return int Number of lines skipped
     * @throws std::runtime_error if the file cannot be opened
     */
    int load_file(const std::string &path);

    /**
     * @brief Save the program
     * @param path File path, or nullopt for the last loaded/saved file
     * @throws std::runtime_error if no file name is known or the file
     *         cannot be created
     */
    void save_file(const std::optional<std::string> &path = std::nullopt);

    /**
     * @brief Render the program in file format
     * @return std::string One "<line> <text>" entry per line
     */
    std::string joined_buffer() const;

    const std::optional<std::string> &filename() const {
        return filename_;
    }

    bool is_modified() const {
        return modified_;
    }

  private:
    std::map<int, std::string> lines_;     ///< Line number to instruction text
    std::optional<std::string> filename_; ///< Last loaded or saved file
    bool modified_{false};                 ///< Unsaved changes present

    int parse_buffer(std::istream &in);
};

} // namespace mepa
