/**
 * @file program.cpp
 * @brief Program image implementation
 *
 * The buffer is a std::map keyed by line number, so iteration is always in
 * ascending line order regardless of insertion order. Line numbers need not
 * be contiguous: "INS 5" after "INS 30" places line 5 first.
 *
 * File format, one instruction per line:
 *
 *     10 INPP
 *     20 L1: CRCT 5
 *
 * Loading is lenient. Lines that do not begin with a line number are
 * skipped rather than rejected, and the count of skipped lines is returned
 * so the caller can mention it.
 */

#include "mepa/editor/program.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "mepa/program/integer.hpp"
#include "mepa/program/tokenizer.hpp"

namespace mepa {

// =========================================
// LineRange implementation
// =========================================

namespace {

int parse_line_number(const std::string &text) {
    auto value = parse_integer<int>(Tokenizer::trim(text));
    if (!value) {
        throw std::invalid_argument("Invalid line number: " + text);
    }
    return *value;
}

} // namespace

LineRange LineRange::parse(const std::string &range_str) {
    LineRange range;
    std::string text = Tokenizer::trim(range_str);

    if (text.empty()) {
        return range;
    }

    auto sep = text.find(',');
    if (sep == std::string::npos) {
        sep = text.find_first_of(" \t");
    }

    if (sep == std::string::npos) {
        // Single line number: "10"
        range.start = parse_line_number(text);
        range.end = range.start;
        return range;
    }

    // Range: "10,20", "10 20", "10," or ",20"
    std::string start_str = Tokenizer::trim(text.substr(0, sep));
    std::string end_str = Tokenizer::trim(text.substr(sep + 1));

    if (!start_str.empty()) {
        range.start = parse_line_number(start_str);
    }
    if (!end_str.empty()) {
        range.end = parse_line_number(end_str);
    }

    if (range.start && range.end && *range.start > *range.end) {
        throw std::invalid_argument("Invalid range (start line > end line)");
    }

    return range;
}

// =========================================
// Program implementation
// =========================================

bool Program::set_line(int line_num, const std::string &text) {
    if (line_num < 0) {
        throw std::out_of_range("Line number cannot be negative");
    }
    bool replaced = lines_.count(line_num) != 0;
    lines_[line_num] = Tokenizer::trim(text);
    modified_ = true;
    return replaced;
}

bool Program::delete_line(int line_num) {
    if (lines_.erase(line_num) == 0) {
        return false;
    }
    modified_ = true;
    return true;
}

std::vector<ProgramLine> Program::delete_range(const LineRange &range) {
    auto removed = lines_in(range);
    for (const auto &[line_num, text] : removed) {
        lines_.erase(line_num);
    }
    if (!removed.empty()) {
        modified_ = true;
    }
    return removed;
}

std::optional<std::string> Program::line(int line_num) const {
    auto it = lines_.find(line_num);
    if (it == lines_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProgramLine> Program::sorted_lines() const {
    return {lines_.begin(), lines_.end()};
}

std::vector<ProgramLine> Program::lines_in(const LineRange &range) const {
    auto first = range.start ? lines_.lower_bound(*range.start) : lines_.begin();
    auto last = range.end ? lines_.upper_bound(*range.end) : lines_.end();

    std::vector<ProgramLine> out;
    for (auto it = first; it != last && it != lines_.end(); ++it) {
        if (range.end && it->first > *range.end) {
            break;
        }
        out.emplace_back(it->first, it->second);
    }
    return out;
}

int Program::parse_buffer(std::istream &in) {
    lines_.clear();
    int skipped = 0;

    std::string raw;
    while (std::getline(in, raw)) {
        std::string text = Tokenizer::trim(raw);
        if (text.empty()) {
            continue;
        }

        auto split = text.find_first_of(" \t");
        std::string number = text.substr(0, split);
        auto line_num = parse_integer<int>(number);
        if (!line_num || *line_num < 0) {
            ++skipped;
            continue;
        }

        std::string rest = split == std::string::npos ? "" : Tokenizer::trim(text.substr(split));
        lines_[*line_num] = rest;
    }

    modified_ = false;
    return skipped;
}

int Program::open_buffer(const std::string &text) {
    std::istringstream ss(text);
    return parse_buffer(ss);
}

int Program::load_file(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    int skipped = parse_buffer(file);
    filename_ = path;
    return skipped;
}

void Program::save_file(const std::optional<std::string> &path) {
    const auto &target = path ? path : filename_;
    if (!target) {
        throw std::runtime_error("No file name specified");
    }

    std::ofstream file(*target);
    if (!file) {
        throw std::runtime_error("Cannot create file: " + *target);
    }

    file << joined_buffer();
    if (!file) {
        throw std::runtime_error("Write failed: " + *target);
    }

    filename_ = *target;
    modified_ = false;
}

std::string Program::joined_buffer() const {
    std::string out;
    for (const auto &[line_num, text] : lines_) {
        out += std::to_string(line_num);
        out += ' ';
        out += text;
        out += '\n';
    }
    return out;
}

} // namespace mepa
