#include "mepa/program/tokenizer.hpp"

#include <cctype>

namespace mepa {

std::string Instruction::to_string() const {
    std::string out;
    if (label) {
        out += *label + ":";
    }
    if (!mnemonic.empty()) {
        if (!out.empty()) {
            out += ' ';
        }
        out += mnemonic;
    }
    for (const auto &arg : args) {
        out += ' ';
        out += arg;
    }
    return out;
}

Instruction Tokenizer::parse_line(const std::string &text) {
    Instruction result;
    result.raw_text = text;

    std::string body = trim(text);

    // Label: "L1: CRCT 5" or "L1:". Only the text before the first colon
    // counts, and only when it is a plain identifier.
    auto colon = body.find(':');
    if (colon != std::string::npos) {
        std::string before = trim(body.substr(0, colon));
        if (is_label(before)) {
            result.label = before;
            body = trim(body.substr(colon + 1));
        }
    }

    if (body.empty()) {
        return result;
    }

    auto words = split_words(body);
    if (words.empty()) {
        return result;
    }

    result.opcode = OpcodeTable::instance().lookup(words[0]);
    result.mnemonic = words[0];
    for (auto &c : result.mnemonic) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    result.args.assign(words.begin() + 1, words.end());

    // A quoted empty first word ("''") leaves no mnemonic to decode
    if (result.mnemonic.empty()) {
        result.opcode = Opcode::Unknown;
    }
    return result;
}

std::vector<std::string> Tokenizer::split_words(const std::string &text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < text.size() && is_quoted_escape(text[i + 1])) {
                current.push_back(text[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (is_whitespace(c)) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\') {
            if (i + 1 >= text.size()) {
                // Dangling escape
                return split_plain(text);
            }
            current.push_back(text[++i]);
        } else {
            current.push_back(c);
        }
    }

    if (quote != 0) {
        return split_plain(text);
    }
    if (in_word) {
        words.push_back(current);
    }
    return words;
}

std::vector<std::string> Tokenizer::split_plain(const std::string &text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (is_whitespace(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

bool Tokenizer::is_label(const std::string &text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string Tokenizer::trim(const std::string &str) {
    const char *whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

// Inside double quotes a backslash escapes only these, as in POSIX sh
bool Tokenizer::is_quoted_escape(char c) {
    return c == '"' || c == '\\' || c == '$' || c == '`';
}

bool Tokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace mepa
