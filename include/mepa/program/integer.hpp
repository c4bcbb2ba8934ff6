/**
 * @file integer.hpp
 * @brief Decimal integer parsing for instruction arguments and line numbers
 */

#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace mepa {

/**
 * @brief Parse a whole token as a signed decimal integer
 *
 * Accepts an optional leading '+' or '-'. The entire token must be
 * consumed and the value must fit in T.
 *
 * @param text Token to parse
 * @return std::optional<T> Parsed value, nullopt if malformed or out of range
 */
template <typename T> std::optional<T> parse_integer(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        // "+-5" is not a number
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    T value{};
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace mepa
