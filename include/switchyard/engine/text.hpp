#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace switchyard {
namespace engine {
namespace text {

inline std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/**
 * @brief Whole-word match of a lower-case pattern in lower-case text
 *
 * A trailing '*' turns the pattern into a stem: "optimi*" matches
 * "optimize" and "optimization". Multi-word patterns match as phrases.
 */
inline bool matches_word(std::string_view haystack, std::string_view pattern) {
    bool stem = false;
    if (!pattern.empty() && pattern.back() == '*') {
        stem = true;
        pattern.remove_suffix(1);
    }
    if (pattern.empty()) {
        return false;
    }

    std::size_t pos = haystack.find(pattern);
    while (pos != std::string_view::npos) {
        const bool starts_clean = pos == 0 || !is_word_char(haystack[pos - 1]);
        const std::size_t end = pos + pattern.size();
        const bool ends_clean = stem || end == haystack.size() || !is_word_char(haystack[end]);
        if (starts_clean && ends_clean) {
            return true;
        }
        pos = haystack.find(pattern, pos + 1);
    }
    return false;
}

inline std::size_t word_count(std::string_view input) {
    std::size_t count = 0;
    bool in_word = false;
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

/// Split on commas, trimming whitespace and dropping empty items.
inline std::vector<std::string> split_list(std::string_view input) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= input.size()) {
        std::size_t comma = input.find(',', start);
        if (comma == std::string_view::npos) {
            comma = input.size();
        }
        std::string_view item = input.substr(start, comma - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.remove_suffix(1);
        if (!item.empty()) {
            items.emplace_back(item);
        }
        start = comma + 1;
    }
    return items;
}

/// First @p max_code_points UTF-8 code points of @p input. Never splits a sequence.
inline std::string utf8_prefix(std::string_view input, std::size_t max_code_points) {
    std::size_t end = 0;
    std::size_t count = 0;
    while (end < input.size()) {
        if ((static_cast<unsigned char>(input[end]) & 0xC0) != 0x80) {
            if (count == max_code_points) {
                break;
            }
            ++count;
        }
        ++end;
    }
    return std::string(input.substr(0, end));
}

} // namespace text
} // namespace engine
} // namespace switchyard
