/**
 * @file TextUtils.hpp
 * @brief Small text helpers shared by the rule engine.
 */

#pragma once

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace tasksmind::domain::engine {

inline std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

inline std::string ToUpper(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

/** @brief Joins the parts with single spaces and lowercases the result. */
inline std::string JoinNormalized(const std::vector<std::string>& parts) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += parts[i];
    }
    return Normalize(joined);
}

/** @brief Number of UTF-8 code points (continuation bytes are not counted). */
inline size_t Utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

/** @brief The first @p maxChars code points of a UTF-8 string. */
inline std::string Utf8Prefix(const std::string& text, size_t maxChars) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (count == maxChars) return text.substr(0, i);
            ++count;
        }
    }
    return text;
}

/**
 * @brief Rounds to two decimals from the exact binary value, ties to even.
 *
 * 0.595 is stored slightly below and rounds to 0.59.
 */
inline double Round2(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return std::strtod(buf, nullptr);
}

} // namespace tasksmind::domain::engine
