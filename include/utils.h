#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace optidex {

/**
 * @brief String and path utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    result.erase(0, result.find_first_not_of(" \t\n\r"));
    result.erase(result.find_last_not_of(" \t\n\r") + 1);
    return result;
}

/**
 * @brief Lowercase copy of a string
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Expand a leading "~" to $HOME; other paths are returned unchanged
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

/**
 * @brief Split text into sentences on . ! ? and newlines
 *
 * Terminal punctuation stays with its sentence. A trailing fragment without
 * punctuation becomes the last sentence. Blank pieces are dropped.
 */
inline std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n') {
            std::string s = trim_copy(current);
            if (!s.empty()) sentences.push_back(s);
            current.clear();
            continue;
        }
        current += c;
        bool terminal = (c == '.' || c == '!' || c == '?');
        bool boundary = (i + 1 == text.size()) || std::isspace(static_cast<unsigned char>(text[i + 1]));
        if (terminal && boundary) {
            std::string s = trim_copy(current);
            if (!s.empty()) sentences.push_back(s);
            current.clear();
        }
    }
    std::string tail = trim_copy(current);
    if (!tail.empty()) sentences.push_back(tail);
    return sentences;
}

/**
 * @brief Standard base64 (RFC 4648) with '=' padding
 */
inline std::string base64_encode(const std::string& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        unsigned n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8) |
                     static_cast<unsigned char>(data[i + 2]);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += table[n & 0x3F];
    }
    size_t rest = data.size() - i;
    if (rest > 0) {
        unsigned n = static_cast<unsigned char>(data[i]) << 16;
        if (rest == 2) n |= static_cast<unsigned char>(data[i + 1]) << 8;
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += rest == 2 ? table[(n >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

/// Visitor built from lambdas, for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace utils

} // namespace optidex
