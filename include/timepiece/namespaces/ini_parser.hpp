#ifndef TIMEPIECE_INI_PARSER_HPP
#define TIMEPIECE_INI_PARSER_HPP

/**
 * @file ini_parser.hpp
 * @brief INI value parsing helpers used by Config::load_from_file().
 *
 * Features:
 * - Whitespace trimming and inline comment stripping
 * - Boolean and integer parsing with a caller-supplied fallback
 * - Quote handling for string values
 */

#include <cctype>
#include <stdexcept>
#include <string>

namespace timepiece {

namespace ini_parser {

/**
 * @brief Trim whitespace from both ends of a string.
 */
inline std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace((unsigned char)str[start])) ++start;
    while (end > start && std::isspace((unsigned char)str[end - 1])) --end;

    return str.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (char& c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

/**
 * @brief Cut a trailing `# ...` or `; ...` comment off a value.
 *
 * Comment characters inside a double-quoted value are kept.
 */
inline std::string strip_inline_comment(const std::string& value) {
    bool quoted = false;
    for (size_t i = 0; i < value.length(); ++i) {
        char c = value[i];
        if (c == '"') quoted = !quoted;
        else if (!quoted && (c == '#' || c == ';')) return trim(value.substr(0, i));
    }
    return trim(value);
}

/**
 * @brief Parse a boolean value.
 *
 * Accepts true/false, 1/0, on/off, yes/no (case-insensitive). Anything else
 * leaves @p ok false and returns @p fallback.
 */
inline bool parse_bool(const std::string& value, bool fallback, bool& ok) {
    std::string v = to_lower(trim(value));
    ok = true;
    if (v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "off" || v == "no") return false;
    ok = false;
    return fallback;
}

/**
 * @brief Parse an integer value, returning @p fallback on malformed input.
 */
inline int parse_int(const std::string& value, int fallback, bool& ok) {
    std::string v = trim(value);
    ok = false;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.length()) return fallback;
        ok = true;
        return n;
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

/**
 * @brief Remove surrounding double quotes if present.
 */
inline std::string unquote(const std::string& str) {
    std::string s = trim(str);
    if (s.length() >= 2 && s[0] == '"' && s[s.length()-1] == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

} // namespace ini_parser

} // namespace timepiece

#endif // TIMEPIECE_INI_PARSER_HPP
