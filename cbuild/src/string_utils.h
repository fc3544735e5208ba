#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cstdio>

/**
 * String utility functions for the export engine.
 * These are simple, reusable string operations.
 */
namespace profile_export {
namespace string_utils {

/**
 * Check if a string ends with a given suffix.
 * Example: ends_with("page-3.json.gz", ".gz") returns true
 */
inline bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.begin(), suffix.end(), str.end() - suffix.size());
}

/**
 * Join values with a separator: join(std::vector<int>{1, 4}, ", ") -> "1, 4"
 */
template <typename Container>
inline std::string join(const Container& values, const std::string& separator) {
    std::string result;
    bool first = true;
    for (const auto& value : values) {
        if (!first) {
            result += separator;
        }
        result += std::to_string(value);
        first = false;
    }
    return result;
}

/**
 * A table name becomes a directory name, so it must be a single
 * non-empty path component.
 */
inline bool is_valid_table_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

/**
 * Escape a string for JSON output.
 * Handles: quotes, backslashes, control characters, etc.
 */
inline std::string json_escape(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 8);  // Reserve extra space for escapes

    for (unsigned char uc : str) {
        char c = static_cast<char>(uc);
        switch (c) {
            case '\"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (uc < 0x20) {
                    // Control character - encode as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

} // namespace string_utils
} // namespace profile_export
