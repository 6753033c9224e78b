#pragma once
#include <string>
#include <cctype>
#include <cstdlib>
#include "Logger.hpp"

// Minimal helpers for the flat JSON objects this project reads and writes
// (sidecar metadata, /state snapshots). Not a general parser.
namespace JSON {

// position just after "key": (skipping blanks), npos if missing
inline std::size_t find_value_start(const std::string& body, const char* key) {
    const std::string quoted = std::string("\"") + key + "\"";
    auto p = body.find(quoted);
    while (p != std::string::npos) {
        // a key is followed by ':'; the same text as an array element is not
        auto q = p + quoted.size();
        while (q < body.size() && std::isspace(static_cast<unsigned char>(body[q]))) ++q;
        if (q < body.size() && body[q] == ':') {
            ++q;
            while (q < body.size() && std::isspace(static_cast<unsigned char>(body[q]))) ++q;
            return q;
        }
        p = body.find(quoted, p + 1);
    }
    return std::string::npos;
}

inline bool extract_json_string(const std::string& body, const char* key, std::string& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '"') return false;
    auto q = body.find('"', p + 1);
    if (q == std::string::npos) return false;
    out = body.substr(p + 1, q - (p + 1));
    return true;
}

inline bool extract_json_int(const std::string& body, const char* key, int& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos) return false;

    bool neg = false;
    if (p < body.size() && body[p] == '-') { neg = true; ++p; }
    int val = 0;
    bool any = false;
    while (p < body.size() && std::isdigit(static_cast<unsigned char>(body[p]))) {
        val = val * 10 + (body[p] - '0');
        any = true;
        ++p;
    }
    if (!any) return false;
    out = neg ? -val : val;
    return true;
}

inline bool extract_json_double(const std::string& body, const char* key, double& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos || p >= body.size()) return false;
    const char* begin = body.c_str() + p;
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end == begin) return false;
    out = v;
    return true;
}

inline bool extract_json_bool(const std::string& body, const char* key, bool& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos) return false;
    if (body.compare(p, 4, "true") == 0)  { out = true;  return true; }
    if (body.compare(p, 5, "false") == 0) { out = false; return true; }
    return false;
}

// escape for embedding in a "..." literal
inline std::string escape_json_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

inline void json_extract_fail(const char* context, const char* field) {
    LOG_WARN("[JSON] extract failed | context=" << context << " field=" << field);
}

} // namespace JSON
