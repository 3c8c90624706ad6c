#pragma once
// Small JSON reader/writer for config.json and the history file.
// Accepts objects/arrays with string, integer, bool and null values.
// Fractional numbers are read and truncated toward zero.

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace mini {

struct Value;
using Object = std::unordered_map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str;
    int64_t number{0};
    bool boolean{false};
    Object object;
    Array array;
};

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\\' && i < s.size()) {
            char esc = s[i++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    if (i + 4 > s.size()) return false;
                    std::string hex = s.substr(i, 4);
                    char* end = nullptr;
                    unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
                    if (end != hex.c_str() + 4) return false;
                    append_utf8(out, cp);
                    i += 4;
                    break;
                }
                default: out.push_back(esc); break;
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out);

inline bool parse_value(const std::string& s, size_t& i, Value& out) {
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        size_t start = i;
        while (i < s.size()) {
            char c = s[i];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E') {
                i++;
            } else break;
        }
        out.type = Value::Type::Number;
        out.number = std::strtoll(s.substr(start, i - start).c_str(), nullptr, 10);
        return true;
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool;
        out.boolean = true;
        i += 4;
        return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool;
        out.boolean = false;
        i += 5;
        return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null;
        i += 4;
        return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

inline bool parse(const std::string& s, Object& out) {
    size_t i = 0;
    return parse_object(s, i, out);
}

inline bool parse(const std::string& s, Array& out) {
    size_t i = 0;
    return parse_array(s, i, out);
}

// Parse either a top-level object or array.
inline bool parse(const std::string& s, Value& out) {
    size_t i = 0;
    return parse_value(s, i, out);
}

// Escape for embedding inside a JSON string literal (quotes not included).
inline std::string escape(const std::string& in) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

inline std::string get_string(const Object& o, const char* key, const std::string& fallback = {}) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::String) return fallback;
    return it->second.str;
}

inline int64_t get_int(const Object& o, const char* key, int64_t fallback = 0) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::Number) return fallback;
    return it->second.number;
}

inline bool get_bool(const Object& o, const char* key, bool fallback = false) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::Bool) return fallback;
    return it->second.boolean;
}

} // namespace mini
