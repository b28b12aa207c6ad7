#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>


namespace lcr {
namespace json {

// Appends `s` to `out` as the body of a JSON string literal (no quotes).
// Escapes quote, backslash and every control character below 0x20.
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += HEX[(static_cast<unsigned char>(c) >> 4) & 0x0F];
                    out += HEX[static_cast<unsigned char>(c) & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

// Raw-buffer variant. Writes at most 6 * s.size() bytes, returns bytes written.
inline std::size_t append_escaped(char* out, std::string_view s) noexcept {
    static constexpr char HEX[] = "0123456789abcdef";
    std::size_t pos = 0;
    for (char c : s) {
        switch (c) {
            case '\"': out[pos++] = '\\'; out[pos++] = '\"'; break;
            case '\\': out[pos++] = '\\'; out[pos++] = '\\'; break;
            case '\b': out[pos++] = '\\'; out[pos++] = 'b';  break;
            case '\f': out[pos++] = '\\'; out[pos++] = 'f';  break;
            case '\n': out[pos++] = '\\'; out[pos++] = 'n';  break;
            case '\r': out[pos++] = '\\'; out[pos++] = 'r';  break;
            case '\t': out[pos++] = '\\'; out[pos++] = 't';  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out[pos++] = '\\';
                    out[pos++] = 'u';
                    out[pos++] = '0';
                    out[pos++] = '0';
                    out[pos++] = HEX[(static_cast<unsigned char>(c) >> 4) & 0x0F];
                    out[pos++] = HEX[static_cast<unsigned char>(c) & 0x0F];
                }
                else {
                    out[pos++] = c;
                }
        }
    }
    return pos;
}

inline std::string escape(std::string_view s) {
    std::string out;
    append_escaped(out, s);
    return out;
}

// Appends `"key":"value"` (value escaped).
inline void append_string_field(std::string& out, std::string_view key, std::string_view value) {
    out += '"';
    out += key;
    out += "\":\"";
    append_escaped(out, value);
    out += '"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Raw-buffer variant. Returns the number of bytes written (at most 20).
inline std::size_t append(char* out, std::uint64_t value) noexcept {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    const std::size_t n = static_cast<std::size_t>(buf + sizeof(buf) - p);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = p[i];
    }
    return n;
}

} // namespace json
} // namespace lcr
