#include "cr/json.hpp"

#include <cstdio>

namespace cr {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
static std::size_t utf8_seq_len(std::string_view s, std::size_t i)
{
    const auto b0 = static_cast<unsigned char>(s[i]);
    std::size_t n = 0;
    if (b0 >= 0xC2 && b0 <= 0xDF) n = 2;
    else if (b0 >= 0xE0 && b0 <= 0xEF) n = 3;
    else if (b0 >= 0xF0 && b0 <= 0xF4) n = 4;
    else return 0;
    if (i + n > s.size()) return 0;

    // second byte range excludes overlongs, surrogates and > U+10FFFF
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    unsigned char lo = 0x80, hi = 0xBF;
    switch (b0)
    {
        case 0xE0: lo = 0xA0; break;
        case 0xED: hi = 0x9F; break;
        case 0xF0: lo = 0x90; break;
        case 0xF4: hi = 0x8F; break;
        default: break;
    }
    if (b1 < lo || b1 > hi) return 0;
    for (std::size_t k = 2; k < n; ++k)
    {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 0;
    }
    return n;
}

// Device error bodies are arbitrary bytes; anything that is not valid UTF-8
// is emitted as \u00XX so the output line stays valid JSON.
std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    char buf[7];
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        const auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; continue;
            case '\\': out += "\\\\"; continue;
            case '\b': out += "\\b"; continue;
            case '\f': out += "\\f"; continue;
            case '\n': out += "\\n"; continue;
            case '\r': out += "\\r"; continue;
            case '\t': out += "\\t"; continue;
            default: break;
        }
        if (uc < 0x20 || uc == 0x7F) {
            std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
            out += buf;
        } else if (uc < 0x80) {
            out += c;
        } else if (std::size_t n = utf8_seq_len(s, i); n > 0) {
            out.append(s.substr(i, n));
            i += n - 1;
        } else {
            std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
            out += buf;
        }
    }
    return out;
}

} // namespace cr
