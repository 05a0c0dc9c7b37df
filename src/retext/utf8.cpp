#include "utf8.h"

namespace retext::utf8 {

void appendCodepoint(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

void appendWinAnsi(std::string& out, uint8_t ch) {
    // Windows-1252 (WinAnsi) 0x80-0x9F mapping to Unicode
    static const uint16_t winAnsiHigh[32] = {
        0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
        0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
        0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
        0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
    };

    uint32_t codepoint = ch;
    if (ch >= 0x80 && ch <= 0x9F) {
        codepoint = winAnsiHigh[ch - 0x80];
    }
    appendCodepoint(out, codepoint);
}

namespace {

// Returns bytes consumed, 0 for an invalid sequence
size_t decodeOne(std::string_view text, size_t pos, uint32_t& cp) {
    auto byte = [&](size_t i) { return static_cast<uint8_t>(text[i]); };
    uint8_t lead = byte(pos);
    size_t len = 0;
    if (lead < 0x80) { cp = lead; return 1; }
    if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; len = 2; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; len = 3; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; len = 4; }
    else return 0;

    if (pos + len > text.size()) return 0;
    for (size_t i = 1; i < len; i++) {
        uint8_t cont = byte(pos + i);
        if ((cont & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }
    return len;
}

} // namespace

std::vector<uint32_t> codepoints(std::string_view text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t n = decodeOne(text, pos, cp);
        if (n == 0) {
            pos++;
            continue;
        }
        out.push_back(cp);
        pos += n;
    }
    return out;
}

size_t length(std::string_view text) {
    return codepoints(text).size();
}

bool isValid(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t n = decodeOne(text, pos, cp);
        if (n == 0) return false;
        // surrogates and out of range values are not encodable
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        pos += n;
    }
    return true;
}

std::string_view prefix(std::string_view text, size_t count) {
    size_t pos = 0;
    while (pos < text.size() && count > 0) {
        uint32_t cp = 0;
        size_t n = decodeOne(text, pos, cp);
        pos += (n == 0) ? 1 : n;
        count--;
    }
    return text.substr(0, pos);
}

} // namespace retext::utf8
