#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace retext::utf8 {

// Windows-1252 (WinAnsi) byte to UTF-8
void appendWinAnsi(std::string& out, uint8_t ch);
void appendCodepoint(std::string& out, uint32_t codepoint);

// Lenient decode; invalid lead bytes are skipped
std::vector<uint32_t> codepoints(std::string_view text);
size_t length(std::string_view text);
bool isValid(std::string_view text);

// Byte prefix holding the first `count` codepoints
std::string_view prefix(std::string_view text, size_t count);

} // namespace retext::utf8
