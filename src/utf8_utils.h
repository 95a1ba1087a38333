#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace utf8 {

// Byte length of a UTF-8 character from its first byte.
inline size_t char_len(unsigned char first_byte) {
  if ((first_byte & 0x80) == 0) return 1;
  if ((first_byte & 0xE0) == 0xC0) return 2;
  if ((first_byte & 0xF0) == 0xE0) return 3;
  if ((first_byte & 0xF8) == 0xF0) return 4;
  return 1;  // Invalid, treat as 1
}

// Decode the first Unicode codepoint from a UTF-8 string.
inline uint32_t to_codepoint(std::string_view s) {
  if (s.empty()) return 0;
  unsigned char c0 = static_cast<unsigned char>(s[0]);

  if ((c0 & 0x80) == 0) return c0;
  if ((c0 & 0xE0) == 0xC0 && s.size() >= 2) {
    return ((c0 & 0x1F) << 6) | (static_cast<unsigned char>(s[1]) & 0x3F);
  }
  if ((c0 & 0xF0) == 0xE0 && s.size() >= 3) {
    return ((c0 & 0x0F) << 12) | ((static_cast<unsigned char>(s[1]) & 0x3F) << 6) |
           (static_cast<unsigned char>(s[2]) & 0x3F);
  }
  if ((c0 & 0xF8) == 0xF0 && s.size() >= 4) {
    return ((c0 & 0x07) << 18) | ((static_cast<unsigned char>(s[1]) & 0x3F) << 12) |
           ((static_cast<unsigned char>(s[2]) & 0x3F) << 6) | (static_cast<unsigned char>(s[3]) & 0x3F);
  }
  return 0;
}

// Decode a whole UTF-8 string; malformed bytes decode as 0.
inline std::vector<uint32_t> codepoints(std::string_view s) {
  std::vector<uint32_t> out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t n = char_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = 1;
    out.push_back(to_codepoint(s.substr(i, n)));
    i += n;
  }
  return out;
}

// Count the number of Unicode codepoints in a UTF-8 string.
inline size_t codepoint_count(std::string_view s) {
  size_t count = 0;
  for (size_t i = 0; i < s.size();) {
    size_t n = char_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = 1;
    i += n;
    ++count;
  }
  return count;
}

// Byte length of the longest prefix holding at most max_chars codepoints.
inline size_t prefix_bytes(std::string_view s, size_t max_chars) {
  size_t i = 0;
  for (size_t count = 0; i < s.size() && count < max_chars; ++count) {
    size_t n = char_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = 1;
    i += n;
  }
  return i;
}

inline bool is_arabic(uint32_t cp) {
  return (cp >= 0x0600 && cp <= 0x06FF) || (cp >= 0x0750 && cp <= 0x077F) ||
         (cp >= 0x08A0 && cp <= 0x08FF) || (cp >= 0xFB50 && cp <= 0xFDFF) ||
         (cp >= 0xFE70 && cp <= 0xFEFF);
}

inline bool is_devanagari(uint32_t cp) {
  return (cp >= 0x0900 && cp <= 0x097F) || (cp >= 0xA8E0 && cp <= 0xA8FF);
}

// Rough letter test: ASCII letters plus any non-ASCII codepoint outside the
// common punctuation, symbol and digit blocks.
inline bool is_letter(uint32_t cp) {
  if (cp < 0x80) return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  if (cp < 0xC0) return false;                       // Latin-1 punctuation/symbols
  if (cp == 0xD7 || cp == 0xF7) return false;        // multiplication/division
  if (cp >= 0x2000 && cp <= 0x2BFF) return false;    // punctuation, arrows, symbols
  if (cp >= 0x3000 && cp <= 0x303F) return false;    // CJK punctuation
  if (cp >= 0xFE30 && cp <= 0xFE4F) return false;
  if (cp >= 0xFF01 && cp <= 0xFF20) return false;    // fullwidth punctuation/digits
  if (cp >= 0x1F000) return false;                   // emoji and pictographs
  if (cp >= 0x0660 && cp <= 0x0669) return false;    // Arabic-Indic digits
  if (cp >= 0x0966 && cp <= 0x096F) return false;    // Devanagari digits
  return true;
}

}  // namespace utf8
