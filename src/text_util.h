#pragma once

#include <string>
#include <vector>

// Whitespace is ASCII whitespace; multi-byte UTF-8 sequences pass through untouched.
std::string trim_copy(const std::string& s);

// Newlines and runs of whitespace become single spaces; result is trimmed.
std::string collapse_whitespace(const std::string& s);

std::string to_lower_ascii(std::string s);

std::vector<std::string> split_words(const std::string& s);

size_t word_count(const std::string& s);

// Split prose on '.', '!' or '?' followed by whitespace or end of text.
// Terminators stay attached to their sentence.
std::vector<std::string> split_sentences(const std::string& s);

// Cut to at most max_chars codepoints, preferring the last word boundary.
std::string truncate_at_word(const std::string& s, size_t max_chars);

bool starts_with(const std::string& s, const std::string& prefix);
