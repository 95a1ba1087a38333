#include "text_util.h"

#include "utf8_utils.h"

#include <algorithm>
#include <cctype>

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}  // namespace

std::string trim_copy(const std::string& s) {
  size_t l = 0;
  size_t r = s.size();
  while (l < r && is_space(s[l])) ++l;
  while (r > l && is_space(s[r - 1])) --r;
  return s.substr(l, r - l);
}

std::string collapse_whitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool prev_space = true;
  for (char c : s) {
    if (is_space(c)) {
      if (!prev_space) out.push_back(' ');
      prev_space = true;
    } else {
      out.push_back(c);
      prev_space = false;
    }
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::string to_lower_ascii(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> words;
  std::string cur;
  for (char c : s) {
    if (is_space(c)) {
      if (!cur.empty()) words.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) words.push_back(cur);
  return words;
}

size_t word_count(const std::string& s) { return split_words(s).size(); }

std::vector<std::string> split_sentences(const std::string& s) {
  const std::string text = collapse_whitespace(s);
  std::vector<std::string> sentences;
  size_t begin = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c != '.' && c != '!' && c != '?') continue;
    // Swallow runs like "?!" or "..."
    size_t end = i + 1;
    while (end < text.size() && (text[end] == '.' || text[end] == '!' || text[end] == '?')) ++end;
    if (end < text.size() && text[end] != ' ') {
      i = end - 1;
      continue;
    }
    const std::string sentence = trim_copy(text.substr(begin, end - begin));
    if (!sentence.empty()) sentences.push_back(sentence);
    begin = end;
    i = end - 1;
  }
  const std::string tail = trim_copy(text.substr(std::min(begin, text.size())));
  if (!tail.empty()) sentences.push_back(tail);
  return sentences;
}

std::string truncate_at_word(const std::string& s, size_t max_chars) {
  if (utf8::codepoint_count(s) <= max_chars) return s;
  std::string cut = s.substr(0, utf8::prefix_bytes(s, max_chars));
  const size_t last_space = cut.find_last_of(' ');
  if (last_space != std::string::npos && last_space > cut.size() / 2) cut.erase(last_space);
  return trim_copy(cut);
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
