#include "time_parse.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace {

const std::regex& decimal_re() {
  static const std::regex re(R"(^[+-]?(\d+(\.\d*)?|\.\d+)$)");
  return re;
}

// Timecode components carry no sign.
const std::regex& component_re() {
  static const std::regex re(R"(^(\d+(\.\d*)?|\.\d+)$)");
  return re;
}

std::string trim_lower(const std::string& s) {
  size_t l = 0;
  size_t r = s.size();
  while (l < r && std::isspace(static_cast<unsigned char>(s[l]))) ++l;
  while (r > l && std::isspace(static_cast<unsigned char>(s[r - 1]))) --r;
  std::string out = s.substr(l, r - l);
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_unit_suffix(std::string s) {
  static const char* const kSuffixes[] = {"secs", "sec", "s"};
  for (const char* suffix : kSuffixes) {
    if (ends_with(s, suffix)) {
      s.erase(s.size() - std::char_traits<char>::length(suffix));
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
      break;
    }
  }
  return s;
}

std::optional<double> parse_decimal(const std::string& s, const std::regex& re) {
  if (!std::regex_match(s, re)) return std::nullopt;
  try {
    return std::stod(s);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    const size_t next = s.find(sep, pos);
    parts.push_back(trim_lower(s.substr(pos, next == std::string::npos ? std::string::npos : next - pos)));
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return parts;
}

}  // namespace

std::optional<double> parse_time_string(const std::string& raw) {
  const std::string s = strip_unit_suffix(trim_lower(raw));
  if (s.empty()) return std::nullopt;

  if (auto plain = parse_decimal(s, decimal_re())) return plain;

  std::vector<std::string> parts;
  if (s.find(':') != std::string::npos) {
    parts = split_on(s, ':');
  } else if (std::count(s.begin(), s.end(), '.') >= 2) {
    parts = split_on(s, '.');
  } else {
    return std::nullopt;
  }

  std::vector<double> v;
  v.reserve(parts.size());
  for (const auto& p : parts) {
    auto value = parse_decimal(p, component_re());
    if (!value) return std::nullopt;
    v.push_back(*value);
  }

  switch (v.size()) {
    case 2:
      return v[0] * 60.0 + v[1];
    case 3:
      return v[0] * 3600.0 + v[1] * 60.0 + v[2];
    case 4:
      return v[0] * 3600.0 + v[1] * 60.0 + v[2] + v[3] / 100.0;
    default:
      return std::nullopt;
  }
}

std::optional<double> parse_time_value(const nlohmann::json& value) {
  if (value.is_number()) return value.get<double>();
  if (value.is_string()) return parse_time_string(value.get<std::string>());
  return std::nullopt;
}
