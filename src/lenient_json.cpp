#include "lenient_json.h"

#include "text_util.h"
#include "time_parse.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const kReasoningTags[] = {"think", "thinking", "reasoning", "reflection"};
const char* const kTimeKeys[] = {"start_time", "end_time", "start", "end", "startTime", "endTime"};
const char* const kTotalKey = "total_shorts";

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

size_t skip_ws(const std::string& s, size_t i) {
  while (i < s.size() && is_ws(s[i])) ++i;
  return i;
}

// Index one past the closing quote of the string literal opening at pos.
size_t skip_string_literal(const std::string& s, size_t pos) {
  size_t i = pos + 1;
  while (i < s.size()) {
    if (s[i] == '\\') {
      i += 2;
      continue;
    }
    if (s[i] == '"') return i + 1;
    ++i;
  }
  return s.size();
}

size_t find_ci(const std::string& haystack, const std::string& needle, size_t from) {
  if (needle.empty() || haystack.size() < needle.size()) return std::string::npos;
  for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    size_t k = 0;
    while (k < needle.size() &&
           std::tolower(static_cast<unsigned char>(haystack[i + k])) ==
               std::tolower(static_cast<unsigned char>(needle[k]))) {
      ++k;
    }
    if (k == needle.size()) return i;
  }
  return std::string::npos;
}

bool is_time_key(const std::string& key) {
  for (const char* k : kTimeKeys) {
    if (key == k) return true;
  }
  return false;
}

bool is_json_number(const std::string& token) {
  static const std::regex re(R"(^-?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?$)");
  return std::regex_match(token, re);
}

std::string format_seconds(double v) {
  std::ostringstream ss;
  ss << std::setprecision(12) << v;
  return ss.str();
}

// Position of the opening quote of the first "key": whose name is in names,
// skipping anything inside string values.
size_t find_json_key(const std::string& text, const std::vector<std::string>& names, std::string* which) {
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '"') {
      ++i;
      continue;
    }
    const size_t end = skip_string_literal(text, i);
    const size_t colon = skip_ws(text, end);
    if (colon < text.size() && text[colon] == ':' && end >= i + 2) {
      const std::string key = text.substr(i + 1, end - i - 2);
      for (const auto& n : names) {
        if (key == n) {
          if (which) *which = n;
          return i;
        }
      }
    }
    i = end;
  }
  return std::string::npos;
}

// Opening '{' of the innermost object that contains pos.
size_t enclosing_object_start(const std::string& text, size_t pos) {
  std::vector<size_t> stack;
  size_t i = 0;
  while (i < pos && i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      i = skip_string_literal(text, i);
      continue;
    }
    if (c == '{') {
      stack.push_back(i);
    } else if (c == '}' && !stack.empty()) {
      stack.pop_back();
    }
    ++i;
  }
  return stack.empty() ? std::string::npos : stack.back();
}

// Substring from open_pos to its matching bracket, or to the last closer of
// the same kind when the reply was cut off or unbalanced.
std::string bracketed_slice(const std::string& text, size_t open_pos) {
  const char closer = text[open_pos] == '{' ? '}' : ']';
  size_t close = find_matching_bracket(text, open_pos);
  if (close == std::string::npos) {
    close = text.rfind(closer);
    if (close == std::string::npos || close <= open_pos) return text.substr(open_pos);
  }
  return text.substr(open_pos, close - open_pos + 1);
}

std::optional<int> read_declared_total(const json& obj) {
  if (!obj.is_object() || !obj.contains(kTotalKey)) return std::nullopt;
  const auto& v = obj[kTotalKey];
  if (!v.is_number()) return std::nullopt;
  const double d = v.get<double>();
  if (!std::isfinite(d) || d < 0.0 || d > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(d);
}

std::optional<ExtractedPayload> payload_from_object(const json& obj, const char* strategy) {
  if (!obj.is_object()) return std::nullopt;
  for (const auto& key : candidate_list_keys()) {
    if (!obj.contains(key)) continue;
    ExtractedPayload p;
    p.shorts = obj[key];
    p.declared_total = read_declared_total(obj);
    p.strategy = strategy;
    return p;
  }
  return std::nullopt;
}

bool looks_like_candidate(const json& obj) {
  if (!obj.is_object()) return false;
  for (const char* k : kTimeKeys) {
    if (obj.contains(k)) return true;
  }
  return false;
}

// Arrays truncated mid-object: keep every complete object and close the list.
std::optional<json> parse_truncated_array(const std::string& slice) {
  const size_t last_obj = slice.rfind('}');
  if (last_obj == std::string::npos) return std::nullopt;
  auto parsed = parse_json_lenient(slice.substr(0, last_obj + 1) + "]");
  if (parsed && parsed->is_array()) return parsed;
  return std::nullopt;
}

// --- salvage helpers ---------------------------------------------------------

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Locates `name` used as a field label: "name": / name: / name = ...
// Returns the index just past the separator, or npos.
size_t find_field_label(const std::string& chunk, const std::string& name, size_t from) {
  size_t pos = from;
  while ((pos = chunk.find(name, pos)) != std::string::npos) {
    const size_t after = pos + name.size();
    const bool left_ok = pos == 0 || !is_ident_char(chunk[pos - 1]);
    size_t j = after;
    if (j < chunk.size() && (chunk[j] == '"' || chunk[j] == '\'')) ++j;
    j = skip_ws(chunk, j);
    const bool right_ok = j < chunk.size() && (chunk[j] == ':' || chunk[j] == '=') &&
                          (after >= chunk.size() || !is_ident_char(chunk[after]));
    if (left_ok && right_ok) return j + 1;
    pos = after;
  }
  return std::string::npos;
}

std::optional<std::string> read_field_value(const std::string& chunk, size_t pos) {
  while (pos < chunk.size() && (chunk[pos] == ' ' || chunk[pos] == '\t')) ++pos;
  if (pos >= chunk.size()) return std::nullopt;

  const char q = chunk[pos];
  if (q == '"' || q == '\'') {
    std::string out;
    for (size_t i = pos + 1; i < chunk.size(); ++i) {
      const char c = chunk[i];
      if (c == '\\' && i + 1 < chunk.size()) {
        const char e = chunk[++i];
        out.push_back(e == 'n' ? ' ' : e);
        continue;
      }
      if (c == q || c == '\n') break;
      out.push_back(c);
    }
    return out;
  }

  size_t end = pos;
  while (end < chunk.size() && chunk[end] != ',' && chunk[end] != '}' && chunk[end] != ']' &&
         chunk[end] != '\n' && chunk[end] != '\r') {
    ++end;
  }
  const std::string bare = trim_copy(chunk.substr(pos, end - pos));
  if (bare.empty()) return std::nullopt;
  return bare;
}

std::optional<std::string> find_field(const std::string& chunk, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const size_t pos = find_field_label(chunk, name, 0);
    if (pos != std::string::npos) {
      if (auto v = read_field_value(chunk, pos)) return v;
    }
  }
  return std::nullopt;
}

// One chunk per object-looking region: from each '{' to the next '}' or '{'.
std::vector<std::string> split_object_chunks(const std::string& text) {
  std::vector<std::string> chunks;
  size_t pos = text.find('{');
  while (pos != std::string::npos) {
    const size_t next_open = text.find('{', pos + 1);
    size_t end = text.find('}', pos + 1);
    if (end == std::string::npos || (next_open != std::string::npos && next_open < end)) end = next_open;
    chunks.push_back(text.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1));
    pos = next_open;
  }
  return chunks;
}

// Without braces, every "title" label starts a new record.
std::vector<std::string> split_title_chunks(const std::string& text) {
  std::vector<size_t> starts;
  size_t from = 0;
  while (true) {
    const size_t label = find_field_label(text, "title", from);
    if (label == std::string::npos) break;
    starts.push_back(text.rfind("title", label));
    from = label;
  }
  std::vector<std::string> chunks;
  for (size_t i = 0; i < starts.size(); ++i) {
    const size_t end = i + 1 < starts.size() ? starts[i + 1] : text.size();
    chunks.push_back(text.substr(starts[i], end - starts[i]));
  }
  return chunks;
}

}  // namespace

// --- Preprocessing -----------------------------------------------------------

std::string strip_reasoning_blocks(const std::string& text) {
  std::string out = text;
  for (const char* tag : kReasoningTags) {
    const std::string open = std::string("<") + tag + ">";
    const std::string close = std::string("</") + tag + ">";
    while (true) {
      const size_t close_pos = find_ci(out, close, 0);
      if (close_pos == std::string::npos) break;
      const size_t open_pos = find_ci(out, open, 0);
      const size_t cut_from = (open_pos != std::string::npos && open_pos < close_pos) ? open_pos : 0;
      out.erase(cut_from, close_pos + close.size() - cut_from);
    }
    for (size_t open_pos = find_ci(out, open, 0); open_pos != std::string::npos;
         open_pos = find_ci(out, open, open_pos)) {
      out.erase(open_pos, open.size());
    }
  }
  return out;
}

std::string strip_code_fences(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, 3, "```") == 0) {
      i += 3;
      while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) ++i;
      continue;
    }
    out.push_back(text[i++]);
  }
  return out;
}

std::string clean_generation_text(const std::string& text) {
  return trim_copy(strip_code_fences(strip_reasoning_blocks(text)));
}

// --- Repair transforms ---------------------------------------------------------

std::string strip_json_comments(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      const size_t end = skip_string_literal(text, i);
      out.append(text, i, end - i);
      i = end;
      continue;
    }
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
      while (i < text.size() && text[i] != '\n') ++i;
      continue;
    }
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
      const size_t end = text.find("*/", i + 2);
      i = end == std::string::npos ? text.size() : end + 2;
      continue;
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

std::string rewrite_time_field_values(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '"') {
      out.push_back(text[i++]);
      continue;
    }
    const size_t key_end = skip_string_literal(text, i);
    out.append(text, i, key_end - i);
    const size_t colon = skip_ws(text, key_end);
    const std::string key = key_end >= i + 2 ? text.substr(i + 1, key_end - i - 2) : std::string();
    i = key_end;
    if (colon >= text.size() || text[colon] != ':' || !is_time_key(key)) continue;

    const size_t value_pos = skip_ws(text, colon + 1);
    out.append(text, i, value_pos - i);
    i = value_pos;
    if (i >= text.size()) break;

    if (text[i] == '"') {
      const size_t value_end = skip_string_literal(text, i);
      const std::string inner = value_end >= i + 2 ? text.substr(i + 1, value_end - i - 2) : std::string();
      if (auto secs = parse_time_string(inner)) {
        out += format_seconds(*secs);
      } else {
        out.append(text, i, value_end - i);
      }
      i = value_end;
      continue;
    }

    size_t value_end = i;
    while (value_end < text.size() && text[value_end] != ',' && text[value_end] != '}' &&
           text[value_end] != ']' && text[value_end] != '\n' && text[value_end] != '\r') {
      ++value_end;
    }
    const std::string token = trim_copy(text.substr(i, value_end - i));
    if (!token.empty() && !is_json_number(token)) {
      if (auto secs = parse_time_string(token)) {
        out += format_seconds(*secs);
        i = value_end;
        continue;
      }
    }
    out.append(text, i, value_end - i);
    i = value_end;
  }
  return out;
}

std::string insert_missing_object_commas(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 8);
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      const size_t end = skip_string_literal(text, i);
      out.append(text, i, end - i);
      i = end;
      continue;
    }
    out.push_back(c);
    ++i;
    if (c == '}') {
      const size_t next = skip_ws(text, i);
      if (next < text.size() && text[next] == '{') out.push_back(',');
    }
  }
  return out;
}

std::string remove_trailing_commas(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      const size_t end = skip_string_literal(text, i);
      out.append(text, i, end - i);
      i = end;
      continue;
    }
    if (c == ',') {
      const size_t next = skip_ws(text, i + 1);
      if (next < text.size() && (text[next] == ']' || text[next] == '}')) {
        ++i;
        continue;
      }
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

std::string repair_json_text(const std::string& text) {
  std::string s = strip_json_comments(text);
  s = rewrite_time_field_values(s);
  s = insert_missing_object_commas(s);
  return remove_trailing_commas(s);
}

std::optional<json> parse_json_lenient(const std::string& text) {
  json j = json::parse(text, nullptr, false);
  if (!j.is_discarded()) return j;
  j = json::parse(repair_json_text(text), nullptr, false);
  if (!j.is_discarded()) return j;
  return std::nullopt;
}

size_t find_matching_bracket(const std::string& text, size_t open_pos) {
  if (open_pos >= text.size()) return std::string::npos;
  const char opener = text[open_pos];
  if (opener != '{' && opener != '[') return std::string::npos;
  const char closer = opener == '{' ? '}' : ']';
  int depth = 0;
  size_t i = open_pos;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      i = skip_string_literal(text, i);
      continue;
    }
    if (c == opener) {
      ++depth;
    } else if (c == closer) {
      if (--depth == 0) return i;
    }
    ++i;
  }
  return std::string::npos;
}

// --- Extraction cascade --------------------------------------------------------

const std::vector<std::string>& candidate_list_keys() {
  static const std::vector<std::string> keys = {"shorts", "clips", "short_clips", "highlights"};
  return keys;
}

std::optional<ExtractedPayload> extract_keyed_object(const std::string& text) {
  const size_t key_pos = find_json_key(text, candidate_list_keys(), nullptr);
  if (key_pos == std::string::npos) return std::nullopt;
  const size_t open = enclosing_object_start(text, key_pos);
  if (open == std::string::npos) return std::nullopt;
  const auto obj = parse_json_lenient(bracketed_slice(text, open));
  if (!obj) return std::nullopt;
  return payload_from_object(*obj, "keyed-object");
}

std::optional<ExtractedPayload> extract_outermost_object(const std::string& text) {
  const size_t open = text.find('{');
  if (open == std::string::npos) return std::nullopt;
  size_t close = text.rfind('}');
  if (close == std::string::npos || close <= open) return std::nullopt;
  auto obj = parse_json_lenient(text.substr(open, close - open + 1));
  if (!obj) {
    // Prose after the object may contain a stray brace; try the balanced span.
    close = find_matching_bracket(text, open);
    if (close == std::string::npos) return std::nullopt;
    obj = parse_json_lenient(text.substr(open, close - open + 1));
    if (!obj) return std::nullopt;
  }
  if (auto p = payload_from_object(*obj, "outermost-object")) return p;
  // An object inside a list is one element of it, left to the array steps.
  const size_t bracket = text.find('[');
  const bool inside_list = bracket != std::string::npos && bracket < open;
  if (!inside_list && looks_like_candidate(*obj)) {
    ExtractedPayload p;
    p.shorts = *obj;
    p.strategy = "outermost-object";
    return p;
  }
  return std::nullopt;
}

std::optional<ExtractedPayload> extract_keyed_array(const std::string& text) {
  const size_t key_pos = find_json_key(text, candidate_list_keys(), nullptr);
  if (key_pos == std::string::npos) return std::nullopt;
  const size_t colon = text.find(':', skip_string_literal(text, key_pos));
  if (colon == std::string::npos) return std::nullopt;
  const size_t open = skip_ws(text, colon + 1);
  if (open >= text.size() || text[open] != '[') return std::nullopt;

  const std::string slice = bracketed_slice(text, open);
  auto arr = parse_json_lenient(slice);
  if (!arr || !arr->is_array()) arr = parse_truncated_array(slice);
  if (!arr) return std::nullopt;

  ExtractedPayload p;
  p.shorts = std::move(*arr);
  p.strategy = "keyed-array";

  const size_t total_pos = find_json_key(text, {kTotalKey}, nullptr);
  if (total_pos != std::string::npos) {
    const size_t value = skip_ws(text, text.find(':', total_pos) + 1);
    size_t end = value;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
    if (end > value) p.declared_total = std::stoi(text.substr(value, std::min<size_t>(end - value, 9)));
  }
  return p;
}

std::optional<ExtractedPayload> extract_bare_array(const std::string& text) {
  const std::string t = trim_copy(text);
  if (t.size() < 2 || t.front() != '[' || t.back() != ']') return std::nullopt;
  auto arr = parse_json_lenient(t);
  if (!arr || !arr->is_array()) return std::nullopt;
  ExtractedPayload p;
  p.shorts = std::move(*arr);
  p.strategy = "bare-array";
  return p;
}

std::optional<ExtractedPayload> salvage_candidate_fields(const std::string& text) {
  const auto chunks = text.find('{') != std::string::npos ? split_object_chunks(text) : split_title_chunks(text);

  ExtractedPayload p;
  p.shorts = json::array();
  p.strategy = "salvage";
  for (const auto& chunk : chunks) {
    const auto title = find_field(chunk, {"title"});
    const auto start = find_field(chunk, {"start_time", "startTime", "start"});
    const auto end = find_field(chunk, {"end_time", "endTime", "end"});
    if (!title || !start || !end) continue;

    const auto s = parse_time_string(*start);
    const auto e = parse_time_string(*end);
    if (!s || !e || *e <= *s) {
      ++p.salvage_skipped;
      continue;
    }

    json item = {{"title", *title}, {"start_time", *s}, {"end_time", *e}};
    if (auto reason = find_field(chunk, {"reason"})) item["reason"] = *reason;
    if (auto score = find_field(chunk, {"score"})) item["score"] = *score;
    p.shorts.push_back(std::move(item));
  }
  if (p.shorts.empty()) return std::nullopt;
  return p;
}

const std::vector<NamedExtractionStep>& extraction_cascade() {
  static const std::vector<NamedExtractionStep> steps = {
      {"keyed-object", &extract_keyed_object, true},
      {"outermost-object", &extract_outermost_object, true},
      {"keyed-array", &extract_keyed_array, true},
      {"bare-array", &extract_bare_array, true},
      {"salvage", &salvage_candidate_fields, false},
  };
  return steps;
}

std::optional<ExtractedPayload> extract_candidates(const std::string& reply) {
  const std::string text = clean_generation_text(reply);
  if (text.empty()) return std::nullopt;
  const std::string repaired = repair_json_text(text);
  for (const auto& step : extraction_cascade()) {
    if (auto payload = step.run(step.wants_repaired_text ? repaired : text)) return payload;
  }
  return std::nullopt;
}
