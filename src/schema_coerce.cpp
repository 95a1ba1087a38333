#include "schema_coerce.h"

#include "text_util.h"
#include "time_parse.h"

#include <cmath>
#include <regex>

using json = nlohmann::json;

namespace {

// Times beyond this many seconds (about 115 days) are not transcript offsets.
constexpr double kMaxAbsTimeSeconds = 1e7;

const char* const kWrapperKeys[] = {"short", "clip", "item", "segment", "candidate"};

bool has_time_field(const json& obj) {
  return obj.contains("start_time") || obj.contains("start") || obj.contains("end_time") ||
         obj.contains("end");
}

std::string text_field(const json& obj, const char* key, const char* fallback) {
  if (obj.contains(key) && obj[key].is_string()) {
    std::string s = collapse_whitespace(obj[key].get<std::string>());
    if (!s.empty()) return s;
  }
  return fallback;
}

bool plausible_time(double t) { return std::isfinite(t) && std::fabs(t) <= kMaxAbsTimeSeconds; }

const json* time_field(const json& obj, const char* primary, const char* alias) {
  if (obj.contains(primary) && !obj[primary].is_null()) return &obj[primary];
  if (obj.contains(alias) && !obj[alias].is_null()) return &obj[alias];
  return nullptr;
}

// "Some title (1:05 - 1:40)" / "Some title: 65 to 100"
std::optional<ClipCandidate> coerce_text_only(const std::string& text) {
  static const std::regex range_re(
      R"(([0-9][0-9:.]*\s*(?:s|sec|secs)?)\s*(?:-|to|\xE2\x80\x93)\s*([0-9][0-9:.]*\s*(?:s|sec|secs)?))");
  const std::string line = collapse_whitespace(text);
  if (line.size() > 400) return std::nullopt;
  std::smatch m;
  if (!std::regex_search(line, m, range_re)) return std::nullopt;

  const auto s = parse_time_string(m[1].str());
  const auto e = parse_time_string(m[2].str());
  if (!s || !e || !plausible_time(*s) || !plausible_time(*e) || *e <= *s) return std::nullopt;

  std::string title = line.substr(0, static_cast<size_t>(m.position(0)));
  while (!title.empty() && (title.back() == '(' || title.back() == '[' || title.back() == ':' ||
                            title.back() == '-' || title.back() == ' ')) {
    title.pop_back();
  }
  ClipCandidate c;
  c.title = title.empty() ? kFallbackTitle : title;
  c.start_time = *s;
  c.end_time = *e;
  c.reason = kFallbackReason;
  return c;
}

}  // namespace

RawCandidate classify_raw_candidate(const json& entry) {
  RawCandidate raw;
  if (entry.is_string()) {
    raw.shape = RawCandidateShape::TextOnly;
    raw.body = entry;
    return raw;
  }
  if (!entry.is_object()) return raw;

  if (!has_time_field(entry)) {
    for (const char* key : kWrapperKeys) {
      if (entry.contains(key) && entry[key].is_object()) {
        raw.shape = RawCandidateShape::Wrapped;
        raw.body = entry[key];
        return raw;
      }
    }
  }
  raw.shape = RawCandidateShape::Object;
  raw.body = entry;
  return raw;
}

std::vector<RawCandidate> raw_candidate_list(const json& shorts) {
  std::vector<RawCandidate> out;
  if (shorts.is_object()) {
    out.push_back(classify_raw_candidate(shorts));
  } else if (shorts.is_array()) {
    out.reserve(shorts.size());
    for (const auto& entry : shorts) out.push_back(classify_raw_candidate(entry));
  }
  return out;
}

int coerce_score(const json& value) {
  double v = 0.0;
  if (value.is_number()) {
    v = value.get<double>();
  } else if (value.is_string()) {
    const std::string text = trim_copy(value.get<std::string>());
    size_t used = 0;
    try {
      v = std::stod(text, &used);
    } catch (const std::exception&) {
      return 0;
    }
    if (used != text.size()) return 0;
  } else {
    return 0;
  }
  if (!std::isfinite(v) || std::fabs(v) > 1e9) return 0;
  return static_cast<int>(v);
}

std::optional<ClipCandidate> coerce_candidate(const RawCandidate& raw) {
  switch (raw.shape) {
    case RawCandidateShape::TextOnly:
      return coerce_text_only(raw.body.get<std::string>());
    case RawCandidateShape::Unsupported:
      return std::nullopt;
    case RawCandidateShape::Object:
    case RawCandidateShape::Wrapped:
      break;
  }

  const json& obj = raw.body;
  const json* start_v = time_field(obj, "start_time", "start");
  const json* end_v = time_field(obj, "end_time", "end");
  if (!start_v || !end_v) return std::nullopt;

  const auto start = parse_time_value(*start_v);
  const auto end = parse_time_value(*end_v);
  if (!start || !end || !plausible_time(*start) || !plausible_time(*end) || *end <= *start) {
    return std::nullopt;
  }

  ClipCandidate c;
  c.title = text_field(obj, "title", kFallbackTitle);
  c.reason = text_field(obj, "reason", kFallbackReason);
  c.start_time = *start;
  c.end_time = *end;
  c.score = obj.contains("score") ? coerce_score(obj["score"]) : 0;
  return c;
}

CoercedCandidates coerce_candidates(const ExtractedPayload& payload) {
  CoercedCandidates out;
  for (const auto& raw : raw_candidate_list(payload.shorts)) {
    if (auto c = coerce_candidate(raw)) {
      out.candidates.push_back(std::move(*c));
    } else {
      ++out.dropped;
    }
  }
  out.declared_total = static_cast<int>(out.candidates.size());
  return out;
}
