#include "json_io.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::string read_text_file(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

namespace {

double number_field(const json& obj, const char* key, size_t index) {
  if (!obj.contains(key) || !obj[key].is_number()) {
    throw std::runtime_error("Segment " + std::to_string(index) + " missing numeric '" + key + "' field");
  }
  return obj[key].get<double>();
}

std::string string_field(const json& obj, const char* key) {
  if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
  return std::string();
}

TranscriptWord parse_word_object(const json& obj) {
  TranscriptWord w;
  w.word = string_field(obj, "word");
  w.start_sec = obj.value("start", 0.0);
  w.end_sec = obj.value("end", 0.0);
  w.probability = obj.value("probability", 0.0);
  w.speaker = string_field(obj, "speaker");
  return w;
}

TranscriptSegment parse_segment_object(const json& obj, size_t index) {
  if (!obj.is_object()) throw std::runtime_error("Segment " + std::to_string(index) + " is not an object");
  TranscriptSegment seg;
  seg.start_sec = number_field(obj, "start", index);
  seg.end_sec = number_field(obj, "end", index);
  if (!obj.contains("text")) {
    throw std::runtime_error("Segment missing required 'text' field at index " + std::to_string(index));
  }
  seg.text = string_field(obj, "text");
  seg.speaker = string_field(obj, "speaker");
  if (obj.contains("words") && obj["words"].is_array()) {
    for (const auto& w : obj["words"]) {
      if (w.is_object()) seg.words.push_back(parse_word_object(w));
    }
  }
  return seg;
}

void add_segments(const json& arr, Transcript& t, size_t* dropped) {
  if (!arr.is_array()) throw std::runtime_error("'segments' must be an array");
  size_t index = 0;
  for (const auto& item : arr) {
    TranscriptSegment seg = parse_segment_object(item, index++);
    if (seg.start_sec < 0.0 || seg.end_sec <= seg.start_sec) {
      if (dropped) ++*dropped;
      continue;
    }
    t.segments.push_back(std::move(seg));
  }
  std::stable_sort(t.segments.begin(), t.segments.end(),
                   [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start_sec < b.start_sec; });
}

}  // namespace

Transcript parse_transcript_json(const std::string& content, size_t* dropped_segments) {
  if (dropped_segments) *dropped_segments = 0;
  const json j = json::parse(content, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("Transcript is not valid JSON");

  Transcript t;
  if (j.is_array()) {
    add_segments(j, t, dropped_segments);
  } else if (j.is_object()) {
    if (!j.contains("segments")) throw std::runtime_error("Transcript JSON object missing 'segments' field");
    add_segments(j["segments"], t, dropped_segments);
    t.text = string_field(j, "text");
    t.language = string_field(j, "language");
    t.language_probability = j.value("language_probability", 0.0);
  } else {
    throw std::runtime_error("Invalid transcript JSON: expected array or object");
  }

  if (t.text.empty()) {
    for (const auto& seg : t.segments) {
      if (!t.text.empty()) t.text.push_back(' ');
      t.text += seg.text;
    }
  }
  return t;
}

Transcript read_transcript_json(const std::filesystem::path& path, size_t* dropped_segments) {
  return parse_transcript_json(read_text_file(path), dropped_segments);
}

double round_centis(double seconds) { return std::round(seconds * 100.0) / 100.0; }

json clips_to_json(const std::vector<ClipCandidate>& clips) {
  json arr = json::array();
  for (const auto& c : clips) {
    arr.push_back({{"title", c.title},
                   {"start_time", round_centis(c.start_time)},
                   {"end_time", round_centis(c.end_time)},
                   {"reason", c.reason},
                   {"score", c.score}});
  }
  return arr;
}

json clip_set_to_json(const ClipSet& clips) {
  json j;
  j["shorts"] = clips_to_json(clips.shorts);
  j["total_shorts"] = clips.total_shorts();
  return j;
}

std::string format_clip_set_json(const ClipSet& clips) {
  return clip_set_to_json(clips).dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

void write_clip_set_json(const std::filesystem::path& path, const ClipSet& clips) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open for writing: " + path.string());
  f << format_clip_set_json(clips);
}
