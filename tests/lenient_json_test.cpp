#include "lenient_json.h"
#include "schema_coerce.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

const char* const kCleanReply = R"({"shorts":[
  {"title":"The day the server caught fire","start_time":10,"end_time":40,"reason":"Chaotic story with a punchline","score":8},
  {"title":"Why we rewrote the billing system","start_time":100,"end_time":130,"reason":"Clear lesson on technical debt","score":6}
],"total_shorts":2})";

bool same_candidates(const std::vector<ClipCandidate>& a, const std::vector<ClipCandidate>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].title != b[i].title || a[i].reason != b[i].reason || a[i].score != b[i].score) return false;
    if (std::fabs(a[i].start_time - b[i].start_time) > 1e-9) return false;
    if (std::fabs(a[i].end_time - b[i].end_time) > 1e-9) return false;
  }
  return true;
}

std::vector<ClipCandidate> coerced_from(const std::string& reply) {
  const auto payload = extract_candidates(reply);
  if (!payload) return {};
  return coerce_candidates(*payload).candidates;
}

bool test_clean_reply_is_unchanged() {
  const auto payload = extract_candidates(kCleanReply);
  if (!payload) {
    std::cerr << "Lenient JSON test failed: clean reply not extracted.\n";
    return false;
  }
  const json expected = json::parse(kCleanReply);
  if (payload->shorts != expected["shorts"] || !payload->declared_total || *payload->declared_total != 2) {
    std::cerr << "Lenient JSON test failed: clean reply changed during extraction.\n";
    return false;
  }
  if (payload->strategy != "keyed-object") {
    std::cerr << "Lenient JSON test failed: expected keyed-object strategy, got " << payload->strategy << ".\n";
    return false;
  }
  return true;
}

bool test_malformed_reply_recovers_same_candidates() {
  const std::string messy = R"(<think>They want JSON. {"draft": true}</think>
Here you go:
```json
{
  // best picks first
  "shorts": [
    {"title": "The day the server caught fire", "start_time": "0:10", "end_time": "40s",
     "reason": "Chaotic story with a punchline", "score": 8,}
    {"title": "Why we rewrote the billing system", "start_time": 100, "end_time": "2:10",
     /* inline note */ "reason": "Clear lesson on technical debt", "score": "6"},
  ],
  "total_shorts": 2,
}
```)";
  const auto clean = coerced_from(kCleanReply);
  const auto recovered = coerced_from(messy);
  if (clean.size() != 2 || !same_candidates(clean, recovered)) {
    std::cerr << "Lenient JSON test failed: malformed reply did not recover the clean candidates ("
              << recovered.size() << " found).\n";
    return false;
  }
  return true;
}

bool test_dangling_reasoning_close_tag() {
  const std::string reply = std::string("Let me think about {this}...</think>") + kCleanReply;
  if (coerced_from(reply).size() != 2) {
    std::cerr << "Lenient JSON test failed: dangling reasoning tag not stripped.\n";
    return false;
  }
  return true;
}

bool test_truncated_keyed_array() {
  const std::string reply =
      R"(Sure! "shorts": [{"title":"Opening joke","start_time":1,"end_time":20}, {"title":"Cut off","start_ti)";
  const auto payload = extract_keyed_array(repair_json_text(reply));
  if (!payload || !payload->shorts.is_array() || payload->shorts.size() != 1) {
    std::cerr << "Lenient JSON test failed: truncated array not recovered.\n";
    return false;
  }
  const auto full = extract_candidates(reply);
  if (!full || full->strategy != "keyed-array") {
    std::cerr << "Lenient JSON test failed: truncated reply should use keyed-array.\n";
    return false;
  }
  return true;
}

bool test_bare_array_keeps_every_item() {
  const std::string reply =
      R"([{"title":"A","start_time":1,"end_time":20},{"title":"B","start_time":30,"end_time":50}])";
  const auto payload = extract_candidates(reply);
  if (!payload || payload->strategy != "bare-array" || payload->shorts.size() != 2) {
    std::cerr << "Lenient JSON test failed: bare array not extracted whole.\n";
    return false;
  }
  return true;
}

bool test_salvage_without_json() {
  const std::string reply =
      "1. title: \"Big reveal\", start: 1:05, end: 1:40, reason: \"Shock ending\"\n"
      "2. title: \"Backwards\", start: 2:00, end: 1:00\n"
      "3. title: \"Third\", start_time: 200s, end_time: 230s\n";
  const auto payload = extract_candidates(reply);
  if (!payload || payload->strategy != "salvage") {
    std::cerr << "Lenient JSON test failed: salvage did not run.\n";
    return false;
  }
  if (payload->shorts.size() != 2 || payload->salvage_skipped != 1) {
    std::cerr << "Lenient JSON test failed: salvage kept " << payload->shorts.size() << " and skipped "
              << payload->salvage_skipped << ".\n";
    return false;
  }
  const auto& first = payload->shorts[0];
  if (first["title"] != "Big reveal" || first["start_time"].get<double>() != 65.0 ||
      first["end_time"].get<double>() != 100.0 || first["reason"] != "Shock ending") {
    std::cerr << "Lenient JSON test failed: salvaged fields wrong.\n";
    return false;
  }
  return true;
}

bool test_empty_list_is_success_and_prose_is_failure() {
  const auto empty = extract_candidates(R"({"shorts": [], "total_shorts": 0})");
  if (!empty || !empty->shorts.is_array() || !empty->shorts.empty()) {
    std::cerr << "Lenient JSON test failed: empty list should extract.\n";
    return false;
  }
  if (extract_candidates("I'm sorry, I could not find any good clips in this transcript.")) {
    std::cerr << "Lenient JSON test failed: prose reply should fail extraction.\n";
    return false;
  }
  if (extract_candidates("```\n```")) {
    std::cerr << "Lenient JSON test failed: empty fence should fail extraction.\n";
    return false;
  }
  return true;
}

bool test_repairs_leave_strings_alone() {
  const std::string text = R"({"title": "a, ] // b } {", "end": "x"})";
  if (repair_json_text(text) != text) {
    std::cerr << "Lenient JSON test failed: repair touched string contents.\n";
    return false;
  }
  if (remove_trailing_commas("[1, 2, ]") != "[1, 2 ]" || insert_missing_object_commas("{} {}") != "{}, {}") {
    std::cerr << "Lenient JSON test failed: comma repairs.\n";
    return false;
  }
  if (rewrite_time_field_values(R"({"start": "1:30", "title": "1:30"})") != R"({"start": 90, "title": "1:30"})") {
    std::cerr << "Lenient JSON test failed: time field rewrite.\n";
    return false;
  }
  return true;
}

bool test_alternate_list_key() {
  const auto payload = extract_candidates(R"({"clips": [{"title": "X", "start": 5, "end": 25}]})");
  if (!payload || payload->shorts.size() != 1) {
    std::cerr << "Lenient JSON test failed: 'clips' key not accepted.\n";
    return false;
  }
  return true;
}

bool test_out_of_range_numbers_are_rejected() {
  const auto p = extract_candidates(R"({"shorts":[
    {"title":"Far away","start_time":1e300,"end_time":2e300},
    {"title":"Huge end","start_time":10,"end_time":1e8},
    {"title":"Real one","start_time":30,"end_time":55}
  ],"total_shorts":1e20})");
  if (!p) {
    std::cerr << "Lenient JSON test failed: reply with huge numbers not extracted.\n";
    return false;
  }
  if (p->declared_total) {
    std::cerr << "Lenient JSON test failed: total_shorts outside int range read as " << *p->declared_total
              << ".\n";
    return false;
  }
  const auto coerced = coerce_candidates(*p);
  if (coerced.candidates.size() != 1 || coerced.candidates[0].title != "Real one" || coerced.dropped != 2) {
    std::cerr << "Lenient JSON test failed: implausible times should be dropped.\n";
    return false;
  }

  const auto negative = extract_candidates(R"({"shorts":[],"total_shorts":-3})");
  if (!negative || negative->declared_total) {
    std::cerr << "Lenient JSON test failed: negative total_shorts should be ignored.\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_clean_reply_is_unchanged()) return 1;
  if (!test_malformed_reply_recovers_same_candidates()) return 1;
  if (!test_dangling_reasoning_close_tag()) return 1;
  if (!test_truncated_keyed_array()) return 1;
  if (!test_bare_array_keeps_every_item()) return 1;
  if (!test_salvage_without_json()) return 1;
  if (!test_empty_list_is_success_and_prose_is_failure()) return 1;
  if (!test_repairs_leave_strings_alone()) return 1;
  if (!test_alternate_list_key()) return 1;
  if (!test_out_of_range_numbers_are_rejected()) return 1;

  std::cout << "Lenient JSON test passed.\n";
  return 0;
}
