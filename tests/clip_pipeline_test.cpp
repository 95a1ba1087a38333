#include "clip_pipeline.h"
#include "generation.h"

#include "test_fixtures.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* const kSelectionReply = R"(Here are the best moments:
```json
{"shorts": [
  {"title": "The kitchen fire that ended the office party", "start_time": "0:30", "end_time": "0:55",
   "reason": "A chaotic story that builds to a great punchline.", "score": 9},
  {"title": "Why the team rewrote billing from scratch", "start_time": 200, "end_time": 240,
   "reason": "Clear explanation of technical debt and its cost.", "score": 7},
  {"title": "The customer call that changed the roadmap", "start_time": 400, "end_time": 430,
   "reason": "A single phone call reshapes the product plan.", "score": 8}
], "total_shorts": 5}
```)";

struct RecordingGenerator {
  std::vector<std::string> replies;
  std::vector<std::vector<ChatMessage>> prompts;

  GenerateFn fn() {
    return [this](const std::vector<ChatMessage>& messages) {
      prompts.push_back(messages);
      const size_t i = prompts.size() - 1;
      return i < replies.size() ? replies[i] : std::string();
    };
  }
};

PipelineConfig quiet_config() {
  PipelineConfig c;
  c.target_shorts = 5;
  c.target_shorts_explicit = true;
  return c;
}

bool is_well_formed(const ClipSet& s, const PipelineConfig& c, const char* what) {
  for (size_t i = 0; i < s.shorts.size(); ++i) {
    const auto& clip = s.shorts[i];
    const bool length_ok = clip.duration() >= c.min_len - 1e-6 && clip.duration() <= c.max_len + 1e-6;
    const bool ordered = i == 0 || s.shorts[i - 1].start_time <= clip.start_time;
    if (!length_ok || !ordered || clip.title.empty()) {
      std::cerr << "Clip pipeline test failed (" << what << "): bad clip '" << clip.title << "' [" << clip.start_time
                << "," << clip.end_time << "].\n";
      return false;
    }
    for (size_t j = i + 1; j < s.shorts.size(); ++j) {
      if (is_near_duplicate(clip, s.shorts[j])) {
        std::cerr << "Clip pipeline test failed (" << what << "): near-duplicate clips.\n";
        return false;
      }
    }
  }
  return true;
}

bool has_title(const ClipSet& s, const std::string& title) {
  for (const auto& c : s.shorts) {
    if (c.title == title) return true;
  }
  return false;
}

bool test_single_request_end_to_end() {
  Logger log;
  log.set_quiet(true);
  const auto transcript = fixtures::even_transcript(60, 10.0);
  RecordingGenerator gen;
  gen.replies = {kSelectionReply};
  const auto config = quiet_config();

  PipelineTrace trace;
  size_t progress_calls = 0;
  const auto out = run_clip_pipeline(transcript, config, BrandInfo(), gen.fn(), log, &trace,
                                     [&progress_calls](size_t, size_t) { ++progress_calls; });

  if (out.total_shorts() != 5 || static_cast<size_t>(out.total_shorts()) != out.shorts.size()) {
    std::cerr << "Clip pipeline test failed: expected 5 clips, got " << out.total_shorts() << ".\n";
    return false;
  }
  if (!is_well_formed(out, config, "single request")) return false;
  if (!has_title(out, "The kitchen fire that ended the office party") ||
      !has_title(out, "The customer call that changed the roadmap")) {
    std::cerr << "Clip pipeline test failed: selected clips missing from output.\n";
    return false;
  }
  if (has_title(out, kBackfillTitle)) {
    std::cerr << "Clip pipeline test failed: backfill placeholder survived enrichment.\n";
    return false;
  }
  if (trace.strategies.size() != 1 || trace.strategies[0] != "keyed-object" || trace.candidates.size() != 3 ||
      trace.refine.synthesized != 2 || progress_calls != 1) {
    std::cerr << "Clip pipeline test failed: trace contents.\n";
    return false;
  }
  // Selection request plus one enrichment request for the two backfilled clips.
  if (gen.prompts.size() != 2) {
    std::cerr << "Clip pipeline test failed: expected 2 generation calls, got " << gen.prompts.size() << ".\n";
    return false;
  }
  return true;
}

bool test_repair_escalation() {
  Logger log;
  log.set_quiet(true);
  const auto transcript = fixtures::even_transcript(60, 10.0);
  RecordingGenerator gen;
  gen.replies = {"Sorry, I can only describe the clips in words.", kSelectionReply};
  auto config = quiet_config();
  config.enrich = false;

  PipelineTrace trace;
  const auto out = run_clip_pipeline(transcript, config, BrandInfo(), gen.fn(), log, &trace);
  if (gen.prompts.size() != 2 || trace.repair_requests != 1) {
    std::cerr << "Clip pipeline test failed: repair request not issued.\n";
    return false;
  }
  if (gen.prompts[1].front().content.find("JSON repair") == std::string::npos ||
      gen.prompts[1].back().content.find("Sorry, I can only describe") == std::string::npos) {
    std::cerr << "Clip pipeline test failed: repair prompt content.\n";
    return false;
  }
  if (!has_title(out, "Why the team rewrote billing from scratch")) {
    std::cerr << "Clip pipeline test failed: repaired reply not used.\n";
    return false;
  }
  return true;
}

bool test_unrecoverable_reply_degrades_to_backfill() {
  Logger log;
  log.set_quiet(true);
  const auto transcript = fixtures::even_transcript(60, 10.0);
  RecordingGenerator gen;
  gen.replies = {"no json here", "still no json"};
  auto config = quiet_config();
  config.enrich = false;

  PipelineTrace trace;
  const auto out = run_clip_pipeline(transcript, config, BrandInfo(), gen.fn(), log, &trace);
  if (out.total_shorts() != 5 || !trace.candidates.empty() || trace.strategies.at(0) != "none") {
    std::cerr << "Clip pipeline test failed: degraded run should backfill 5 clips.\n";
    return false;
  }
  for (const auto& c : out.shorts) {
    if (c.title != kBackfillTitle) {
      std::cerr << "Clip pipeline test failed: unexpected clip in degraded run.\n";
      return false;
    }
  }
  return is_well_formed(out, config, "degraded");
}

bool test_repair_disabled() {
  Logger log;
  log.set_quiet(true);
  RecordingGenerator gen;
  gen.replies = {"no json here", kSelectionReply};
  auto config = quiet_config();
  config.enrich = false;
  config.repair = false;
  run_clip_pipeline(fixtures::even_transcript(60, 10.0), config, BrandInfo(), gen.fn(), log);
  if (gen.prompts.size() != 1) {
    std::cerr << "Clip pipeline test failed: repair ran while disabled.\n";
    return false;
  }
  return true;
}

bool test_chunked_mode_skips_failing_chunk() {
  Logger log;
  log.set_quiet(true);
  const auto transcript = fixtures::even_transcript(60, 10.0);
  std::vector<std::string> seen;
  const GenerateFn generate = [&seen](const std::vector<ChatMessage>& messages) -> std::string {
    const std::string& user = messages.back().content;
    seen.push_back(user);
    if (user.find("[0.00s - 10.00s]") == std::string::npos) throw std::runtime_error("chunk backend timeout");
    return R"({"shorts": [
      {"title": "Opening story about the first office", "start_time": 20, "end_time": 50, "score": 5},
      {"title": "The investor meeting that went sideways", "start_time": 150, "end_time": 180, "score": 6},
      {"title": "Outside chunk", "start_time": 400, "end_time": 430, "score": 9}
    ]})";
  };
  auto config = quiet_config();
  config.target_shorts = 4;
  config.chunk_minutes = 5.0;
  config.enrich = false;

  PipelineTrace trace;
  std::vector<std::pair<size_t, size_t>> progress;
  const auto out = run_clip_pipeline(transcript, config, BrandInfo(), generate, log, &trace,
                                     [&progress](size_t done, size_t total) { progress.emplace_back(done, total); });
  if (seen.size() != 2 || trace.chunks_total != 2 || trace.chunks_failed != 1) {
    std::cerr << "Clip pipeline test failed: chunk bookkeeping.\n";
    return false;
  }
  if (progress.size() != 2 || progress.back().first != 2 || progress.back().second != 2) {
    std::cerr << "Clip pipeline test failed: progress callback.\n";
    return false;
  }
  if (has_title(out, "Outside chunk") || !has_title(out, "Opening story about the first office") ||
      !has_title(out, "The investor meeting that went sideways")) {
    std::cerr << "Clip pipeline test failed: chunk candidates filtered incorrectly.\n";
    return false;
  }
  if (seen[0].find("Return up to 2 clips") == std::string::npos) {
    std::cerr << "Clip pipeline test failed: per-chunk target not proportional.\n";
    return false;
  }
  return is_well_formed(out, config, "chunked");
}

bool test_retry_then_success() {
  Logger log;
  log.set_quiet(true);
  int calls = 0;
  const GenerateFn flaky = [&calls](const std::vector<ChatMessage>&) -> std::string {
    if (++calls == 1) throw std::runtime_error("connection refused");
    return kSelectionReply;
  };
  auto config = quiet_config();
  config.enrich = false;
  const auto out =
      run_clip_pipeline_with_retry(fixtures::even_transcript(60, 10.0), config, BrandInfo(), flaky, log);
  if (calls != 2 || !has_title(out, "The kitchen fire that ended the office party")) {
    std::cerr << "Clip pipeline test failed: retry did not recover.\n";
    return false;
  }
  return true;
}

bool test_retry_gives_up() {
  Logger log;
  log.set_quiet(true);
  int calls = 0;
  const GenerateFn broken = [&calls](const std::vector<ChatMessage>&) -> std::string {
    ++calls;
    throw std::runtime_error("backend down");
  };
  auto config = quiet_config();
  config.max_retries = 2;
  try {
    run_clip_pipeline_with_retry(fixtures::even_transcript(60, 10.0), config, BrandInfo(), broken, log);
  } catch (const std::runtime_error& e) {
    if (calls != 3 || std::string(e.what()) != "backend down") {
      std::cerr << "Clip pipeline test failed: expected 3 attempts, got " << calls << ".\n";
      return false;
    }
    return true;
  }
  std::cerr << "Clip pipeline test failed: exception was swallowed.\n";
  return false;
}

bool test_chunk_target() {
  if (chunk_target(4, 300, 600) != 2 || chunk_target(5, 300, 600) != 3 || chunk_target(5, 10, 600) != 1 ||
      chunk_target(3, 100, 0) != 3) {
    std::cerr << "Clip pipeline test failed: chunk_target.\n";
    return false;
  }
  return true;
}

}  // namespace

bool test_replay_generator() {
  const GenerateFn generate = make_replay_generator({"first", "second"});
  const std::vector<ChatMessage> messages = {{"user", "pick clips"}};
  if (generate(messages) != "first" || generate(messages) != "second") {
    std::cerr << "Replay generator returned replies out of order.\n";
    return false;
  }
  if (!generate(messages).empty()) {
    std::cerr << "Exhausted replay generator should return an empty reply.\n";
    return false;
  }
  return true;
}

#ifndef _WIN32
bool test_command_generator() {
  const std::vector<ChatMessage> messages = {{"system", "be brief"}, {"user", "say \"hi\""}};
  const std::string echoed = make_command_generator("cat")(messages);
  if (echoed != format_messages_json(messages)) {
    std::cerr << "Command generator should pass the serialized messages on stdin.\n"
              << echoed << "\n";
    return false;
  }

  bool threw = false;
  try {
    make_command_generator("exit 3")(messages);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Non-zero exit from the generation command should throw.\n";
    return false;
  }
  return true;
}
#endif

int main() {
  if (!test_single_request_end_to_end()) return 1;
  if (!test_repair_escalation()) return 1;
  if (!test_unrecoverable_reply_degrades_to_backfill()) return 1;
  if (!test_repair_disabled()) return 1;
  if (!test_chunked_mode_skips_failing_chunk()) return 1;
  if (!test_retry_then_success()) return 1;
  if (!test_retry_gives_up()) return 1;
  if (!test_chunk_target()) return 1;
  if (!test_replay_generator()) return 1;
#ifndef _WIN32
  if (!test_command_generator()) return 1;
#endif

  std::cout << "Clip pipeline test passed.\n";
  return 0;
}
