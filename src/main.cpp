#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
#include "cli_args.h"
#include "clip_pipeline.h"
#include "generation.h"
#include "json_io.h"
#include "logger.h"
#include "pipeline_config.h"
#include "prompts.h"
#include "srt_io.h"
#include "stacktrace.h"
#include "transcript.h"

static int run_clip_selection(int argc, char** argv);

int main(int argc, char** argv) {
  try {
    return run_clip_selection(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "\n[ERROR] " << e.what() << "\n";
    std::cerr << stacktrace::capture_string(0) << "\n";
    return 1;
  }
}

static Transcript load_transcript(const CliArgs& args, Logger& log) {
  Transcript transcript;
  size_t dropped = 0;
  if (args.transcript == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    transcript = parse_transcript_json(ss.str(), &dropped);
  } else if (args.transcript.extension() == ".srt") {
    transcript = read_srt_transcript(args.transcript, args.language);
  } else {
    transcript = read_transcript_json(args.transcript, &dropped);
  }
  if (!args.language.empty()) transcript.language = args.language;

  if (dropped > 0) {
    log.warn("Dropped " + std::to_string(dropped) + " transcript segments with invalid times");
  }
  const TimeSpan span = transcript_span(transcript);
  std::ostringstream ss;
  ss << "Read " << transcript.segments.size() << " segments (" << std::fixed << std::setprecision(1)
     << span.length() << "s, language=" << (transcript.language.empty() ? "?" : transcript.language) << ")";
  log.info(ss.str());
  return transcript;
}

static GenerateFn make_generator(const CliArgs& args, Logger& log) {
  if (!args.llm_command.empty()) {
    log.info("Generation backend: command");
    return make_command_generator(args.llm_command);
  }
  std::vector<std::string> replies;
  for (const auto& p : args.responses) replies.push_back(read_text_file(p));
  log.info("Generation backend: replay (" + std::to_string(replies.size()) + " recorded replies)");
  return make_replay_generator(std::move(replies));
}

static void write_debug_json(const fs::path& path, const nlohmann::json& j) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open for writing: " + path.string());
  f << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

static void write_debug_files(const fs::path& dir, const CliArgs& args, const PipelineConfig& config,
                              const Transcript& transcript, const PipelineTrace& trace) {
  using json = nlohmann::json;
  fs::create_directories(dir);

  // 00_summary.json
  {
    json j = {
        {"transcript_path", args.transcript.string()},
        {"language", transcript.language},
        {"transcript_seconds", transcript_span(transcript).length()},
        {"num_segments", transcript.segments.size()},
        {"target_shorts", config.target_shorts},
        {"min_shorts", config.min_shorts},
        {"max_shorts", config.max_shorts},
        {"chunks_total", trace.chunks_total},
        {"chunks_failed", trace.chunks_failed},
        {"repair_requests", trace.repair_requests},
        {"strategies", trace.strategies},
        {"selection", {{"bucket_winners", trace.selection.bucket_winners},
                       {"gap_additions", trace.selection.gap_additions},
                       {"relaxed_additions", trace.selection.relaxed_additions}}},
        {"refine", {{"merged", trace.refine.merged},
                    {"dropped_short", trace.refine.dropped_short},
                    {"dropped_duplicate", trace.refine.dropped_duplicate},
                    {"synthesized", trace.refine.synthesized}}},
        {"enrich", {{"flagged", trace.enrich.flagged},
                    {"patched_by_generation", trace.enrich.patched_by_generation},
                    {"synthesized_locally", trace.enrich.synthesized_locally},
                    {"request_failed", trace.enrich.request_failed}}},
        {"total_shorts", trace.final_set.total_shorts()},
    };
    write_debug_json(dir / "00_summary.json", j);
  }
  // 01_responses.json
  {
    json j = json::array();
    for (size_t i = 0; i < trace.responses.size(); ++i) {
      j.push_back({{"index", i + 1}, {"text", trace.responses[i]}});
    }
    write_debug_json(dir / "01_responses.json", j);
  }
  write_debug_json(dir / "02_candidates.json", clips_to_json(trace.candidates));
  write_debug_json(dir / "03_selected.json", clips_to_json(trace.selected));
  write_debug_json(dir / "04_refined.json", clip_set_to_json(trace.refined));
  write_debug_json(dir / "05_final.json", clip_set_to_json(trace.final_set));
}

static void log_summary(const ClipSet& clips, Logger& log) {
  log.info("Selected " + std::to_string(clips.total_shorts()) + " clips");
  for (size_t i = 0; i < clips.shorts.size(); ++i) {
    const auto& c = clips.shorts[i];
    std::ostringstream ss;
    ss << "  " << (i + 1) << ". " << c.title << " [" << std::fixed << std::setprecision(2) << c.start_time
       << "s - " << c.end_time << "s] " << c.reason;
    log.info(ss.str());
  }
}

static int run_clip_selection(int argc, char** argv) {
  CliArgs args;
  int exit_code = 0;
  if (!parse_cli_args(argc, argv, args, exit_code)) {
    return exit_code;
  }

  Logger log;
  log.set_debug(args.debug);
  if (args.debug && !args.debug_dir.empty()) {
    std::error_code ec;
    fs::create_directories(args.debug_dir, ec);
    log.enable_file(args.debug_dir / "shorts.log");
  }

  const Transcript transcript = load_transcript(args, log);

  const PipelineConfig config = finalize_pipeline_config(resolve_pipeline_config(args),
                                                         transcript_span(transcript).length());
  validate_pipeline_config(config);
  log.info("Config: " + describe_pipeline_config(config));

  BrandInfo brand;
  if (!args.brand_file.empty()) {
    brand = read_brand_info(args.brand_file);
    log.info("Brand context: " + (brand.name.empty() ? args.brand_file.string() : brand.name));
  }

  const GenerateFn generate = make_generator(args, log);
  const ProgressFn progress = [&log](size_t done, size_t total) {
    if (total > 1) log.info("[chunk] " + std::to_string(done) + "/" + std::to_string(total) + " done");
  };

  PipelineTrace trace;
  try {
    const ClipSet clips = run_clip_pipeline_with_retry(transcript, config, brand, generate, log, &trace, progress);

    if (args.output.empty() || args.output == "-") {
      std::cout << format_clip_set_json(clips);
    } else {
      write_clip_set_json(args.output, clips);
      log.info("Wrote clip set JSON: " + args.output.string());
    }
    if (!args.srt_output.empty()) {
      write_clips_srt(args.srt_output, clips);
      log.info("Wrote clip SRT: " + args.srt_output.string());
    }

    if (args.debug && !args.debug_dir.empty()) {
      write_debug_files(args.debug_dir, args, config, transcript, trace);
      log.debug("Wrote debug files to " + args.debug_dir.string());
    }
    log_summary(clips, log);
  } catch (const std::exception& e) {
    log.error(std::string("Clip selection failed: ") + e.what());
    throw;
  }

  return 0;
}
