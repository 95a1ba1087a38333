#pragma once

#include "pipeline_config.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct CliArgs {
  std::filesystem::path transcript;  // "-" reads JSON from stdin
  std::filesystem::path output;      // empty or "-" writes to stdout
  std::filesystem::path srt_output;
  std::filesystem::path config_file;
  std::filesystem::path brand_file;
  std::string language;  // overrides the transcript's language; required for SRT input

  // Exactly one generation source.
  std::string llm_command;
  std::vector<std::filesystem::path> responses;

  // Flag overrides, applied on top of the config file.
  std::optional<int> target_shorts;
  std::optional<double> min_gap_seconds;
  std::optional<double> min_len;
  std::optional<double> max_len;
  std::optional<double> pad;
  std::optional<double> merge_gap;
  std::optional<double> chunk_minutes;
  std::optional<int> min_shorts;
  std::optional<int> max_shorts;
  std::optional<int> retries;
  bool no_enrich = false;
  bool no_repair = false;

  bool debug = false;
  std::filesystem::path debug_dir;
};

// Returns true on success; on failure writes usage to stderr and returns false (and sets exit_code).
bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code);

// Defaults, then --config, then flags.
PipelineConfig resolve_pipeline_config(const CliArgs& args);

void print_usage();
