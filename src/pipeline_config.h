#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

struct PipelineConfig {
  int target_shorts = 5;
  bool target_shorts_explicit = false;  // set by a config file or --target-shorts
  double min_gap_seconds = 90.0;        // between clip midpoints

  double min_len = 15.0;
  double max_len = 60.0;
  double pad = 1.5;
  double merge_gap = 0.0;  // 0 disables merging
  int min_shorts = 5;
  bool min_shorts_explicit = false;  // otherwise lowered to fit max_shorts
  int max_shorts = 0;      // 0 means max(target_shorts, 5)

  double chunk_minutes = 0.0;  // 0 sends the whole transcript in one request

  // Long transcripts get more clips unless target_shorts was given explicitly.
  double long_transcript_minutes = 20.0;
  int long_transcript_target = 12;

  int max_retries = 2;
  bool repair = true;
  bool enrich = true;
};

// Overlay keys named like the fields above. Unknown keys are ignored;
// wrongly typed values throw std::runtime_error.
void apply_config_json(const nlohmann::json& j, PipelineConfig& config);

PipelineConfig load_pipeline_config(const std::filesystem::path& path, PipelineConfig base);

// Resolve derived values (long-transcript target, max_shorts default, a
// default min_shorts lowered to an explicit max_shorts).
PipelineConfig finalize_pipeline_config(PipelineConfig config, double transcript_seconds);

// Throws std::runtime_error describing the first invalid value.
void validate_pipeline_config(const PipelineConfig& config);

std::string describe_pipeline_config(const PipelineConfig& config);
