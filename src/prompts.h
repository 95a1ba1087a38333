#pragma once

#include "clip_types.h"
#include "generation.h"
#include "pipeline_config.h"
#include "transcript.h"

#include <filesystem>
#include <string>
#include <vector>

struct BrandInfo {
  std::string name;
  std::string description;
  std::string target_audience;
  std::string tone;
  std::vector<std::string> key_topics;
  std::string style_preferences;

  bool empty() const {
    return name.empty() && description.empty() && target_audience.empty() && tone.empty() &&
           key_topics.empty() && style_preferences.empty();
  }
};

BrandInfo read_brand_info(const std::filesystem::path& path);

// "[12.00s - 15.50s] SPEAKER: text", one line per segment.
std::string format_transcript_for_prompt(const Transcript& transcript);

std::string format_brand_context(const BrandInfo& brand);

std::vector<ChatMessage> build_selection_prompt(const Transcript& transcript, int target_shorts,
                                                double min_gap_seconds, const BrandInfo& brand);

// The failed reply is cut to a bounded length before it is embedded.
std::vector<ChatMessage> build_repair_prompt(const std::string& failed_reply);

struct EnrichmentItem {
  size_t index = 0;  // position of the clip in the clip set
  const ClipCandidate* clip = nullptr;
  std::string excerpt;
};

std::vector<ChatMessage> build_enrichment_prompt(const std::vector<EnrichmentItem>& items);
