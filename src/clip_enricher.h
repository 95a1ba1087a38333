#pragma once

#include "clip_types.h"
#include "generation.h"
#include "logger.h"
#include "transcript.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class Script { Unknown, Latin, Arabic, Devanagari };

// Script a transcript language code is normally written in; Unknown disables the check.
Script expected_script(const std::string& language);

// Letters only: no Arabic/Devanagari for Latin and an ASCII share >= 0.6;
// at least one letter of the script for Arabic/Devanagari. Text without letters matches.
bool text_matches_script(const std::string& text, Script script);

bool is_generic_title(const std::string& title);
bool starts_with_filler_word(const std::string& title);
bool is_weak_reason(const std::string& reason);

struct ClipQuality {
  bool title_flagged = false;
  bool reason_flagged = false;
  std::string title_issue;
  std::string reason_issue;

  bool flagged() const { return title_flagged || reason_flagged; }
};

// Text of the segments overlapping the clip, else the nearest segment by midpoint.
std::string clip_excerpt(const Transcript& transcript, const ClipCandidate& clip, size_t max_chars = 600);

// Duplicate titles flag every occurrence after the first.
std::vector<ClipQuality> assess_clip_quality(const ClipSet& clips, const std::string& language);

struct ClipPatch {
  std::optional<std::string> title;
  std::optional<std::string> reason;
};

using ClipPatchMap = std::map<size_t, ClipPatch>;

// {"items":[{"index","title","reason"}]} from a free-text reply; malformed entries are skipped.
ClipPatchMap parse_enrichment_reply(const std::string& reply, size_t clip_count);

// Returns a new set; indices outside the set are ignored.
ClipSet apply_clip_patches(const ClipSet& clips, const ClipPatchMap& patches);

// First clause of the first sentence with two words left after dropping leading
// articles, pronouns and fillers; <= 90 chars, capitalized.
std::string synthesize_title(const std::string& excerpt);

// First excerpt sentence whose title is neither generic nor in `taken` (normalized
// titles), else the numbered placeholder for `index`. The result is added to `taken`.
std::string synthesize_unique_title(const std::string& excerpt, size_t index, std::set<std::string>& taken);

// First one to three sentences, aiming for 90-180 chars, always ending with a period.
std::string synthesize_reason(const std::string& excerpt);

struct EnrichStats {
  size_t flagged = 0;
  size_t patched_by_generation = 0;
  size_t synthesized_locally = 0;
  bool request_failed = false;
};

// generate may be null to skip the enrichment request and synthesize locally.
ClipSet enrich_clip_set(const ClipSet& clips,
                        const Transcript& transcript,
                        const GenerateFn* generate,
                        Logger& log,
                        EnrichStats* stats = nullptr);
