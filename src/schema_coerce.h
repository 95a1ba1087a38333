#pragma once

#include "clip_types.h"
#include "lenient_json.h"

#include <nlohmann/json.hpp>

#include <vector>

// Recognized shapes of one entry in the candidate list.
enum class RawCandidateShape {
  Object,       // {"title": ..., "start_time": ..., ...}
  Wrapped,      // {"short": {...}} / {"clip": {...}} / {"item": {...}}
  TextOnly,     // "Title (12.5 - 40)"
  Unsupported,  // numbers, nulls, nested arrays
};

struct RawCandidate {
  RawCandidateShape shape = RawCandidateShape::Unsupported;
  nlohmann::json body;  // unwrapped object for Object/Wrapped, the string for TextOnly
};

struct CoercedCandidates {
  std::vector<ClipCandidate> candidates;
  int declared_total = 0;  // always candidates.size() after coercion
  size_t dropped = 0;
};

RawCandidate classify_raw_candidate(const nlohmann::json& entry);

// Lone object -> one-element list; anything that is neither list nor object -> empty.
std::vector<RawCandidate> raw_candidate_list(const nlohmann::json& shorts);

// Integer score via float parse; 0 on any failure.
int coerce_score(const nlohmann::json& value);

// nullopt when either time is missing, unparseable, or end <= start.
std::optional<ClipCandidate> coerce_candidate(const RawCandidate& raw);

CoercedCandidates coerce_candidates(const ExtractedPayload& payload);
