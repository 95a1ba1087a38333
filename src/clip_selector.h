#pragma once

#include "clip_types.h"
#include "transcript.h"

#include <vector>

struct SelectionStats {
  size_t bucket_winners = 0;
  size_t gap_additions = 0;      // added with midpoint >= min_gap from every pick
  size_t relaxed_additions = 0;  // added only to reach the target count
};

// Picks up to target_shorts candidates spread over the timeline:
//   1. one best-scoring candidate per equal-width time bucket,
//   2. greedy fill by score keeping midpoints >= min_gap_seconds apart,
//   3. relaxed fill by score that only rejects near-duplicates.
// Result is sorted by start time.
std::vector<ClipCandidate> select_clips(const std::vector<ClipCandidate>& candidates,
                                        const Transcript& transcript,
                                        int target_shorts,
                                        double min_gap_seconds,
                                        SelectionStats* stats = nullptr);
