#pragma once

#include "clip_types.h"
#include "transcript.h"

#include <vector>

inline constexpr const char* kBackfillTitle = "Auto Clip";
inline constexpr const char* kBackfillReason = "Auto-generated to meet minimum clip count.";

struct RefineOptions {
  double min_len = 15.0;
  double max_len = 60.0;
  double pad = 1.5;
  double merge_gap = 0.0;  // 0 disables merging
  int min_shorts = 0;      // backfill target
  int max_shorts = 0;      // 0 means no cap
};

struct RefineStats {
  size_t merged = 0;
  size_t dropped_short = 0;
  size_t dropped_duplicate = 0;
  size_t synthesized = 0;
};

// Working window; anchor_mid is the requested center used when re-centering.
struct ClipWindow {
  double start = 0.0;
  double end = 0.0;
  std::string title;
  std::string reason;
  int score = 0;
  double anchor_mid = 0.0;
  bool merged = false;

  double duration() const { return end - start; }
};

// Snapping and length rules against one transcript's segment boundaries.
class BoundarySnapper {
 public:
  BoundarySnapper(const Transcript& transcript, const RefineOptions& options);

  double clamp(double t) const;

  // Start of the segment containing t, else the nearest earlier segment start.
  double snap_start(double t) const;
  // End of the segment containing t, else the nearest later segment end.
  double snap_end(double t) const;

  // Pad, clamp and snap [start, end]; anchor_mid is the snapped center.
  ClipWindow expand_and_snap(double start, double end) const;

  // Re-center on anchor_mid until min_len <= duration <= max_len where the span allows.
  void enforce_length(ClipWindow& win) const;

  // min_len, or the whole span when the transcript is shorter than that.
  double effective_min_len() const;

  const TimeSpan& span() const { return span_; }

 private:
  std::vector<TranscriptSegment> segments_;
  TimeSpan span_;
  RefineOptions options_;
};

// Snap, pad, merge, length-enforce, de-duplicate, backfill and cap clip windows.
// Output is sorted by start. Without transcript segments the clips are only sorted and capped.
ClipSet refine_clip_windows(const ClipSet& clips,
                            const Transcript& transcript,
                            const RefineOptions& options,
                            RefineStats* stats = nullptr);
