#pragma once

#include <string>
#include <vector>

inline constexpr const char* kFallbackTitle = "Untitled Segment";
inline constexpr const char* kFallbackReason = "Strong standalone moment";

// Validated clip record; end_time > start_time always holds.
struct ClipCandidate {
  std::string title;
  double start_time = 0.0;
  double end_time = 0.0;
  std::string reason;
  int score = 0;

  double duration() const { return end_time - start_time; }
  double midpoint() const { return (start_time + end_time) / 2.0; }
};

// Final ordered-by-start clip list. total_shorts() is always shorts.size().
struct ClipSet {
  std::vector<ClipCandidate> shorts;

  int total_shorts() const { return static_cast<int>(shorts.size()); }
  bool empty() const { return shorts.empty(); }
};

// Two windows are near-duplicates when both edges differ by less than 0.5s,
// or their overlap covers >= 85% of the shorter one (shorter floored at 0.1s).
bool is_near_duplicate(double a_start, double a_end, double b_start, double b_end);

inline bool is_near_duplicate(const ClipCandidate& a, const ClipCandidate& b) {
  return is_near_duplicate(a.start_time, a.end_time, b.start_time, b.end_time);
}
