#include "clip_selector.h"

#include <algorithm>
#include <cmath>

namespace {

TimeSpan selection_span(const std::vector<ClipCandidate>& candidates, const Transcript& transcript) {
  if (!transcript.segments.empty()) return transcript_span(transcript);
  TimeSpan span{candidates.front().start_time, candidates.front().end_time};
  for (const auto& c : candidates) {
    span.start_sec = std::min(span.start_sec, c.start_time);
    span.end_sec = std::max(span.end_sec, c.end_time);
  }
  return span;
}

bool sort_by_start(const ClipCandidate& a, const ClipCandidate& b) {
  if (a.start_time != b.start_time) return a.start_time < b.start_time;
  return a.end_time < b.end_time;
}

}  // namespace

std::vector<ClipCandidate> select_clips(const std::vector<ClipCandidate>& candidates,
                                        const Transcript& transcript,
                                        int target_shorts,
                                        double min_gap_seconds,
                                        SelectionStats* stats) {
  SelectionStats local;
  if (candidates.empty() || target_shorts <= 0) {
    if (stats) *stats = local;
    return {};
  }

  const TimeSpan span = selection_span(candidates, transcript);
  const size_t buckets = static_cast<size_t>(target_shorts);
  const double width = std::max(span.length(), 1e-6) / static_cast<double>(buckets);

  // Best candidate index per bucket; ties keep the earlier candidate.
  std::vector<long> best(buckets, -1);
  for (size_t i = 0; i < candidates.size(); ++i) {
    const double offset = candidates[i].midpoint() - span.start_sec;
    const double pos = std::floor(offset / width);
    const double last = static_cast<double>(buckets - 1);
    const size_t b = std::isfinite(pos) ? static_cast<size_t>(std::max(0.0, std::min(pos, last))) : 0;
    long& slot = best[b];
    if (slot < 0 || candidates[i].score > candidates[static_cast<size_t>(slot)].score) {
      slot = static_cast<long>(i);
    }
  }

  std::vector<bool> taken(candidates.size(), false);
  std::vector<ClipCandidate> selected;
  for (long idx : best) {
    if (idx < 0) continue;
    taken[static_cast<size_t>(idx)] = true;
    selected.push_back(candidates[static_cast<size_t>(idx)]);
  }
  std::sort(selected.begin(), selected.end(), sort_by_start);
  local.bucket_winners = selected.size();

  std::vector<size_t> rest;
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (!taken[i]) rest.push_back(i);
  }
  std::stable_sort(rest.begin(), rest.end(),
                   [&candidates](size_t a, size_t b) { return candidates[a].score > candidates[b].score; });

  for (size_t idx : rest) {
    if (selected.size() >= buckets) break;
    const double mid = candidates[idx].midpoint();
    const bool spaced = std::all_of(selected.begin(), selected.end(), [&](const ClipCandidate& s) {
      return std::fabs(s.midpoint() - mid) >= min_gap_seconds;
    });
    if (!spaced) continue;
    taken[idx] = true;
    selected.push_back(candidates[idx]);
    ++local.gap_additions;
  }

  for (size_t idx : rest) {
    if (selected.size() >= buckets) break;
    if (taken[idx]) continue;
    const bool duplicate = std::any_of(selected.begin(), selected.end(), [&](const ClipCandidate& s) {
      return is_near_duplicate(s, candidates[idx]);
    });
    if (duplicate) continue;
    taken[idx] = true;
    selected.push_back(candidates[idx]);
    ++local.relaxed_additions;
  }

  std::sort(selected.begin(), selected.end(), sort_by_start);
  if (selected.size() > buckets) selected.resize(buckets);
  if (stats) *stats = local;
  return selected;
}
