#include "clip_refiner.h"

#include <algorithm>

namespace {

constexpr int kBackfillAttempts = 5;
constexpr double kBackfillJitter = 0.35;  // fraction of min_len per attempt step
constexpr double kLengthEpsilon = 1e-6;

bool overlaps_any(const ClipWindow& win, const std::vector<ClipWindow>& accepted) {
  return std::any_of(accepted.begin(), accepted.end(), [&win](const ClipWindow& other) {
    return is_near_duplicate(win.start, win.end, other.start, other.end);
  });
}

ClipCandidate to_candidate(const ClipWindow& win) {
  ClipCandidate c;
  c.title = win.title;
  c.reason = win.reason;
  c.start_time = win.start;
  c.end_time = win.end;
  c.score = win.score;
  return c;
}

bool window_by_start(const ClipWindow& a, const ClipWindow& b) { return a.start < b.start; }

void backfill_windows(std::vector<ClipWindow>& windows, const BoundarySnapper& snapper,
                      const RefineOptions& options, RefineStats& stats) {
  const size_t want = static_cast<size_t>(std::max(options.min_shorts, 0));
  if (windows.size() >= want) return;

  const TimeSpan& span = snapper.span();
  const double length = std::max(1.0, span.length());
  const double half = options.min_len / 2.0;
  for (size_t slot = 0; slot < want && windows.size() < want; ++slot) {
    const double base_mid = span.start_sec + (double(slot) + 0.5) * (length / double(want));
    for (int attempt = 0; attempt < kBackfillAttempts; ++attempt) {
      const double jitter = double(attempt - 2) * options.min_len * kBackfillJitter;
      const double mid = snapper.clamp(base_mid + jitter);
      ClipWindow win = snapper.expand_and_snap(mid - half, mid + half);
      snapper.enforce_length(win);
      if (win.duration() + kLengthEpsilon < snapper.effective_min_len()) continue;
      if (overlaps_any(win, windows)) continue;
      win.title = kBackfillTitle;
      win.reason = kBackfillReason;
      win.score = 0;
      windows.push_back(std::move(win));
      ++stats.synthesized;
      break;
    }
  }
}

}  // namespace

BoundarySnapper::BoundarySnapper(const Transcript& transcript, const RefineOptions& options)
    : segments_(transcript.segments), span_(transcript_span(transcript)), options_(options) {
  std::stable_sort(segments_.begin(), segments_.end(),
                   [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start_sec < b.start_sec; });
}

double BoundarySnapper::clamp(double t) const {
  return std::max(span_.start_sec, std::min(span_.end_sec, t));
}

double BoundarySnapper::snap_start(double t) const {
  double earlier = span_.start_sec;
  bool found_earlier = false;
  for (const auto& seg : segments_) {
    if (seg.start_sec <= t && t <= seg.end_sec) return seg.start_sec;
    if (seg.start_sec <= t && (!found_earlier || seg.start_sec > earlier)) {
      earlier = seg.start_sec;
      found_earlier = true;
    }
  }
  return earlier;
}

double BoundarySnapper::snap_end(double t) const {
  double later = span_.end_sec;
  bool found_later = false;
  for (const auto& seg : segments_) {
    if (seg.start_sec <= t && t <= seg.end_sec) return seg.end_sec;
    if (seg.end_sec >= t && (!found_later || seg.end_sec < later)) {
      later = seg.end_sec;
      found_later = true;
    }
  }
  return later;
}

ClipWindow BoundarySnapper::expand_and_snap(double start, double end) const {
  ClipWindow win;
  win.start = snap_start(clamp(start - options_.pad));
  win.end = snap_end(clamp(end + options_.pad));
  win.anchor_mid = (win.start + win.end) / 2.0;
  return win;
}

double BoundarySnapper::effective_min_len() const {
  return std::min(options_.min_len, span_.length());
}

void BoundarySnapper::enforce_length(ClipWindow& win) const {
  const double min_len = options_.min_len;
  const double max_len = options_.max_len;

  const double dur = win.duration();
  if (dur > max_len || dur < min_len) {
    const double half = (dur > max_len ? max_len : min_len) / 2.0;
    win.start = snap_start(clamp(win.anchor_mid - half));
    win.end = snap_end(clamp(win.anchor_mid + half));
  }

  if (win.duration() > max_len) win.end = clamp(win.start + max_len);

  if (win.duration() < min_len && span_.length() >= min_len) {
    win.start = clamp(win.anchor_mid - min_len / 2.0);
    win.end = clamp(win.anchor_mid + min_len / 2.0);
    // Near the transcript edges slide the window inward instead of shrinking it.
    if (win.start <= span_.start_sec) win.end = std::min(span_.end_sec, win.start + min_len);
    if (win.end >= span_.end_sec) win.start = std::max(span_.start_sec, win.end - min_len);
  }
}

ClipSet refine_clip_windows(const ClipSet& clips,
                            const Transcript& transcript,
                            const RefineOptions& options,
                            RefineStats* stats) {
  RefineStats local;
  ClipSet out;

  if (transcript.segments.empty()) {
    out.shorts = clips.shorts;
    std::stable_sort(out.shorts.begin(), out.shorts.end(),
                     [](const ClipCandidate& a, const ClipCandidate& b) { return a.start_time < b.start_time; });
    if (options.max_shorts > 0 && out.shorts.size() > size_t(options.max_shorts)) {
      out.shorts.resize(size_t(options.max_shorts));
    }
    if (stats) *stats = local;
    return out;
  }

  const BoundarySnapper snapper(transcript, options);

  std::vector<ClipWindow> windows;
  windows.reserve(clips.shorts.size());
  for (const auto& clip : clips.shorts) {
    if (clip.end_time <= clip.start_time) continue;
    ClipWindow win = snapper.expand_and_snap(clip.start_time, clip.end_time);
    win.title = clip.title;
    win.reason = clip.reason;
    win.score = clip.score;
    win.anchor_mid = clip.midpoint();
    windows.push_back(std::move(win));
  }
  std::stable_sort(windows.begin(), windows.end(), window_by_start);

  std::vector<ClipWindow> merged;
  for (auto& win : windows) {
    if (!merged.empty() && options.merge_gap > 0.0 && win.start <= merged.back().end + options.merge_gap) {
      ClipWindow& cur = merged.back();
      cur.end = std::max(cur.end, win.end);
      cur.anchor_mid = (cur.anchor_mid + win.anchor_mid) / 2.0;
      cur.merged = true;
      ++local.merged;
      continue;
    }
    merged.push_back(std::move(win));
  }

  std::vector<ClipWindow> refined;
  for (auto& win : merged) {
    snapper.enforce_length(win);
    if (win.duration() + kLengthEpsilon < snapper.effective_min_len()) {
      ++local.dropped_short;
      continue;
    }
    if (overlaps_any(win, refined)) {
      ++local.dropped_duplicate;
      continue;
    }
    refined.push_back(std::move(win));
  }

  backfill_windows(refined, snapper, options, local);

  std::stable_sort(refined.begin(), refined.end(), window_by_start);
  if (options.max_shorts > 0 && refined.size() > size_t(options.max_shorts)) {
    refined.resize(size_t(options.max_shorts));
  }

  out.shorts.reserve(refined.size());
  for (const auto& win : refined) out.shorts.push_back(to_candidate(win));
  if (stats) *stats = local;
  return out;
}
