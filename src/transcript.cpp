#include "transcript.h"

#include <algorithm>

TimeSpan transcript_span(const Transcript& transcript) {
  TimeSpan span;
  if (transcript.segments.empty()) return span;
  span.start_sec = transcript.segments.front().start_sec;
  span.end_sec = transcript.segments.front().end_sec;
  for (const auto& seg : transcript.segments) {
    span.start_sec = std::min(span.start_sec, seg.start_sec);
    span.end_sec = std::max(span.end_sec, seg.end_sec);
  }
  return span;
}

Transcript slice_transcript(const Transcript& transcript, double start_sec, double end_sec) {
  Transcript out;
  out.language = transcript.language;
  out.language_probability = transcript.language_probability;
  for (const auto& seg : transcript.segments) {
    if (seg.end_sec <= start_sec || seg.start_sec >= end_sec) continue;
    if (!out.text.empty()) out.text.push_back(' ');
    out.text += seg.text;
    out.segments.push_back(seg);
  }
  return out;
}
