#pragma once

#include <string>
#include <vector>

struct TranscriptWord {
  std::string word;
  double start_sec = 0.0;
  double end_sec = 0.0;
  double probability = 0.0;
  std::string speaker;  // empty when diarization did not run
};

struct TranscriptSegment {
  double start_sec = 0.0;
  double end_sec = 0.0;
  std::string text;
  std::string speaker;
  std::vector<TranscriptWord> words;
};

// Segments are sorted by start and satisfy 0 <= start < end.
struct Transcript {
  std::string text;
  std::vector<TranscriptSegment> segments;
  std::string language;
  double language_probability = 0.0;
};

struct TimeSpan {
  double start_sec = 0.0;
  double end_sec = 0.0;
  double length() const { return end_sec - start_sec; }
};

// [min segment start, max segment end]; {0,0} for an empty transcript.
TimeSpan transcript_span(const Transcript& transcript);

// Segments overlapping [start_sec, end_sec) as a standalone transcript (times stay absolute).
Transcript slice_transcript(const Transcript& transcript, double start_sec, double end_sec);
