#pragma once

#include "clip_types.h"
#include "transcript.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

// Whole file as bytes; throws std::runtime_error when it cannot be opened.
std::string read_text_file(const std::filesystem::path& path);

// Parse a transcript from JSON text.
// Supports: {"text", "segments": [...], "language", "language_probability"} or a bare segment array.
// Segment fields: start, end, text (required); speaker, words (optional).
// Segments with end <= start or a negative start are dropped; the rest are sorted by start.
Transcript parse_transcript_json(const std::string& content, size_t* dropped_segments = nullptr);

Transcript read_transcript_json(const std::filesystem::path& path, size_t* dropped_segments = nullptr);

// {"shorts": [{title,start_time,end_time,reason,score}], "total_shorts": N}, times rounded to 2 decimals.
nlohmann::json clip_set_to_json(const ClipSet& clips);
std::string format_clip_set_json(const ClipSet& clips);
void write_clip_set_json(const std::filesystem::path& path, const ClipSet& clips);

nlohmann::json clips_to_json(const std::vector<ClipCandidate>& clips);

double round_centis(double seconds);
