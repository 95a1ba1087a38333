#pragma once

#include "clip_types.h"
#include "transcript.h"

#include <filesystem>
#include <string>

// Read an SRT subtitle file as a transcript (one segment per cue).
Transcript read_srt_transcript(const std::filesystem::path& path, const std::string& language);
Transcript parse_srt_transcript(const std::string& content, const std::string& language);

// One cue per clip: the title as cue text, the reason on a second line.
void write_clips_srt(const std::filesystem::path& path, const ClipSet& clips);
