#include "srt_io.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <stdexcept>

static bool parse_srt_time(const std::string& s, double& out) {
  // "00:00:05,440" (a '.' before the millis is tolerated)
  int hh = 0, mm = 0, ss = 0, ms = 0;
  char c1, c2, c3;
  std::stringstream ssin(s);
  ssin >> hh >> c1 >> mm >> c2 >> ss >> c3 >> ms;
  if (!ssin || c1 != ':' || c2 != ':' || (c3 != ',' && c3 != '.')) return false;
  out = double(hh) * 3600.0 + double(mm) * 60.0 + double(ss) + double(ms) / 1000.0;
  return true;
}

static std::string format_srt_time(double sec) {
  if (sec < 0) sec = 0;
  const int hh = int(sec / 3600.0);
  sec -= double(hh) * 3600.0;
  const int mm = int(sec / 60.0);
  sec -= double(mm) * 60.0;
  const int ss = int(sec);
  const int ms = int((sec - double(ss)) * 1000.0 + 0.5);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d,%03d", hh, mm, ss, std::min(ms, 999));
  return std::string(buf);
}

static std::string strip_spaces(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c != ' ' && c != '\t') out.push_back(c);
  }
  return out;
}

Transcript parse_srt_transcript(const std::string& raw, const std::string& language) {
  std::string content = raw;
  // Handle UTF-8 BOM.
  if (content.size() >= 3 && (unsigned char)content[0] == 0xEF && (unsigned char)content[1] == 0xBB &&
      (unsigned char)content[2] == 0xBF) {
    content.erase(0, 3);
  }

  Transcript t;
  t.language = language;
  std::stringstream ss(content);
  std::string line;
  std::regex idx_re(R"(^\d+$)");
  while (std::getline(ss, line)) {
    if (line.size() && line.back() == '\r') line.pop_back();
    if (!std::regex_match(line, idx_re)) continue;
    if (!std::getline(ss, line)) break;
    if (line.size() && line.back() == '\r') line.pop_back();
    const auto arrow = line.find("-->");
    if (arrow == std::string::npos) continue;

    TranscriptSegment seg;
    const bool times_ok = parse_srt_time(strip_spaces(line.substr(0, arrow)), seg.start_sec) &&
                          parse_srt_time(strip_spaces(line.substr(arrow + 3)), seg.end_sec);

    while (std::getline(ss, line)) {
      if (line.size() && line.back() == '\r') line.pop_back();
      if (line.empty()) break;
      if (!seg.text.empty()) seg.text.push_back(' ');
      seg.text += line;
    }
    if (!times_ok || seg.end_sec <= seg.start_sec) continue;

    if (!t.text.empty()) t.text.push_back(' ');
    t.text += seg.text;
    t.segments.push_back(std::move(seg));
  }
  std::stable_sort(t.segments.begin(), t.segments.end(),
                   [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start_sec < b.start_sec; });
  return t;
}

Transcript read_srt_transcript(const std::filesystem::path& path, const std::string& language) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open " + path.string());
  std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return parse_srt_transcript(content, language);
}

void write_clips_srt(const std::filesystem::path& path, const ClipSet& clips) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to write " + path.string());
  for (size_t i = 0; i < clips.shorts.size(); ++i) {
    const auto& c = clips.shorts[i];
    f << (i + 1) << "\n";
    f << format_srt_time(c.start_time) << " --> " << format_srt_time(c.end_time) << "\n";
    f << c.title << "\n";
    if (!c.reason.empty()) f << c.reason << "\n";
    f << "\n";
  }
}
