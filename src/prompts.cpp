#include "prompts.h"

#include "utf8_utils.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

constexpr size_t kRepairInputChars = 12000;

const char* const kShortsShape = R"({
  "shorts": [
    {
      "title": "Compelling Title",
      "start_time": 10.5,
      "end_time": 45.2,
      "reason": "Brief reason"
    }
  ],
  "total_shorts": 1
})";

const char* const kSelectionSystem = R"(You are an API that converts video transcripts into a JSON array of video clips.

Select engaging segments (15-60 seconds each) from the provided transcript. Each clip must stand alone and feel complete, with enough context to be funny, informative or surprising. Prefer 20-40s; only go near 60s if retention is exceptional.

A clip should hit at least 3 of these:
1) A strong hook in the first sentence (a bold claim, a question people care about, an emotional shift).
2) Self-contained context: it works without backstory.
3) Emotional or opinion intensity (surprise, disagreement, humor, vulnerability).
4) One clear idea that can be summarized in one sentence.
5) Quote-ability: it would work as a bold on-screen caption.
6) Loop potential: it ends on a punchline, cliffhanger or payoff.

Output ONLY valid JSON with this structure:
)";

const char* const kSelectionRules = R"(

Rules:
1. "start_time" and "end_time" are plain numbers of seconds, e.g. 10.5. No units, no timecodes like 00:10:30.
2. "title" is a specific headline for the clip's topic. No generic or filler titles.
3. "reason" is required and must reference the actual content (hook, twist, punchline, claim, conflict or payoff).
4. Spread the clips across the whole transcript; avoid back-to-back clips.
5. If there are no good clips, return {"shorts": [], "total_shorts": 0}.
6. Allowed keys per clip: "title", "start_time", "end_time", "reason". No other keys.
7. No reasoning, no <think> tags, no markdown fences.
)";

const char* const kRepairSystem = R"(You are a strict JSON repair tool.

Convert the given text into ONLY a valid JSON object that matches:
)";

const char* const kRepairRules = R"(

Rules:
1. Output ONLY valid JSON, no extra text.
2. "start_time" and "end_time" must be numbers (seconds).
3. If the input lacks valid shorts, output: {"shorts": [], "total_shorts": 0}
)";

const char* const kEnrichmentSystem = R"(You write short, coherent titles and reasons for video clips.

You will be given clip excerpts, each with a transcript window.
Return ONLY valid JSON. No extra text, no markdown.

Output format:
{
  "items": [
    { "index": 0, "title": "Specific headline", "reason": "1-2 sentences that reference the excerpt." }
  ]
}

Rules:
1) Each title is specific and descriptive (4-12 words). No generic filler.
2) Each reason is 1-2 complete sentences, 90-180 characters, referencing concrete details from the excerpt.
3) Do not invent facts that are not in the excerpt.
4) Write in the same language as the excerpt.
)";

std::string fmt_seconds(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

}  // namespace

BrandInfo read_brand_info(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open brand file: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  const json j = json::parse(ss.str(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::runtime_error("Brand file must contain a JSON object: " + path.string());
  }

  auto str = [&j](const char* key) {
    return (j.contains(key) && j[key].is_string()) ? j[key].get<std::string>() : std::string();
  };
  BrandInfo b;
  b.name = str("name");
  b.description = str("description");
  b.target_audience = str("target_audience");
  b.tone = str("tone");
  b.style_preferences = str("style_preferences");
  if (j.contains("key_topics") && j["key_topics"].is_array()) {
    for (const auto& t : j["key_topics"]) {
      if (t.is_string()) b.key_topics.push_back(t.get<std::string>());
    }
  }
  return b;
}

std::string format_transcript_for_prompt(const Transcript& transcript) {
  std::string out;
  for (const auto& seg : transcript.segments) {
    out += "[" + fmt_seconds(seg.start_sec) + "s - " + fmt_seconds(seg.end_sec) + "s] ";
    if (!seg.speaker.empty()) out += seg.speaker + ": ";
    out += seg.text;
    out.push_back('\n');
  }
  if (!out.empty()) out.pop_back();
  return out;
}

std::string format_brand_context(const BrandInfo& brand) {
  if (brand.empty()) return std::string();
  std::string out = "Brand Context:\n";
  if (!brand.name.empty()) out += "Brand Name: " + brand.name + "\n";
  if (!brand.description.empty()) out += "Brand Description: " + brand.description + "\n";
  if (!brand.target_audience.empty()) out += "Target Audience: " + brand.target_audience + "\n";
  if (!brand.tone.empty()) out += "Desired Tone: " + brand.tone + "\n";
  if (!brand.key_topics.empty()) {
    out += "Key Topics: ";
    for (size_t i = 0; i < brand.key_topics.size(); ++i) {
      if (i) out += ", ";
      out += brand.key_topics[i];
    }
    out += "\n";
  }
  if (!brand.style_preferences.empty()) out += "Style Preferences: " + brand.style_preferences + "\n";
  return out;
}

std::vector<ChatMessage> build_selection_prompt(const Transcript& transcript, int target_shorts,
                                                double min_gap_seconds, const BrandInfo& brand) {
  std::ostringstream user;
  user << "Analyze the following transcript and return the JSON object.\n"
       << "Return up to " << target_shorts << " clips.\n"
       << "Keep clip midpoints at least " << min_gap_seconds << " seconds apart.\n\n"
       << "Transcript:\n"
       << format_transcript_for_prompt(transcript) << "\n";
  const std::string brand_context = format_brand_context(brand);
  if (!brand_context.empty()) user << "\n" << brand_context;

  return {
      {"system", std::string(kSelectionSystem) + kShortsShape + kSelectionRules},
      {"user", user.str()},
  };
}

std::vector<ChatMessage> build_repair_prompt(const std::string& failed_reply) {
  std::string content = failed_reply.substr(0, utf8::prefix_bytes(failed_reply, kRepairInputChars));
  return {
      {"system", std::string(kRepairSystem) + kShortsShape + kRepairRules},
      {"user", "Fix this into valid JSON:\n" + content + "\n"},
  };
}

std::vector<ChatMessage> build_enrichment_prompt(const std::vector<EnrichmentItem>& items) {
  json arr = json::array();
  for (const auto& item : items) {
    json entry = {{"index", item.index}, {"excerpt", item.excerpt}};
    if (item.clip) {
      entry["start_time"] = item.clip->start_time;
      entry["end_time"] = item.clip->end_time;
      entry["current_title"] = item.clip->title;
      entry["current_reason"] = item.clip->reason;
    }
    arr.push_back(std::move(entry));
  }
  return {
      {"system", kEnrichmentSystem},
      {"user", "Create titles and reasons for these clips:\n" +
                   arr.dump(2, ' ', false, json::error_handler_t::replace) + "\n"},
  };
}
