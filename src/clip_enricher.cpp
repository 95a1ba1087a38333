#include "clip_enricher.h"

#include "lenient_json.h"
#include "prompts.h"
#include "text_util.h"
#include "utf8_utils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cmath>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace {

constexpr size_t kTitleMaxChars = 90;
constexpr size_t kReasonMinChars = 90;
constexpr size_t kReasonMaxChars = 180;
constexpr size_t kReasonMaxSentences = 3;
constexpr size_t kReasonMinWords = 5;
constexpr double kAsciiLetterShare = 0.6;
constexpr const char* kPlaceholderReason = "Standalone moment selected from the transcript.";

const std::set<std::string>& generic_titles() {
  static const std::set<std::string> titles = {
      "compelling title", "untitled segment", "untitled", "auto clip", "clip", "short",
      "video clip", "short clip", "interesting moment", "great moment", "key moment",
      "highlight", "engaging clip", "viral clip", "title", "specific headline", "funny moment",
      "best moment", "must watch", "watch this", "amazing clip", "new clip",
  };
  return titles;
}

const std::set<std::string>& filler_words() {
  static const std::set<std::string> words = {
      "and", "but", "so", "or", "because", "um", "uh", "like", "well", "yeah",
      "then", "also", "just", "anyway", "okay", "ok", "oh",
  };
  return words;
}

const std::set<std::string>& lead_words_to_trim() {
  static const std::set<std::string> words = {
      "a", "an", "the", "i", "we", "you", "he", "she", "they", "it",
      "so", "and", "but", "um", "uh", "well", "oh", "okay", "yeah",
  };
  return words;
}

const char* const kAutoMarkers[] = {
    "auto-generated", "auto generated", "autogenerated", "generated automatically",
    "strong standalone moment", "brief reason",
};

const char* const kLatinLanguages[] = {
    "en", "es", "fr", "de", "it", "pt", "nl", "sv", "da", "no", "nb", "nn", "fi", "pl", "cs", "sk",
    "sl", "hr", "bs", "ro", "hu", "tr", "id", "ms", "vi", "tl", "ca", "eu", "gl", "et", "lv", "lt",
    "sq", "sw", "af", "cy", "ga", "is", "mt", "uz", "az", "jw", "su", "ha", "yo", "so", "haw", "ln",
};
const char* const kArabicLanguages[] = {"ar", "fa", "ur", "ps", "sd", "ug"};
const char* const kDevanagariLanguages[] = {"hi", "mr", "ne", "sa", "bho", "mai"};

// Lowercase, trimmed, without surrounding quotes or trailing punctuation.
std::string normalize_title(const std::string& title) {
  std::string t = to_lower_ascii(collapse_whitespace(title));
  while (!t.empty() && (t.front() == '"' || t.front() == '\'')) t.erase(t.begin());
  while (!t.empty() && std::strchr("\"'.!?:;,", t.back()) != nullptr) t.pop_back();
  return t;
}

std::string strip_word_punct(const std::string& word) {
  std::string w = word;
  while (!w.empty() && std::ispunct(static_cast<unsigned char>(w.back()))) w.pop_back();
  while (!w.empty() && std::ispunct(static_cast<unsigned char>(w.front()))) w.erase(w.begin());
  return to_lower_ascii(w);
}

bool in_list(const std::string& code, const char* const* begin, const char* const* end) {
  return std::find_if(begin, end, [&code](const char* c) { return code == c; }) != end;
}

std::string ensure_period(std::string s) {
  while (!s.empty() && std::strchr(" ,;:-!?", s.back()) != nullptr) s.pop_back();
  if (s.empty()) return s;
  if (s.back() != '.') s.push_back('.');
  return s;
}

// Words of a clause after leading articles, pronouns and fillers.
std::vector<std::string> content_words(const std::string& clause) {
  const auto words = split_words(clause);
  size_t first = 0;
  while (first < words.size() && lead_words_to_trim().count(strip_word_punct(words[first]))) ++first;
  return std::vector<std::string>(words.begin() + static_cast<std::ptrdiff_t>(first), words.end());
}

// First clause with at least two content words, else the whole sentence.
std::vector<std::string> lead_clause_words(const std::string& sentence) {
  static const char* const kSeparators[] = {",", ";", ":", " - ", "\xE2\x80\x94", "\xE2\x80\x93", "("};
  size_t begin = 0;
  while (begin < sentence.size()) {
    size_t cut = sentence.size();
    size_t sep_len = 0;
    for (const char* sep : kSeparators) {
      const size_t pos = sentence.find(sep, begin);
      if (pos != std::string::npos && pos > begin && pos < cut) {
        cut = pos;
        sep_len = std::strlen(sep);
      }
    }
    auto words = content_words(sentence.substr(begin, cut - begin));
    if (words.size() >= 2) return words;
    if (sep_len == 0) break;
    begin = cut + sep_len;
  }
  auto words = content_words(sentence);
  return words.size() >= 2 ? words : split_words(sentence);
}

std::optional<std::string> patch_text(const json& item, const char* key) {
  if (!item.contains(key) || !item[key].is_string()) return std::nullopt;
  std::string s = collapse_whitespace(item[key].get<std::string>());
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<json> enrichment_items(const std::string& reply) {
  const std::string text = clean_generation_text(reply);
  if (text.empty()) return std::nullopt;

  auto parsed = parse_json_lenient(text);
  if (!parsed) {
    const size_t open = text.find('{');
    const size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close <= open) return std::nullopt;
    parsed = parse_json_lenient(text.substr(open, close - open + 1));
    if (!parsed) return std::nullopt;
  }
  if (parsed->is_array()) return parsed;
  if (parsed->is_object() && parsed->contains("items") && (*parsed)["items"].is_array()) {
    return (*parsed)["items"];
  }
  return std::nullopt;
}

std::string numbered_placeholder(size_t index) { return "Clip " + std::to_string(index + 1); }

}  // namespace

std::string synthesize_unique_title(const std::string& excerpt, size_t index, std::set<std::string>& taken) {
  for (const auto& sentence : split_sentences(excerpt)) {
    const std::string title = synthesize_title(sentence);
    const std::string norm = normalize_title(title);
    if (title.empty() || is_generic_title(title) || taken.count(norm)) continue;
    taken.insert(norm);
    return title;
  }
  std::string placeholder = numbered_placeholder(index);
  for (size_t n = 2; taken.count(normalize_title(placeholder)); ++n) {
    placeholder = numbered_placeholder(index) + " (" + std::to_string(n) + ")";
  }
  taken.insert(normalize_title(placeholder));
  return placeholder;
}

Script expected_script(const std::string& language) {
  std::string code = to_lower_ascii(trim_copy(language));
  const size_t dash = code.find_first_of("-_");
  if (dash != std::string::npos) code.erase(dash);
  if (code.empty()) return Script::Unknown;
  if (in_list(code, std::begin(kLatinLanguages), std::end(kLatinLanguages))) return Script::Latin;
  if (in_list(code, std::begin(kArabicLanguages), std::end(kArabicLanguages))) return Script::Arabic;
  if (in_list(code, std::begin(kDevanagariLanguages), std::end(kDevanagariLanguages))) return Script::Devanagari;
  return Script::Unknown;
}

bool text_matches_script(const std::string& text, Script script) {
  if (script == Script::Unknown) return true;
  size_t letters = 0, ascii = 0, arabic = 0, devanagari = 0;
  for (uint32_t cp : utf8::codepoints(text)) {
    if (utf8::is_arabic(cp)) ++arabic;
    if (utf8::is_devanagari(cp)) ++devanagari;
    if (!utf8::is_letter(cp)) continue;
    ++letters;
    if (cp < 0x80) ++ascii;
  }
  if (letters == 0) return true;
  switch (script) {
    case Script::Latin:
      return arabic == 0 && devanagari == 0 && double(ascii) / double(letters) >= kAsciiLetterShare;
    case Script::Arabic:
      return arabic > 0;
    case Script::Devanagari:
      return devanagari > 0;
    case Script::Unknown:
      break;
  }
  return true;
}

bool is_generic_title(const std::string& title) {
  static const std::regex numbered_re(R"(^(clip|short|segment|highlight|moment|part)\s*#?\s*\d+$)");
  const std::string t = normalize_title(title);
  if (t.empty()) return true;
  if (generic_titles().count(t)) return true;
  return t.size() < 40 && std::regex_match(t, numbered_re);
}

bool starts_with_filler_word(const std::string& title) {
  const auto words = split_words(title);
  if (words.empty()) return false;
  const unsigned char first = static_cast<unsigned char>(words.front()[0]);
  if (!std::islower(first)) return false;
  return filler_words().count(strip_word_punct(words.front())) > 0;
}

bool is_weak_reason(const std::string& reason) {
  const std::string r = collapse_whitespace(reason);
  if (r.empty() || word_count(r) < kReasonMinWords) return true;
  const std::string lower = to_lower_ascii(r);
  for (const char* marker : kAutoMarkers) {
    if (starts_with(lower, marker)) return true;
  }
  return false;
}

std::string clip_excerpt(const Transcript& transcript, const ClipCandidate& clip, size_t max_chars) {
  std::string text;
  for (const auto& seg : transcript.segments) {
    if (seg.end_sec <= clip.start_time || seg.start_sec >= clip.end_time) continue;
    if (!text.empty()) text.push_back(' ');
    text += seg.text;
  }

  if (text.empty()) {
    const TranscriptSegment* nearest = nullptr;
    double best = 0.0;
    for (const auto& seg : transcript.segments) {
      const double d = std::fabs((seg.start_sec + seg.end_sec) / 2.0 - clip.midpoint());
      if (!nearest || d < best) {
        nearest = &seg;
        best = d;
      }
    }
    if (nearest) text = nearest->text;
  }
  return truncate_at_word(collapse_whitespace(text), max_chars);
}

std::vector<ClipQuality> assess_clip_quality(const ClipSet& clips, const std::string& language) {
  const Script script = expected_script(language);
  std::vector<ClipQuality> out(clips.shorts.size());
  std::set<std::string> seen_titles;

  for (size_t i = 0; i < clips.shorts.size(); ++i) {
    const auto& clip = clips.shorts[i];
    ClipQuality& q = out[i];

    const std::string norm = normalize_title(clip.title);
    if (is_generic_title(clip.title)) {
      q.title_issue = "generic";
    } else if (starts_with_filler_word(clip.title)) {
      q.title_issue = "filler opening";
    } else if (seen_titles.count(norm)) {
      q.title_issue = "duplicate";
    } else if (!text_matches_script(clip.title, script)) {
      q.title_issue = "language mismatch";
    }
    if (!norm.empty()) seen_titles.insert(norm);

    if (is_weak_reason(clip.reason)) {
      q.reason_issue = "weak";
    } else if (!text_matches_script(clip.reason, script)) {
      q.reason_issue = "language mismatch";
    }

    q.title_flagged = !q.title_issue.empty();
    q.reason_flagged = !q.reason_issue.empty();
  }
  return out;
}

ClipPatchMap parse_enrichment_reply(const std::string& reply, size_t clip_count) {
  ClipPatchMap patches;
  const auto items = enrichment_items(reply);
  if (!items) return patches;

  for (const auto& item : *items) {
    if (!item.is_object() || !item.contains("index") || !item["index"].is_number()) continue;
    const double raw_index = item["index"].get<double>();
    if (raw_index < 0.0 || raw_index != std::floor(raw_index) || raw_index >= double(clip_count)) continue;

    ClipPatch patch;
    patch.title = patch_text(item, "title");
    patch.reason = patch_text(item, "reason");
    if (!patch.title && !patch.reason) continue;
    patches[static_cast<size_t>(raw_index)] = std::move(patch);
  }
  return patches;
}

ClipSet apply_clip_patches(const ClipSet& clips, const ClipPatchMap& patches) {
  ClipSet out = clips;
  for (const auto& kv : patches) {
    if (kv.first >= out.shorts.size()) continue;
    ClipCandidate& c = out.shorts[kv.first];
    if (kv.second.title) c.title = *kv.second.title;
    if (kv.second.reason) c.reason = *kv.second.reason;
  }
  return out;
}

std::string synthesize_title(const std::string& excerpt) {
  const auto sentences = split_sentences(excerpt);
  if (sentences.empty()) return std::string();

  std::string title;
  for (const auto& word : lead_clause_words(sentences.front())) {
    if (!title.empty()) title.push_back(' ');
    title += word;
  }
  while (!title.empty() && std::strchr(".!?", title.back()) != nullptr) title.pop_back();
  title = truncate_at_word(title, kTitleMaxChars);
  while (!title.empty() && std::strchr(",;:-", title.back()) != nullptr) title.pop_back();
  if (!title.empty() && std::islower(static_cast<unsigned char>(title[0]))) {
    title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));
  }
  return title;
}

std::string synthesize_reason(const std::string& excerpt) {
  const auto sentences = split_sentences(excerpt);
  std::string reason;
  for (size_t i = 0; i < sentences.size() && i < kReasonMaxSentences; ++i) {
    const std::string next = reason.empty() ? sentences[i] : reason + " " + sentences[i];
    if (!reason.empty() && utf8::codepoint_count(next) > kReasonMaxChars) break;
    reason = next;
    if (utf8::codepoint_count(reason) >= kReasonMinChars) break;
  }
  if (utf8::codepoint_count(reason) > kReasonMaxChars) reason = truncate_at_word(reason, kReasonMaxChars - 1);
  return ensure_period(reason);
}

ClipSet enrich_clip_set(const ClipSet& clips,
                        const Transcript& transcript,
                        const GenerateFn* generate,
                        Logger& log,
                        EnrichStats* stats) {
  EnrichStats local;
  const auto quality = assess_clip_quality(clips, transcript.language);

  std::vector<std::string> excerpts;
  excerpts.reserve(clips.shorts.size());
  for (const auto& clip : clips.shorts) excerpts.push_back(clip_excerpt(transcript, clip));

  std::vector<EnrichmentItem> items;
  for (size_t i = 0; i < quality.size(); ++i) {
    if (!quality[i].flagged()) continue;
    std::ostringstream ss;
    ss << "[enrich] clip " << i << " flagged: title=" << (quality[i].title_flagged ? quality[i].title_issue : "ok")
       << " reason=" << (quality[i].reason_flagged ? quality[i].reason_issue : "ok");
    log.debug(ss.str());
    items.push_back({i, &clips.shorts[i], excerpts[i]});
  }
  local.flagged = items.size();
  if (items.empty()) {
    if (stats) *stats = local;
    return clips;
  }

  ClipSet current = clips;
  if (generate && *generate) {
    try {
      const std::string reply = (*generate)(build_enrichment_prompt(items));
      ClipPatchMap patches = parse_enrichment_reply(reply, clips.shorts.size());
      // Only flagged clips may be rewritten.
      for (auto it = patches.begin(); it != patches.end();) {
        it = quality[it->first].flagged() ? std::next(it) : patches.erase(it);
      }
      local.patched_by_generation = patches.size();
      current = apply_clip_patches(clips, patches);
    } catch (const std::exception& e) {
      local.request_failed = true;
      log.warn(std::string("[enrich] enrichment request failed, using transcript text: ") + e.what());
    }
  }

  const auto remaining = assess_clip_quality(current, transcript.language);
  std::set<std::string> taken_titles;
  for (size_t i = 0; i < remaining.size(); ++i) {
    if (!remaining[i].title_flagged) taken_titles.insert(normalize_title(current.shorts[i].title));
  }

  ClipPatchMap local_patches;
  for (size_t i = 0; i < remaining.size(); ++i) {
    if (!remaining[i].flagged()) continue;
    ClipPatch patch;
    if (remaining[i].title_flagged) patch.title = synthesize_unique_title(excerpts[i], i, taken_titles);
    if (remaining[i].reason_flagged) {
      std::string reason = synthesize_reason(excerpts[i]);
      patch.reason = reason.empty() ? std::string(kPlaceholderReason) : reason;
    }
    local_patches[i] = std::move(patch);
  }
  local.synthesized_locally = local_patches.size();

  {
    std::ostringstream ss;
    ss << "[enrich] flagged=" << local.flagged << " patched=" << local.patched_by_generation
       << " synthesized=" << local.synthesized_locally;
    log.info(ss.str());
  }
  if (stats) *stats = local;
  return apply_clip_patches(current, local_patches);
}
