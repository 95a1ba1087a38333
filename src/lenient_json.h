#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// Candidate list recovered from a generation reply, before schema coercion.
struct ExtractedPayload {
  nlohmann::json shorts;              // usually an array; may be a lone object or junk
  std::optional<int> declared_total;  // "total_shorts" when the reply carried one
  std::string strategy;               // cascade step that produced this payload
  size_t salvage_skipped = 0;         // salvage only: triples dropped for bad times
};

using ExtractionStep = std::optional<ExtractedPayload> (*)(const std::string&);

struct NamedExtractionStep {
  const char* name;
  ExtractionStep run;
  bool wants_repaired_text;  // salvage reads the cleaned reply as-is
};

// --- Preprocessing -----------------------------------------------------------

// Removes <think>...</think> style blocks (think/thinking/reasoning/reflection).
// A dangling closing tag drops everything before it.
std::string strip_reasoning_blocks(const std::string& text);

// Removes ``` fence markers together with their language tag.
std::string strip_code_fences(const std::string& text);

// strip_reasoning_blocks + strip_code_fences + trim.
std::string clean_generation_text(const std::string& text);

// --- Repair transforms (string-literal aware) ---------------------------------

std::string strip_json_comments(const std::string& text);

// Values of start/end keys that parse as times ("10:56.39", "12.5s", bare
// 1:10:56) are rewritten to numeric seconds literals.
std::string rewrite_time_field_values(const std::string& text);

// "} {" -> "}, {"
std::string insert_missing_object_commas(const std::string& text);

// ",]" / ",}" -> "]" / "}"
std::string remove_trailing_commas(const std::string& text);

// All repair transforms in order.
std::string repair_json_text(const std::string& text);

// Parses text as-is, then repaired. nullopt when both fail.
std::optional<nlohmann::json> parse_json_lenient(const std::string& text);

// Index of the bracket closing the one at open_pos, or npos.
size_t find_matching_bracket(const std::string& text, size_t open_pos);

// --- Extraction cascade --------------------------------------------------------

// Array-valued keys accepted as the candidate list.
const std::vector<std::string>& candidate_list_keys();

std::optional<ExtractedPayload> extract_keyed_object(const std::string& text);
std::optional<ExtractedPayload> extract_outermost_object(const std::string& text);
std::optional<ExtractedPayload> extract_keyed_array(const std::string& text);
std::optional<ExtractedPayload> extract_bare_array(const std::string& text);
std::optional<ExtractedPayload> salvage_candidate_fields(const std::string& text);

const std::vector<NamedExtractionStep>& extraction_cascade();

// Cleans the reply and runs the cascade; first success wins.
// nullopt means total extraction failure (an empty list is a success).
std::optional<ExtractedPayload> extract_candidates(const std::string& reply);
