#include "pipeline_config.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void read_number(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  const auto& v = j[key];
  if (!v.is_number()) {
    throw std::runtime_error(std::string("Config value '") + key + "' must be a number");
  }
  out = v.get<T>();
}

void read_bool(const json& j, const char* key, bool& out) {
  if (!j.contains(key)) return;
  const auto& v = j[key];
  if (!v.is_boolean()) {
    throw std::runtime_error(std::string("Config value '") + key + "' must be true or false");
  }
  out = v.get<bool>();
}

}  // namespace

void apply_config_json(const json& j, PipelineConfig& config) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");

  if (j.contains("target_shorts")) {
    read_number(j, "target_shorts", config.target_shorts);
    config.target_shorts_explicit = true;
  }
  read_number(j, "min_gap_seconds", config.min_gap_seconds);
  read_number(j, "min_len", config.min_len);
  read_number(j, "max_len", config.max_len);
  read_number(j, "pad", config.pad);
  read_number(j, "merge_gap", config.merge_gap);
  if (j.contains("min_shorts")) {
    read_number(j, "min_shorts", config.min_shorts);
    config.min_shorts_explicit = true;
  }
  read_number(j, "max_shorts", config.max_shorts);
  read_number(j, "chunk_minutes", config.chunk_minutes);
  read_number(j, "long_transcript_minutes", config.long_transcript_minutes);
  read_number(j, "long_transcript_target", config.long_transcript_target);
  read_number(j, "max_retries", config.max_retries);
  read_bool(j, "repair", config.repair);
  read_bool(j, "enrich", config.enrich);
}

PipelineConfig load_pipeline_config(const std::filesystem::path& path, PipelineConfig base) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open config: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();

  const json j = json::parse(ss.str(), nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("Config is not valid JSON: " + path.string());
  apply_config_json(j, base);
  return base;
}

PipelineConfig finalize_pipeline_config(PipelineConfig config, double transcript_seconds) {
  const double minutes = transcript_seconds / 60.0;
  if (!config.target_shorts_explicit && minutes > config.long_transcript_minutes) {
    const int scaled = static_cast<int>(std::ceil(minutes / 4.0));
    config.target_shorts = std::max(config.target_shorts, std::min(scaled, config.long_transcript_target));
  }
  if (config.max_shorts <= 0) config.max_shorts = std::max(config.target_shorts, 5);
  if (!config.min_shorts_explicit) config.min_shorts = std::min(config.min_shorts, config.max_shorts);
  return config;
}

void validate_pipeline_config(const PipelineConfig& c) {
  if (c.target_shorts < 1) throw std::runtime_error("target_shorts must be >= 1");
  if (c.min_len <= 0.0) throw std::runtime_error("min_len must be > 0");
  if (c.max_len < c.min_len) throw std::runtime_error("max_len must be >= min_len");
  if (c.pad < 0.0) throw std::runtime_error("pad must be >= 0");
  if (c.merge_gap < 0.0) throw std::runtime_error("merge_gap must be >= 0");
  if (c.min_gap_seconds < 0.0) throw std::runtime_error("min_gap_seconds must be >= 0");
  if (c.chunk_minutes < 0.0) throw std::runtime_error("chunk_minutes must be >= 0");
  if (c.max_retries < 0) throw std::runtime_error("max_retries must be >= 0");
  if (c.min_shorts < 0) throw std::runtime_error("min_shorts must be >= 0");
  if (c.max_shorts > 0 && c.min_shorts > c.max_shorts) {
    throw std::runtime_error("min_shorts (" + std::to_string(c.min_shorts) + ") exceeds max_shorts (" +
                             std::to_string(c.max_shorts) + ")");
  }
}

std::string describe_pipeline_config(const PipelineConfig& c) {
  std::ostringstream ss;
  ss << "target_shorts=" << c.target_shorts << " min_gap=" << c.min_gap_seconds << "s"
     << " len=[" << c.min_len << "," << c.max_len << "]s pad=" << c.pad << "s"
     << " merge_gap=" << c.merge_gap << "s shorts=[" << c.min_shorts << "," << c.max_shorts << "]";
  if (c.chunk_minutes > 0.0) ss << " chunk=" << c.chunk_minutes << "min";
  if (!c.repair) ss << " repair=off";
  if (!c.enrich) ss << " enrich=off";
  return ss.str();
}
