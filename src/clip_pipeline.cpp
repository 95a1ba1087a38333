#include "clip_pipeline.h"

#include "lenient_json.h"
#include "schema_coerce.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>

namespace {

std::string stage(const std::string& tag, const char* name) {
  return tag.empty() ? std::string("[") + name + "] " : tag + " [" + name + "] ";
}

std::string describe_window(const ClipCandidate& c) {
  std::ostringstream ss;
  ss.setf(std::ios::fixed);
  ss.precision(2);
  ss << "[" << c.start_time << "s - " << c.end_time << "s]";
  return ss.str();
}

RefineOptions refine_options(const PipelineConfig& config) {
  RefineOptions o;
  o.min_len = config.min_len;
  o.max_len = config.max_len;
  o.pad = config.pad;
  o.merge_gap = config.merge_gap;
  o.min_shorts = config.min_shorts;
  o.max_shorts = config.max_shorts;
  return o;
}

std::vector<ClipCandidate> select_logged(const std::vector<ClipCandidate>& candidates,
                                         const Transcript& transcript,
                                         int target,
                                         double min_gap,
                                         Logger& log,
                                         const std::string& tag,
                                         SelectionStats* stats_out) {
  SelectionStats stats;
  auto selected = select_clips(candidates, transcript, target, min_gap, &stats);
  std::ostringstream ss;
  ss << stage(tag, "select") << selected.size() << "/" << candidates.size() << " candidates kept (buckets="
     << stats.bucket_winners << " gap=" << stats.gap_additions << " relaxed=" << stats.relaxed_additions << ")";
  log.info(ss.str());
  if (stats_out) *stats_out = stats;
  return selected;
}

std::vector<ClipCandidate> run_chunked(const Transcript& transcript,
                                       const PipelineConfig& config,
                                       const BrandInfo& brand,
                                       const GenerateFn& generate,
                                       Logger& log,
                                       PipelineTrace* trace,
                                       const ProgressFn& progress) {
  const TimeSpan span = transcript_span(transcript);
  const double chunk_seconds = config.chunk_minutes * 60.0;
  const size_t total = std::max<size_t>(1, static_cast<size_t>(std::ceil(span.length() / chunk_seconds)));
  if (trace) trace->chunks_total = total;

  std::vector<ClipCandidate> pooled;
  size_t failed = 0;
  for (size_t i = 0; i < total; ++i) {
    const double cs = span.start_sec + double(i) * chunk_seconds;
    const double ce = (i + 1 == total) ? span.end_sec : std::min(span.end_sec, cs + chunk_seconds);
    const std::string tag = "[chunk " + std::to_string(i + 1) + "/" + std::to_string(total) + "]";

    const Transcript slice = slice_transcript(transcript, cs, ce);
    if (slice.segments.empty()) {
      log.debug(tag + " no segments, skipped");
      if (progress) progress(i + 1, total);
      continue;
    }

    try {
      const int target = chunk_target(config.target_shorts, ce - cs, span.length());
      auto candidates = request_candidates(slice, target, config, brand, generate, log, trace, tag);

      std::vector<ClipCandidate> inside;
      for (const auto& c : candidates) {
        if (c.end_time <= cs || c.start_time >= ce) {
          log.debug(tag + " dropped candidate outside chunk " + describe_window(c));
          continue;
        }
        inside.push_back(c);
      }
      auto chosen = select_logged(inside, slice, target, config.min_gap_seconds, log, tag, nullptr);
      pooled.insert(pooled.end(), chosen.begin(), chosen.end());
    } catch (const std::exception& e) {
      ++failed;
      log.warn(tag + " failed, skipping chunk: " + e.what());
    }
    if (progress) progress(i + 1, total);
  }

  if (trace) trace->chunks_failed = failed;
  if (failed == total) {
    log.warn("[chunk] every chunk failed; continuing with synthesized clips");
  }
  return pooled;
}

}  // namespace

int chunk_target(int target_shorts, double chunk_seconds, double span_seconds) {
  if (span_seconds <= 0.0) return std::max(1, target_shorts);
  const double share = std::min(1.0, std::max(0.0, chunk_seconds / span_seconds));
  return std::max(1, static_cast<int>(std::ceil(double(target_shorts) * share)));
}

std::vector<ClipCandidate> request_candidates(const Transcript& transcript,
                                              int target_shorts,
                                              const PipelineConfig& config,
                                              const BrandInfo& brand,
                                              const GenerateFn& generate,
                                              Logger& log,
                                              PipelineTrace* trace,
                                              const std::string& tag) {
  const std::string reply =
      generate(build_selection_prompt(transcript, target_shorts, config.min_gap_seconds, brand));
  if (trace) trace->responses.push_back(reply);

  auto payload = extract_candidates(reply);
  if (!payload && config.repair) {
    log.warn(stage(tag, "repair") + "no candidate list in reply (" + std::to_string(reply.size()) +
             " bytes), requesting a JSON repair");
    const std::string repaired = generate(build_repair_prompt(reply));
    if (trace) {
      trace->responses.push_back(repaired);
      ++trace->repair_requests;
    }
    payload = extract_candidates(repaired);
  }
  if (!payload) {
    if (trace) trace->strategies.push_back("none");
    log.warn(stage(tag, "extract") + "no candidates recovered; continuing with an empty list");
    return {};
  }
  if (trace) trace->strategies.push_back(payload->strategy);

  {
    std::ostringstream ss;
    ss << stage(tag, "extract") << "strategy=" << payload->strategy;
    if (payload->salvage_skipped > 0) ss << " salvage_skipped=" << payload->salvage_skipped;
    log.info(ss.str());
  }

  CoercedCandidates coerced = coerce_candidates(*payload);
  {
    std::ostringstream ss;
    ss << stage(tag, "coerce") << coerced.candidates.size() << " valid, " << coerced.dropped << " dropped";
    log.info(ss.str());
  }
  if (payload->declared_total && *payload->declared_total != coerced.declared_total) {
    log.debug(stage(tag, "coerce") + "reply declared total_shorts=" + std::to_string(*payload->declared_total) +
              ", recomputed " + std::to_string(coerced.declared_total));
  }
  if (trace) trace->candidates.insert(trace->candidates.end(), coerced.candidates.begin(), coerced.candidates.end());
  return coerced.candidates;
}

ClipSet run_clip_pipeline(const Transcript& transcript,
                          const PipelineConfig& base_config,
                          const BrandInfo& brand,
                          const GenerateFn& generate,
                          Logger& log,
                          PipelineTrace* trace,
                          const ProgressFn& progress) {
  const TimeSpan span = transcript_span(transcript);
  const PipelineConfig config = finalize_pipeline_config(base_config, span.length());
  validate_pipeline_config(config);
  log.debug("[pipeline] " + describe_pipeline_config(config));

  std::vector<ClipCandidate> candidates;
  const bool chunked = config.chunk_minutes > 0.0 && span.length() > config.chunk_minutes * 60.0;
  if (chunked) {
    candidates = run_chunked(transcript, config, brand, generate, log, trace, progress);
  } else {
    candidates = request_candidates(transcript, config.target_shorts, config, brand, generate, log, trace);
    if (progress) progress(1, 1);
  }

  SelectionStats selection;
  ClipSet selected;
  selected.shorts =
      select_logged(candidates, transcript, config.target_shorts, config.min_gap_seconds, log, "", &selection);

  RefineStats refine_stats;
  ClipSet refined = refine_clip_windows(selected, transcript, refine_options(config), &refine_stats);
  {
    std::ostringstream ss;
    ss << "[refine] " << refined.shorts.size() << " clips (merged=" << refine_stats.merged
       << " short=" << refine_stats.dropped_short << " duplicate=" << refine_stats.dropped_duplicate
       << " synthesized=" << refine_stats.synthesized << ")";
    log.info(ss.str());
  }
  if (refine_stats.synthesized > 0) {
    log.warn("[refine] backfilled " + std::to_string(refine_stats.synthesized) + " placeholder clips");
  }

  EnrichStats enrich_stats;
  ClipSet final_set = refined;
  if (config.enrich) {
    final_set = enrich_clip_set(refined, transcript, &generate, log, &enrich_stats);
  }

  if (trace) {
    trace->selected = selected.shorts;
    trace->refined = refined;
    trace->final_set = final_set;
    trace->selection = selection;
    trace->refine = refine_stats;
    trace->enrich = enrich_stats;
  }
  return final_set;
}

ClipSet run_clip_pipeline_with_retry(const Transcript& transcript,
                                     const PipelineConfig& config,
                                     const BrandInfo& brand,
                                     const GenerateFn& generate,
                                     Logger& log,
                                     PipelineTrace* trace,
                                     const ProgressFn& progress) {
  const int attempts = std::max(0, config.max_retries) + 1;
  for (int attempt = 1;; ++attempt) {
    try {
      if (trace) *trace = PipelineTrace();
      return run_clip_pipeline(transcript, config, brand, generate, log, trace, progress);
    } catch (const std::exception& e) {
      if (attempt >= attempts) {
        log.error("[pipeline] attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                  " failed, giving up: " + e.what());
        throw;
      }
      log.warn("[pipeline] attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
               " failed, retrying: " + e.what());
    }
  }
}
