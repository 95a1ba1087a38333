#pragma once

#include "clip_enricher.h"
#include "clip_refiner.h"
#include "clip_selector.h"
#include "clip_types.h"
#include "generation.h"
#include "logger.h"
#include "pipeline_config.h"
#include "prompts.h"
#include "transcript.h"

#include <functional>
#include <string>
#include <vector>

// Intermediate results of one run, written to the debug directory by the CLI.
struct PipelineTrace {
  std::vector<std::string> responses;   // every raw reply, in request order
  std::vector<std::string> strategies;  // cascade step per selection request ("none" on failure)
  size_t repair_requests = 0;
  size_t chunks_total = 0;
  size_t chunks_failed = 0;

  std::vector<ClipCandidate> candidates;  // coerced, before selection
  std::vector<ClipCandidate> selected;
  ClipSet refined;
  ClipSet final_set;

  SelectionStats selection;
  RefineStats refine;
  EnrichStats enrich;
};

// Called after every chunk with (chunks done, chunks total).
using ProgressFn = std::function<void(size_t, size_t)>;

// One selection request (plus repair when extraction fails outright),
// returning the coerced candidates. Generation exceptions propagate.
std::vector<ClipCandidate> request_candidates(const Transcript& transcript,
                                              int target_shorts,
                                              const PipelineConfig& config,
                                              const BrandInfo& brand,
                                              const GenerateFn& generate,
                                              Logger& log,
                                              PipelineTrace* trace = nullptr,
                                              const std::string& tag = "");

// Per-chunk clip target, proportional to the chunk's share of the span (at least 1).
int chunk_target(int target_shorts, double chunk_seconds, double span_seconds);

// Extract -> coerce -> select -> refine -> enrich.
// config is finalized against the transcript span before use.
ClipSet run_clip_pipeline(const Transcript& transcript,
                          const PipelineConfig& config,
                          const BrandInfo& brand,
                          const GenerateFn& generate,
                          Logger& log,
                          PipelineTrace* trace = nullptr,
                          const ProgressFn& progress = ProgressFn());

// Reruns the pipeline up to config.max_retries extra times when it throws;
// the last exception is rethrown.
ClipSet run_clip_pipeline_with_retry(const Transcript& transcript,
                                     const PipelineConfig& config,
                                     const BrandInfo& brand,
                                     const GenerateFn& generate,
                                     Logger& log,
                                     PipelineTrace* trace = nullptr,
                                     const ProgressFn& progress = ProgressFn());
