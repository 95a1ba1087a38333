#include "cli_args.h"
#include "pipeline_config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

template <typename Fn>
bool throws_runtime_error(Fn fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

bool test_defaults() {
  const PipelineConfig c;
  if (c.target_shorts != 5 || c.min_gap_seconds != 90.0 || c.min_len != 15.0 || c.max_len != 60.0 ||
      c.pad != 1.5 || c.merge_gap != 0.0 || c.min_shorts != 5 || c.max_shorts != 0 || c.max_retries != 2 ||
      !c.repair || !c.enrich || c.target_shorts_explicit) {
    std::cerr << "Pipeline config test failed: defaults.\n";
    return false;
  }
  return true;
}

bool test_json_overlay() {
  PipelineConfig c;
  apply_config_json(json::parse(R"({"target_shorts": 7, "pad": 0.5, "enrich": false, "comment": "ignored"})"), c);
  if (c.target_shorts != 7 || !c.target_shorts_explicit || c.pad != 0.5 || c.enrich || c.min_len != 15.0) {
    std::cerr << "Pipeline config test failed: JSON overlay.\n";
    return false;
  }
  if (!throws_runtime_error([&c] { apply_config_json(json::parse(R"({"min_len": "long"})"), c); }) ||
      !throws_runtime_error([&c] { apply_config_json(json::parse(R"({"repair": 1})"), c); }) ||
      !throws_runtime_error([&c] { apply_config_json(json::array(), c); })) {
    std::cerr << "Pipeline config test failed: wrongly typed values accepted.\n";
    return false;
  }
  return true;
}

bool test_long_transcripts_raise_target() {
  const PipelineConfig base;
  const auto short_run = finalize_pipeline_config(base, 600.0);
  const auto medium = finalize_pipeline_config(base, 30 * 60.0);
  const auto long_run = finalize_pipeline_config(base, 90 * 60.0);
  if (short_run.target_shorts != 5 || short_run.max_shorts != 5) {
    std::cerr << "Pipeline config test failed: short transcript target.\n";
    return false;
  }
  if (medium.target_shorts != 8 || medium.max_shorts != 8) {
    std::cerr << "Pipeline config test failed: 30 minute target is " << medium.target_shorts << ".\n";
    return false;
  }
  if (long_run.target_shorts != 12) {
    std::cerr << "Pipeline config test failed: long transcript target not capped.\n";
    return false;
  }
  PipelineConfig explicit_target;
  explicit_target.target_shorts = 3;
  explicit_target.target_shorts_explicit = true;
  if (finalize_pipeline_config(explicit_target, 90 * 60.0).target_shorts != 3) {
    std::cerr << "Pipeline config test failed: explicit target was raised.\n";
    return false;
  }
  const auto again = finalize_pipeline_config(medium, 30 * 60.0);
  if (again.target_shorts != medium.target_shorts || again.max_shorts != medium.max_shorts) {
    std::cerr << "Pipeline config test failed: finalize is not idempotent.\n";
    return false;
  }
  return true;
}

bool test_validation() {
  auto with = [](void (*edit)(PipelineConfig&)) {
    PipelineConfig c = finalize_pipeline_config(PipelineConfig(), 600.0);
    edit(c);
    return c;
  };
  const std::vector<PipelineConfig> invalid = {
      with([](PipelineConfig& c) { c.target_shorts = 0; }),
      with([](PipelineConfig& c) { c.min_len = 0.0; }),
      with([](PipelineConfig& c) { c.max_len = 10.0; }),
      with([](PipelineConfig& c) { c.pad = -1.0; }),
      with([](PipelineConfig& c) { c.chunk_minutes = -5.0; }),
      with([](PipelineConfig& c) { c.max_retries = -1; }),
      with([](PipelineConfig& c) { c.min_shorts = 9; }),
  };
  for (const auto& c : invalid) {
    if (!throws_runtime_error([&c] { validate_pipeline_config(c); })) {
      std::cerr << "Pipeline config test failed: invalid config accepted: " << describe_pipeline_config(c) << ".\n";
      return false;
    }
  }
  if (throws_runtime_error([] { validate_pipeline_config(finalize_pipeline_config(PipelineConfig(), 600.0)); })) {
    std::cerr << "Pipeline config test failed: default config rejected.\n";
    return false;
  }
  return true;
}

bool parse(std::vector<std::string> args, CliArgs& out, int& exit_code) {
  args.insert(args.begin(), "cpp-shorts-picker");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(&a[0]);
  return parse_cli_args(static_cast<int>(argv.size()), argv.data(), out, exit_code);
}

bool test_cli_flags_override_config_file() {
  const auto path = std::filesystem::temp_directory_path() / "shorts_picker_config_test.json";
  {
    std::ofstream f(path, std::ios::binary);
    f << R"({"target_shorts": 9, "min_len": 20, "max_len": 50, "repair": false})";
  }

  CliArgs args;
  int exit_code = 0;
  const bool ok = parse({"--transcript", "talk.json", "--response", "reply.txt", "--config", path.string(),
                         "--min-len", "25", "--no-enrich", "--debug"},
                        args, exit_code);
  if (!ok || exit_code != 0) {
    std::cerr << "Pipeline config test failed: valid command line rejected.\n";
    return false;
  }
  const PipelineConfig c = resolve_pipeline_config(args);
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (c.target_shorts != 9 || !c.target_shorts_explicit || c.min_len != 25.0 || c.max_len != 50.0 || c.repair ||
      c.enrich) {
    std::cerr << "Pipeline config test failed: precedence of defaults, file and flags.\n";
    return false;
  }
  if (args.debug_dir != std::filesystem::path("talk_debug")) {
    std::cerr << "Pipeline config test failed: default debug dir is " << args.debug_dir << ".\n";
    return false;
  }
  return true;
}

bool test_cli_rejects_bad_usage() {
  const std::vector<std::vector<std::string>> bad = {
      {"--response", "reply.txt"},
      {"--transcript", "talk.json"},
      {"--transcript", "talk.json", "--response", "r.txt", "--llm-command", "cat"},
      {"--transcript", "talk.srt", "--response", "r.txt"},
      {"--transcript", "talk.json", "--response", "r.txt", "--target-shorts", "five"},
      {"--transcript", "talk.json", "--response", "r.txt", "--bogus"},
      {"--transcript"},
  };
  for (const auto& argv : bad) {
    CliArgs args;
    int exit_code = 0;
    if (parse(argv, args, exit_code) || exit_code != 2) {
      std::cerr << "Pipeline config test failed: bad command line accepted.\n";
      return false;
    }
  }
  return true;
}

bool test_cap_below_default_floor_lowers_floor() {
  CliArgs args;
  int exit_code = 0;
  if (!parse({"--transcript", "talk.json", "--response", "r.txt", "--max-shorts", "3"}, args, exit_code)) {
    std::cerr << "Pipeline config test failed: --max-shorts rejected.\n";
    return false;
  }
  const PipelineConfig capped = finalize_pipeline_config(resolve_pipeline_config(args), 600.0);
  if (capped.max_shorts != 3 || capped.min_shorts != 3 ||
      throws_runtime_error([&capped] { validate_pipeline_config(capped); })) {
    std::cerr << "Pipeline config test failed: default min_shorts not lowered to max_shorts ("
              << describe_pipeline_config(capped) << ").\n";
    return false;
  }

  CliArgs both;
  if (!parse({"--transcript", "talk.json", "--response", "r.txt", "--max-shorts", "3", "--min-shorts", "4"}, both,
             exit_code)) {
    std::cerr << "Pipeline config test failed: --min-shorts rejected.\n";
    return false;
  }
  const PipelineConfig conflicting = finalize_pipeline_config(resolve_pipeline_config(both), 600.0);
  if (conflicting.min_shorts != 4 || !throws_runtime_error([&conflicting] { validate_pipeline_config(conflicting); })) {
    std::cerr << "Pipeline config test failed: explicit min_shorts above max_shorts accepted.\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_defaults()) return 1;
  if (!test_json_overlay()) return 1;
  if (!test_long_transcripts_raise_target()) return 1;
  if (!test_validation()) return 1;
  if (!test_cli_flags_override_config_file()) return 1;
  if (!test_cli_rejects_bad_usage()) return 1;
  if (!test_cap_below_default_floor_lowers_floor()) return 1;

  std::cout << "Pipeline config test passed.\n";
  return 0;
}
