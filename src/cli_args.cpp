#include "cli_args.h"

#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

static bool is_flag(const std::string& s) { return s.size() > 1 && s[0] == '-'; }

void print_usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  cpp-shorts-picker --transcript <path|-> (--llm-command <cmd> | --response <file> ...) [options]\n";
  std::cerr << "\nInput/Output:\n";
  std::cerr << "  --transcript, -t      Transcript JSON or .srt file ('-' reads JSON from stdin)\n";
  std::cerr << "  --output, -o          Clip set JSON path (default: stdout)\n";
  std::cerr << "  --srt-output          Also write the clips as SRT cues\n";
  std::cerr << "  --language, -l        Transcript language code (required for .srt input)\n";
  std::cerr << "  --brand-file          Brand context JSON added to the selection prompt\n";
  std::cerr << "  --config, -c          Pipeline config JSON (flags below override it)\n";
  std::cerr << "\nGeneration:\n";
  std::cerr << "  --llm-command         Shell command reading {\"messages\":[...]} on stdin, reply on stdout\n";
  std::cerr << "  --response, -r        Recorded reply file, replayed in order (repeatable)\n";
  std::cerr << "\nSelection options:\n";
  std::cerr << "  --target-shorts, -n   Desired clip count (default: 5, raised for long transcripts)\n";
  std::cerr << "  --min-gap             Minimum seconds between clip midpoints (default: 90)\n";
  std::cerr << "  --min-len             Minimum clip length in seconds (default: 15)\n";
  std::cerr << "  --max-len             Maximum clip length in seconds (default: 60)\n";
  std::cerr << "  --pad                 Seconds added on each side before snapping (default: 1.5)\n";
  std::cerr << "  --merge-gap           Merge clips closer than this many seconds (default: 0, off)\n";
  std::cerr << "  --chunk-minutes       Request clips per transcript chunk of this length (default: 0, off)\n";
  std::cerr << "  --min-shorts          Backfill up to this many clips (default: 5, lowered to --max-shorts)\n";
  std::cerr << "  --max-shorts          Cap on the final clip count (default: max(target, 5))\n";
  std::cerr << "  --retries             Pipeline retries after a generation failure (default: 2)\n";
  std::cerr << "  --no-enrich           Keep titles and reasons as returned\n";
  std::cerr << "  --no-repair           Skip the JSON repair request\n";
  std::cerr << "\nDebug:\n";
  std::cerr << "  --debug, -d           Enable debug logging and save intermediate files\n";
  std::cerr << "  --debug-dir           Debug output directory (default: <transcript>_debug)\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static int parse_int(const std::string& flag, const std::string& value) {
  size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid integer for " + flag + ": " + value);
  }
  if (used != value.size()) throw std::runtime_error("Invalid integer for " + flag + ": " + value);
  return v;
}

static double parse_double(const std::string& flag, const std::string& value) {
  size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid number for " + flag + ": " + value);
  }
  if (used != value.size()) throw std::runtime_error("Invalid number for " + flag + ": " + value);
  return v;
}

static fs::path default_debug_dir(const CliArgs& a) {
  if (a.transcript.empty() || a.transcript == "-") return fs::path("shorts_debug");
  const auto base = a.transcript.parent_path() / a.transcript.stem();
  return fs::path(base.string() + "_debug");
}

static bool fail(const std::string& message, int& exit_code) {
  std::cerr << message << "\n\n";
  print_usage();
  exit_code = 2;
  return false;
}

static void parse_flag(const std::string& a, int& i, int argc, char** argv, CliArgs& out) {
  if (a == "--transcript" || a == "-t") {
    out.transcript = fs::path(require_value(i, argc, argv, a));
  } else if (a == "--output" || a == "-o") {
    out.output = fs::path(require_value(i, argc, argv, a));
  } else if (a == "--srt-output") {
    out.srt_output = fs::path(require_value(i, argc, argv, a));
  } else if (a == "--language" || a == "-l") {
    out.language = require_value(i, argc, argv, a);
  } else if (a == "--brand-file") {
    out.brand_file = fs::path(require_value(i, argc, argv, a));
  } else if (a == "--config" || a == "-c") {
    out.config_file = fs::path(require_value(i, argc, argv, a));
  } else if (a == "--llm-command") {
    out.llm_command = require_value(i, argc, argv, a);
  } else if (a == "--response" || a == "-r") {
    out.responses.emplace_back(require_value(i, argc, argv, a));
  } else if (a == "--target-shorts" || a == "-n") {
    out.target_shorts = parse_int(a, require_value(i, argc, argv, a));
  } else if (a == "--min-gap") {
    out.min_gap_seconds = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--min-len") {
    out.min_len = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--max-len") {
    out.max_len = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--pad") {
    out.pad = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--merge-gap") {
    out.merge_gap = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--chunk-minutes") {
    out.chunk_minutes = parse_double(a, require_value(i, argc, argv, a));
  } else if (a == "--min-shorts") {
    out.min_shorts = parse_int(a, require_value(i, argc, argv, a));
  } else if (a == "--max-shorts") {
    out.max_shorts = parse_int(a, require_value(i, argc, argv, a));
  } else if (a == "--retries") {
    out.retries = parse_int(a, require_value(i, argc, argv, a));
  } else if (a == "--no-enrich") {
    out.no_enrich = true;
  } else if (a == "--no-repair") {
    out.no_repair = true;
  } else if (a == "--debug" || a == "-d") {
    out.debug = true;
  } else if (a == "--debug-dir") {
    out.debug_dir = fs::path(require_value(i, argc, argv, a));
  } else {
    throw std::invalid_argument("Unknown arg: " + a);
  }
}

bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code) {
  exit_code = 0;
  if (argc <= 1) {
    print_usage();
    exit_code = 2;
    return false;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage();
      return false;
    }
    if (!is_flag(a)) return fail("Unexpected positional arg: " + a, exit_code);
    try {
      parse_flag(a, i, argc, argv, out);
    } catch (const std::exception& e) {
      return fail(e.what(), exit_code);
    }
  }

  // Validate required
  if (out.transcript.empty()) return fail("ERROR: --transcript is required", exit_code);
  if (out.llm_command.empty() && out.responses.empty()) {
    return fail("ERROR: Either --llm-command or --response is required", exit_code);
  }
  if (!out.llm_command.empty() && !out.responses.empty()) {
    return fail("ERROR: --llm-command and --response are mutually exclusive", exit_code);
  }
  if (out.transcript.extension() == ".srt" && out.language.empty()) {
    return fail("ERROR: --language is required for SRT transcripts", exit_code);
  }

  if (out.debug && out.debug_dir.empty()) {
    out.debug_dir = default_debug_dir(out);
  }
  return true;
}

PipelineConfig resolve_pipeline_config(const CliArgs& args) {
  PipelineConfig config;
  if (!args.config_file.empty()) config = load_pipeline_config(args.config_file, config);

  if (args.target_shorts) {
    config.target_shorts = *args.target_shorts;
    config.target_shorts_explicit = true;
  }
  if (args.min_gap_seconds) config.min_gap_seconds = *args.min_gap_seconds;
  if (args.min_len) config.min_len = *args.min_len;
  if (args.max_len) config.max_len = *args.max_len;
  if (args.pad) config.pad = *args.pad;
  if (args.merge_gap) config.merge_gap = *args.merge_gap;
  if (args.chunk_minutes) config.chunk_minutes = *args.chunk_minutes;
  if (args.min_shorts) {
    config.min_shorts = *args.min_shorts;
    config.min_shorts_explicit = true;
  }
  if (args.max_shorts) config.max_shorts = *args.max_shorts;
  if (args.retries) config.max_retries = *args.retries;
  if (args.no_enrich) config.enrich = false;
  if (args.no_repair) config.repair = false;
  return config;
}
