#include "generation.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Removes the prompt file however the call ends.
struct TempFile {
  fs::path path;
  ~TempFile() {
    std::error_code ec;
    fs::remove(path, ec);
  }
};

fs::path unique_temp_path() {
  static std::atomic<unsigned> counter{0};
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
#ifndef _WIN32
  const long pid = static_cast<long>(::getpid());
#else
  const long pid = 0;
#endif
  return fs::temp_directory_path() /
         ("shorts_prompt_" + std::to_string(pid) + "_" + std::to_string(stamp) + "_" +
          std::to_string(counter++) + ".json");
}

std::string quote_path(const fs::path& p) {
  std::string out = "'";
  for (char c : p.string()) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += "'";
  return out;
}

}  // namespace

std::string format_messages_json(const std::vector<ChatMessage>& messages) {
  json j;
  j["messages"] = json::array();
  for (const auto& m : messages) {
    j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

GenerateFn make_command_generator(const std::string& command) {
  if (command.empty()) throw std::runtime_error("Generation command is empty");

  return [command](const std::vector<ChatMessage>& messages) -> std::string {
    TempFile prompt{unique_temp_path()};
    {
      std::ofstream f(prompt.path, std::ios::binary);
      if (!f) throw std::runtime_error("Failed to write prompt file: " + prompt.path.string());
      f << format_messages_json(messages);
    }

    const std::string cmd = command + " < " + quote_path(prompt.path);
#ifdef _WIN32
    FILE* pipe = _popen(cmd.c_str(), "r");
#else
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (!pipe) throw std::runtime_error("Failed to start generation command: " + command);

    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
      output.append(buffer, n);
    }

#ifdef _WIN32
    const int status = _pclose(pipe);
    const int exit_code = status;
#else
    const int status = pclose(pipe);
    const int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
    if (exit_code != 0) {
      throw std::runtime_error("Generation command failed (exit " + std::to_string(exit_code) +
                               "): " + command);
    }
    return output;
  };
}

GenerateFn make_replay_generator(std::vector<std::string> replies) {
  auto state = std::make_shared<std::pair<std::vector<std::string>, size_t>>(std::move(replies), 0);
  return [state](const std::vector<ChatMessage>&) -> std::string {
    if (state->second >= state->first.size()) return std::string();
    return state->first[state->second++];
  };
}
