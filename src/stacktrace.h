#pragma once

#include <string>
#include <vector>

// Best-effort call stack for fatal error reports.
namespace stacktrace {

struct StackFrame {
  std::string module;    // binary or shared object, when known
  std::string function;  // demangled where possible
  void* address = nullptr;
};

// Frames of the calling thread, innermost first, without this module's own frames.
std::vector<StackFrame> capture(int skip_frames = 0, int max_frames = 48);

std::string format(const std::vector<StackFrame>& frames);

std::string capture_string(int skip_frames = 1);

}  // namespace stacktrace
