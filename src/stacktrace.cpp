#include "stacktrace.h"

#include <cstdint>
#include <iomanip>
#include <sstream>

#if defined(__GLIBC__) || defined(__APPLE__)
#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <memory>
#define SHORTS_PICKER_HAVE_BACKTRACE 1
#endif

namespace stacktrace {

#ifdef SHORTS_PICKER_HAVE_BACKTRACE

static std::string demangle(const std::string& name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> out(abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status),
                                             std::free);
  return (status == 0 && out) ? std::string(out.get()) : name;
}

// glibc: "module(symbol+0x1f) [0x...]"
static StackFrame parse_symbol_line(const std::string& line, void* address) {
  StackFrame frame;
  frame.address = address;
  const size_t open = line.find('(');
  const size_t plus = line.find('+', open == std::string::npos ? 0 : open);
  if (open == std::string::npos) {
    frame.function = line;
    return frame;
  }
  frame.module = line.substr(0, open);
  if (plus != std::string::npos && plus > open + 1) {
    frame.function = demangle(line.substr(open + 1, plus - open - 1));
  }
  return frame;
}

std::vector<StackFrame> capture(int skip_frames, int max_frames) {
  std::vector<void*> stack(static_cast<size_t>(max_frames > 0 ? max_frames : 1));
  const int count = backtrace(stack.data(), static_cast<int>(stack.size()));
  std::unique_ptr<char*, void (*)(void*)> symbols(backtrace_symbols(stack.data(), count), std::free);

  std::vector<StackFrame> result;
  for (int i = skip_frames + 1; i < count; ++i) {
    if (!symbols) {
      StackFrame frame;
      frame.address = stack[i];
      result.push_back(frame);
      continue;
    }
    result.push_back(parse_symbol_line(symbols.get()[i], stack[i]));
  }
  return result;
}

#else

std::vector<StackFrame> capture(int /*skip_frames*/, int /*max_frames*/) { return {}; }

#endif

std::string format(const std::vector<StackFrame>& frames) {
  if (frames.empty()) return "Stack trace unavailable\n";
  std::ostringstream ss;
  ss << "Stack trace:\n";
  for (size_t i = 0; i < frames.size(); ++i) {
    const auto& f = frames[i];
    ss << "  #" << std::setw(2) << i << " " << (f.function.empty() ? "<unknown>" : f.function);
    if (f.address) ss << " [0x" << std::hex << reinterpret_cast<uintptr_t>(f.address) << std::dec << "]";
    if (!f.module.empty()) ss << " in " << f.module;
    ss << "\n";
  }
  return ss.str();
}

std::string capture_string(int skip_frames) { return format(capture(skip_frames + 1)); }

}  // namespace stacktrace
