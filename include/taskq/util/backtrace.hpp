#pragma once

#include <execinfo.h>

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskq {

// Symbolized frames of the calling thread, innermost first.
inline auto backtrace_frames(int skip = 1) -> std::vector<std::string> {
  std::array<void*, 64> addrs{};
  int n = ::backtrace(addrs.data(), static_cast<int>(addrs.size()));
  std::vector<std::string> frames;
  char** symbols = ::backtrace_symbols(addrs.data(), n);
  if (!symbols) {
    return frames;
  }
  for (int i = skip; i < n; ++i) {
    frames.emplace_back(symbols[i]);
  }
  std::free(symbols);
  return frames;
}

inline auto format_backtrace(const std::vector<std::string>& frames)
    -> std::string {
  std::string out;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    out += "  #" + std::to_string(i) + " " + frames[i] + "\n";
  }
  return out;
}

// Captures the frames of the throwing thread at construction. Handlers throw
// it (or call throw_traced) so recovery can log where the failure happened;
// by the time a catch block runs the stack has already unwound.
class TracedError : public std::runtime_error {
public:
  explicit TracedError(const std::string& what)
      : std::runtime_error(what), frames_(backtrace_frames(2)) {}

  [[nodiscard]] auto frames() const noexcept -> const std::vector<std::string>& {
    return frames_;
  }

private:
  std::vector<std::string> frames_;
};

[[noreturn]] inline void throw_traced(const std::string& what) {
  throw TracedError(what);
}

}  // namespace taskq
