// Repository: Storyline
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission: prevents multi-thread interleave.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_UTIL_LOGGER_HPP_
#define STORYLINE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace storyline::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes: guaranteeing no interleave between the control thread, the
// media loader worker and the harness stdin reader.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when STORYLINE_DEBUG env is set (verbose investigation)
// Warn  -> stderr (degraded but recoverable conditions, e.g. load failures)
// Error -> stderr (contract violations, bugs, hard faults)
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked for every
// Error() / Info() line (in addition to the stream). Used by contract tests to
// assert violation counts.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace storyline::util

#endif  // STORYLINE_UTIL_LOGGER_HPP_
