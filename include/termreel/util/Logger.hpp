// Repository: TermReel
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one line at a time across threads.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_UTIL_LOGGER_HPP_
#define TERMREEL_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace termreel::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines never interleave between the render loop, the
// distance sampler and the input handler.
//
// stdout is the frame surface, so every level goes to stderr, or to the
// file named by TERMREEL_LOG_FILE when that is set (first use opens it).
//
// Info  → normal operational logs
// Debug → only when TERMREEL_DEBUG env is set (verbose investigation)
// Warn  → degraded but recoverable conditions
// Error → hard faults
//
// Test-only: the Set*Sink hooks install callbacks invoked for every line
// of that level (in addition to the normal output).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Redirect output to a file (append). Empty path restores stderr.
  // Returns false if the file cannot be opened; output stays on stderr.
  static bool SetLogFile(const std::string& path);

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static void WriteLocked(const std::string& line);
  static void ApplyEnvironmentLocked();

  static std::mutex mutex_;
  static std::ofstream file_;
  static bool env_checked_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace termreel::util

#endif  // TERMREEL_UTIL_LOGGER_HPP_
