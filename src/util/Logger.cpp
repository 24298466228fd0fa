// Repository: TermReel
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one line at a time across threads.
// Copyright (c) 2025 TermReel

#include "termreel/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace termreel::util {

std::mutex Logger::mutex_;
std::ofstream Logger::file_;
bool Logger::env_checked_ = false;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::ApplyEnvironmentLocked() {
  if (env_checked_) return;
  env_checked_ = true;
  const char* path = std::getenv("TERMREEL_LOG_FILE");
  if (path != nullptr && path[0] != '\0') {
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
      std::cerr << "[Logger] Failed to open TERMREEL_LOG_FILE=" << path
                << ", logging to stderr" << '\n';
    }
  }
}

void Logger::WriteLocked(const std::string& line) {
  ApplyEnvironmentLocked();
  if (file_.is_open()) {
    file_ << line << '\n';
    file_.flush();
    return;
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  env_checked_ = true;
  if (file_.is_open()) {
    file_.close();
  }
  if (path.empty()) {
    return true;
  }
  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  WriteLocked(line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("TERMREEL_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  WriteLocked(line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  WriteLocked(line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  WriteLocked(line);
}

}  // namespace termreel::util
