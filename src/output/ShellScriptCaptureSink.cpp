// Repository: TermReel
// Component: Shell Script Capture Sink
// Copyright (c) 2025 TermReel

#include "termreel/output/ShellScriptCaptureSink.h"

#include <iomanip>
#include <sstream>
#include <utility>

#include "termreel/util/Logger.hpp"

namespace termreel::output {

using termreel::util::Logger;

ShellScriptCaptureSink::ShellScriptCaptureSink(std::string path,
                                               render::TerminalDimensions dims)
    : path_(std::move(path)), dims_(dims) {}

ShellScriptCaptureSink::~ShellScriptCaptureSink() {
  Stop();
}

bool ShellScriptCaptureSink::Start() {
  if (status_ == SinkStatus::kRunning) {
    return true;
  }
  file_.open(path_, std::ios::out | std::ios::trunc);
  if (!file_.is_open()) {
    Logger::Error("[ShellScriptCaptureSink] Cannot open " + path_);
    status_ = SinkStatus::kError;
    return false;
  }
  status_ = SinkStatus::kRunning;
  file_ << "#!/bin/bash \n";
  file_ << "echo -en '\\033[2J' \n";
  file_ << "echo -en '\\033[0;0H' \n";
  CheckStream();
  return status_ == SinkStatus::kRunning;
}

void ShellScriptCaptureSink::Stop() {
  if (!file_.is_open()) {
    return;
  }
  file_.flush();
  file_.close();
  if (status_ == SinkStatus::kRunning) {
    status_ = SinkStatus::kStopped;
  }
  Logger::Info("[ShellScriptCaptureSink] Wrote " + std::to_string(frames_written_) +
               " frames to " + path_);
}

void ShellScriptCaptureSink::Present(const std::string& block, double duration_seconds) {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  std::ostringstream sleep_line;
  sleep_line << "sleep " << std::fixed << std::setprecision(3) << duration_seconds << " \n";
  file_ << sleep_line.str();
  file_ << "echo -en '" << QuoteForEcho(block) << "'\n";
  file_ << "echo -en '\\033[0;0H' \n";
  CheckStream();
  ++frames_written_;
}

void ShellScriptCaptureSink::Clear() {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  file_ << "echo -en '\\033[2J' \n";
  CheckStream();
}

std::string ShellScriptCaptureSink::QuoteForEcho(const std::string& block) {
  std::string out;
  out.reserve(block.size());
  for (char c : block) {
    if (c == '\'') {
      out += "'\\''";
    } else if (c == '\\') {
      out += "\\\\";
    } else {
      out += c;
    }
  }
  return out;
}

void ShellScriptCaptureSink::CheckStream() {
  if (!file_.good()) {
    Logger::Error("[ShellScriptCaptureSink] Write failed: " + path_);
    status_ = SinkStatus::kError;
  }
}

}  // namespace termreel::output
