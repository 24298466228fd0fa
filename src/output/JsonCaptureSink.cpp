// Repository: TermReel
// Component: JSON Capture Sink
// Copyright (c) 2025 TermReel

#include "termreel/output/JsonCaptureSink.h"

#include <cstdio>
#include <utility>

#include "termreel/util/Logger.hpp"

namespace termreel::output {

using termreel::util::Logger;

JsonCaptureSink::JsonCaptureSink(std::string path, render::TerminalDimensions dims)
    : path_(std::move(path)), dims_(dims) {}

JsonCaptureSink::~JsonCaptureSink() {
  Stop();
}

bool JsonCaptureSink::Start() {
  if (status_ == SinkStatus::kRunning) {
    return true;
  }
  file_.open(path_, std::ios::out | std::ios::trunc);
  if (!file_.is_open()) {
    Logger::Error("[JsonCaptureSink] Cannot open " + path_);
    status_ = SinkStatus::kError;
    return false;
  }
  status_ = SinkStatus::kRunning;
  return true;
}

void JsonCaptureSink::Stop() {
  if (!file_.is_open()) {
    return;
  }
  // Close the frame array.
  file_ << (frames_written_ == 0 ? "[]\n" : "]\n");
  file_.flush();
  file_.close();
  if (status_ == SinkStatus::kRunning) {
    status_ = SinkStatus::kStopped;
  }
  Logger::Info("[JsonCaptureSink] Wrote " + std::to_string(frames_written_) +
               " frames to " + path_);
}

void JsonCaptureSink::Present(const std::string& block, double /*duration_seconds*/) {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  const std::vector<std::string> rows = SplitRows(block);

  file_ << (frames_written_ == 0 ? "[[\n" : ",[\n");
  for (size_t i = 0; i < rows.size(); ++i) {
    file_ << '"' << EscapeJsonString(rows[i]) << '"';
    file_ << (i + 1 == rows.size() ? "\n" : ",\n");
  }
  file_ << "]\n";
  CheckStream();
  ++frames_written_;
}

std::vector<std::string> JsonCaptureSink::SplitRows(const std::string& block) {
  std::string body = block;
  if (body.size() >= 2 && body.compare(body.size() - 2, 2, "\r\n") == 0) {
    body.resize(body.size() - 2);
  }

  std::vector<std::string> rows;
  size_t start = 0;
  while (start < body.size()) {
    size_t end = body.find('\n', start);
    if (end == std::string::npos) {
      rows.push_back(body.substr(start));
      break;
    }
    rows.push_back(body.substr(start, end - start));
    start = end + 1;
  }
  return rows;
}

std::string JsonCaptureSink::EscapeJsonString(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

void JsonCaptureSink::CheckStream() {
  if (!file_.good()) {
    Logger::Error("[JsonCaptureSink] Write failed: " + path_);
    status_ = SinkStatus::kError;
  }
}

}  // namespace termreel::output
