// Repository: TermReel
// Component: Terminal Sink
// Copyright (c) 2025 TermReel

#include "termreel/output/TerminalSink.h"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "termreel/util/Logger.hpp"

namespace termreel::output {

using termreel::util::Logger;

namespace {

constexpr const char* kHideCursor = "\x1b[?25l";
constexpr const char* kShowCursor = "\x1b[?25h";

}  // namespace

TerminalSink::TerminalSink(int fd) : fd_(fd) {}

TerminalSink::~TerminalSink() {
  Stop();
}

bool TerminalSink::Start() {
  if (status_ == SinkStatus::kRunning) {
    return true;
  }
  status_ = SinkStatus::kRunning;
  WriteAll(std::string(kClearScreen) + kHideCursor);
  return status_ == SinkStatus::kRunning;
}

void TerminalSink::Stop() {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  WriteAll(std::string(kShowCursor));
  status_ = SinkStatus::kStopped;
}

void TerminalSink::Present(const std::string& block, double /*duration_seconds*/) {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  std::string bytes;
  bytes.reserve(block.size() + 8);
  bytes += kCursorHome;
  bytes += block;
  WriteAll(bytes);
}

void TerminalSink::Clear() {
  if (status_ != SinkStatus::kRunning) {
    return;
  }
  WriteAll(std::string(kClearScreen) + kCursorHome);
}

render::TerminalDimensions TerminalSink::Dimensions() const {
  struct winsize ws;
  std::memset(&ws, 0, sizeof(ws));
  if (ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
    return render::TerminalDimensions(ws.ws_col, ws.ws_row);
  }
  return render::kDefaultTerminalDimensions;
}

void TerminalSink::WriteAll(const std::string& bytes) {
  const char* ptr = bytes.data();
  size_t remaining = bytes.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd_, ptr, remaining);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;  // Retry
      }
      Logger::Error(std::string("[TerminalSink] write() error: ") + std::strerror(errno));
      status_ = SinkStatus::kError;
      return;
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
  }
}

}  // namespace termreel::output
