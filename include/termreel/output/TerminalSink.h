// Repository: TermReel
// Component: Terminal Sink
// Purpose: In-place, non-scrolling redraw of text blocks on a tty.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_OUTPUT_TERMINAL_SINK_H_
#define TERMREEL_OUTPUT_TERMINAL_SINK_H_

#include <string>

#include "termreel/output/IRenderSink.h"

namespace termreel::output {

// ANSI sequences used by the terminal surface.
inline constexpr const char* kCursorHome = "\x1b[0;0H";
inline constexpr const char* kClearScreen = "\x1b[2J";

// TerminalSink writes each block after a cursor-home sequence so frames
// overwrite each other without scrollback. Dimensions come from
// TIOCGWINSZ on the output descriptor, 80x24 when it is not a tty.
class TerminalSink : public IRenderSink {
 public:
  explicit TerminalSink(int fd = 1);
  ~TerminalSink() override;

  TerminalSink(const TerminalSink&) = delete;
  TerminalSink& operator=(const TerminalSink&) = delete;

  bool Start() override;
  void Stop() override;
  void Present(const std::string& block, double duration_seconds) override;
  void Clear() override;
  render::TerminalDimensions Dimensions() const override;
  render::LineMode line_mode() const override { return render::LineMode::kPadded; }
  bool IsRealtime() const override { return true; }
  SinkStatus GetStatus() const override { return status_; }
  std::string GetName() const override { return "terminal"; }

 private:
  // Sets status_ to kError on a failed write.
  void WriteAll(const std::string& bytes);

  int fd_;
  SinkStatus status_ = SinkStatus::kIdle;
};

}  // namespace termreel::output

#endif  // TERMREEL_OUTPUT_TERMINAL_SINK_H_
