// Repository: TermReel
// Component: Shell Script Capture Sink
// Purpose: Serializes frames as a bash replay script (one sleep + one echo
//          per frame).
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_OUTPUT_SHELL_SCRIPT_CAPTURE_SINK_H_
#define TERMREEL_OUTPUT_SHELL_SCRIPT_CAPTURE_SINK_H_

#include <cstdint>
#include <fstream>
#include <string>

#include "termreel/output/IRenderSink.h"

namespace termreel::output {

// Script layout:
//   #!/bin/bash
//   echo -en '\033[2J'
//   echo -en '\033[0;0H'
//   per frame:
//     sleep <duration>
//     echo -en '<block>'
//     echo -en '\033[0;0H'
class ShellScriptCaptureSink : public IRenderSink {
 public:
  ShellScriptCaptureSink(std::string path, render::TerminalDimensions dims);
  ~ShellScriptCaptureSink() override;

  ShellScriptCaptureSink(const ShellScriptCaptureSink&) = delete;
  ShellScriptCaptureSink& operator=(const ShellScriptCaptureSink&) = delete;

  bool Start() override;
  void Stop() override;
  void Present(const std::string& block, double duration_seconds) override;
  void Clear() override;
  render::TerminalDimensions Dimensions() const override { return dims_; }
  render::LineMode line_mode() const override { return render::LineMode::kLineBreaks; }
  bool IsRealtime() const override { return false; }
  SinkStatus GetStatus() const override { return status_; }
  std::string GetName() const override { return "sh:" + path_; }

  int64_t frames_written() const { return frames_written_; }

  // Escapes a block for use inside single quotes with `echo -e`.
  static std::string QuoteForEcho(const std::string& block);

 private:
  void CheckStream();

  std::string path_;
  render::TerminalDimensions dims_;
  std::ofstream file_;
  SinkStatus status_ = SinkStatus::kIdle;
  int64_t frames_written_ = 0;
};

}  // namespace termreel::output

#endif  // TERMREEL_OUTPUT_SHELL_SCRIPT_CAPTURE_SINK_H_
