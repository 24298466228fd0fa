// Repository: TermReel
// Component: JSON Capture Sink
// Purpose: Serializes frames as a JSON array of per-row string arrays.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_OUTPUT_JSON_CAPTURE_SINK_H_
#define TERMREEL_OUTPUT_JSON_CAPTURE_SINK_H_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "termreel/output/IRenderSink.h"

namespace termreel::output {

// Output: [["row0","row1",...],["row0",...],...]
// One outer entry per frame; the block's trailing "\r\n" is not a row.
class JsonCaptureSink : public IRenderSink {
 public:
  JsonCaptureSink(std::string path, render::TerminalDimensions dims);
  ~JsonCaptureSink() override;

  JsonCaptureSink(const JsonCaptureSink&) = delete;
  JsonCaptureSink& operator=(const JsonCaptureSink&) = delete;

  bool Start() override;
  void Stop() override;
  void Present(const std::string& block, double duration_seconds) override;
  void Clear() override {}
  render::TerminalDimensions Dimensions() const override { return dims_; }
  render::LineMode line_mode() const override { return render::LineMode::kLineBreaks; }
  bool IsRealtime() const override { return false; }
  SinkStatus GetStatus() const override { return status_; }
  std::string GetName() const override { return "json:" + path_; }

  int64_t frames_written() const { return frames_written_; }

  // Splits a line-break block into its rows.
  static std::vector<std::string> SplitRows(const std::string& block);

  static std::string EscapeJsonString(const std::string& text);

 private:
  void CheckStream();

  std::string path_;
  render::TerminalDimensions dims_;
  std::ofstream file_;
  SinkStatus status_ = SinkStatus::kIdle;
  int64_t frames_written_ = 0;
};

}  // namespace termreel::output

#endif  // TERMREEL_OUTPUT_JSON_CAPTURE_SINK_H_
