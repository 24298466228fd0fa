// Repository: TermReel
// Component: Recording Sink
// Purpose: Render sink that keeps every presented block in memory.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TESTS_FIXTURES_RECORDING_SINK_H_
#define TERMREEL_TESTS_FIXTURES_RECORDING_SINK_H_

#include <string>
#include <vector>

#include "termreel/output/IRenderSink.h"

namespace termreel::tests::fixtures {

class RecordingSink : public output::IRenderSink {
 public:
  explicit RecordingSink(render::TerminalDimensions dims = render::TerminalDimensions(40, 8),
                         bool realtime = false,
                         render::LineMode mode = render::LineMode::kPadded)
      : dims_(dims), realtime_(realtime), mode_(mode) {}

  bool Start() override {
    status_ = output::SinkStatus::kRunning;
    return true;
  }
  void Stop() override { status_ = output::SinkStatus::kStopped; }
  void Present(const std::string& block, double duration_seconds) override {
    blocks_.push_back(block);
    durations_.push_back(duration_seconds);
  }
  void Clear() override { ++clear_count_; }
  render::TerminalDimensions Dimensions() const override { return dims_; }
  render::LineMode line_mode() const override { return mode_; }
  bool IsRealtime() const override { return realtime_; }
  output::SinkStatus GetStatus() const override { return status_; }
  std::string GetName() const override { return "recording"; }

  void SetDimensions(render::TerminalDimensions dims) { dims_ = dims; }

  const std::vector<std::string>& blocks() const { return blocks_; }
  const std::vector<double>& durations() const { return durations_; }
  std::size_t frame_count() const { return blocks_.size(); }
  int clear_count() const { return clear_count_; }
  void Reset() {
    blocks_.clear();
    durations_.clear();
  }

 private:
  render::TerminalDimensions dims_;
  bool realtime_;
  render::LineMode mode_;
  output::SinkStatus status_ = output::SinkStatus::kIdle;
  std::vector<std::string> blocks_;
  std::vector<double> durations_;
  int clear_count_ = 0;
};

}  // namespace termreel::tests::fixtures

#endif  // TERMREEL_TESTS_FIXTURES_RECORDING_SINK_H_
