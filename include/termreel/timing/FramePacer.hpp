// Repository: TermReel
// Component: Frame Pacer
// Purpose: Best-effort delay compensation that holds a render loop to the
//          source frame interval.
// Copyright (c) 2025 TermReel
//
// Two disciplines:
// - Compensated (segment playback): BeginFrame() marks the start of the
//   frame's work; EndFrame() sleeps for whatever is left of the interval.
//   A frame that overran its budget is not delayed, and nothing is
//   carried over to the next frame: the loop self-throttles but never
//   blocks past one interval.
// - Fixed (transitions): Delay() sleeps one full interval after an
//   emitted composite.

#ifndef TERMREEL_TIMING_FRAME_PACER_HPP_
#define TERMREEL_TIMING_FRAME_PACER_HPP_

#include <chrono>
#include <cstdint>
#include <memory>

#include "termreel/timing/IWaitStrategy.hpp"

namespace termreel::timing {

class FramePacer {
 public:
  // fps <= 0 falls back to 30. nullptr wait selects RealtimeWaitStrategy.
  explicit FramePacer(double fps, std::shared_ptr<IWaitStrategy> wait = nullptr);

  void SetFps(double fps);
  double fps() const { return fps_; }
  std::chrono::nanoseconds interval() const { return interval_; }

  void BeginFrame();
  void EndFrame();

  void Delay();

  // Frames whose work exceeded the interval (no sleep issued).
  uint64_t late_frames() const { return late_frames_; }

 private:
  std::shared_ptr<IWaitStrategy> wait_;
  double fps_ = 30.0;
  std::chrono::nanoseconds interval_{0};
  std::chrono::steady_clock::time_point frame_start_{};
  uint64_t late_frames_ = 0;
};

}  // namespace termreel::timing

#endif  // TERMREEL_TIMING_FRAME_PACER_HPP_
