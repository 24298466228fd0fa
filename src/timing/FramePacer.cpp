// Repository: TermReel
// Component: Frame Pacer
// Copyright (c) 2025 TermReel

#include "termreel/timing/FramePacer.hpp"

namespace termreel::timing {

static constexpr double kDefaultFps = 30.0;
static constexpr int64_t kNanosPerSecond = 1'000'000'000;

FramePacer::FramePacer(double fps, std::shared_ptr<IWaitStrategy> wait)
    : wait_(wait ? std::move(wait) : std::make_shared<RealtimeWaitStrategy>()) {
  SetFps(fps);
}

void FramePacer::SetFps(double fps) {
  fps_ = fps > 0.0 ? fps : kDefaultFps;
  interval_ = std::chrono::nanoseconds(
      static_cast<int64_t>(static_cast<double>(kNanosPerSecond) / fps_));
}

void FramePacer::BeginFrame() {
  frame_start_ = std::chrono::steady_clock::now();
}

void FramePacer::EndFrame() {
  const auto deadline = frame_start_ + interval_;
  if (std::chrono::steady_clock::now() < deadline) {
    wait_->WaitUntil(deadline);
  } else {
    ++late_frames_;
  }
}

void FramePacer::Delay() {
  wait_->WaitUntil(std::chrono::steady_clock::now() + interval_);
}

}  // namespace termreel::timing
