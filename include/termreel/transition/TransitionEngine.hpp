// Repository: TermReel
// Component: Transition Engine
// Purpose: Emits the composite frame sequence between an outgoing and an
//          incoming source.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TRANSITION_TRANSITION_ENGINE_HPP_
#define TERMREEL_TRANSITION_TRANSITION_ENGINE_HPP_

#include <atomic>
#include <memory>

#include "termreel/decode/IFrameSource.hpp"
#include "termreel/output/IRenderSink.h"
#include "termreel/render/Rasterizer.hpp"
#include "termreel/render/TerminalDimensions.hpp"
#include "termreel/timing/IWaitStrategy.hpp"
#include "termreel/transition/TransitionTypes.hpp"

namespace termreel::timing {
class FramePacer;
}

namespace termreel::transition {

// TransitionEngine drives one transition to completion on the caller's
// thread.
//
// Per emitted composite it reads one frame from each source, normalizes
// both to the terminal dimensions snapshot, composites, rasterizes with
// the sink's line mode and presents. Real-time sinks get a fixed delay of
// one frame interval after every composite; capture sinks get none.
//
// Early termination:
// - crossfade/wipe: if either source runs dry the transition ends and the
//   still-available frame is returned (incoming preferred).
// - scan: a source that runs dry keeps contributing its last frame.
// - the running flag (if set) is polled before every composite.
class TransitionEngine {
 public:
  // nullptr rasterizer selects the default glyph ramp; nullptr wait
  // selects RealtimeWaitStrategy.
  explicit TransitionEngine(std::shared_ptr<const render::Rasterizer> rasterizer = nullptr,
                            std::shared_ptr<timing::IWaitStrategy> wait = nullptr);

  // Flag owned by the caller; the transition stops when it reads false.
  void SetInterruptFlag(const std::atomic<bool>* running) { running_ = running; }

  TransitionResult Run(const TransitionSpec& spec, decode::IFrameSource& outgoing,
                       decode::IFrameSource& incoming, render::TerminalDimensions dims,
                       output::IRenderSink& sink);

 private:
  // Crossfade and wipe: frame_budget composites at progress i / budget.
  TransitionResult RunBudgeted(const TransitionSpec& spec, decode::IFrameSource& outgoing,
                               decode::IFrameSource& incoming,
                               render::TerminalDimensions dims, output::IRenderSink& sink,
                               timing::FramePacer& pacer);

  TransitionResult RunScan(const TransitionSpec& spec, decode::IFrameSource& outgoing,
                           decode::IFrameSource& incoming, render::TerminalDimensions dims,
                           output::IRenderSink& sink, timing::FramePacer& pacer);

  void Emit(const buffer::Frame& composite, render::TerminalDimensions dims,
            output::IRenderSink& sink, timing::FramePacer& pacer, double duration_seconds);

  bool Interrupted() const;

  std::shared_ptr<const render::Rasterizer> rasterizer_;
  std::shared_ptr<timing::IWaitStrategy> wait_;
  const std::atomic<bool>* running_ = nullptr;
};

}  // namespace termreel::transition

#endif  // TERMREEL_TRANSITION_TRANSITION_ENGINE_HPP_
