// Repository: TermReel
// Component: Transition Engine
// Copyright (c) 2025 TermReel

#include "termreel/transition/TransitionEngine.hpp"

#include <sstream>
#include <utility>

#include "termreel/timing/FramePacer.hpp"
#include "termreel/transition/Compositor.hpp"
#include "termreel/util/Logger.hpp"

namespace termreel::transition {

using termreel::util::Logger;

TransitionEngine::TransitionEngine(std::shared_ptr<const render::Rasterizer> rasterizer,
                                   std::shared_ptr<timing::IWaitStrategy> wait)
    : rasterizer_(rasterizer ? std::move(rasterizer)
                             : std::make_shared<const render::Rasterizer>()),
      wait_(wait ? std::move(wait) : std::make_shared<timing::RealtimeWaitStrategy>()) {}

bool TransitionEngine::Interrupted() const {
  return running_ != nullptr && !running_->load(std::memory_order_acquire);
}

TransitionResult TransitionEngine::Run(const TransitionSpec& spec,
                                       decode::IFrameSource& outgoing,
                                       decode::IFrameSource& incoming,
                                       render::TerminalDimensions dims,
                                       output::IRenderSink& sink) {
  if (!spec.IsValid()) {
    std::ostringstream oss;
    oss << "[TransitionEngine] Invalid transition: frame_budget=" << spec.frame_budget
        << " scan_speed=" << spec.scan_speed << " fps=" << spec.frames_per_second;
    Logger::Error(oss.str());
    return TransitionResult{};
  }

  {
    std::ostringstream oss;
    oss << "[TransitionEngine] " << ToString(spec.algorithm) << " from "
        << ToString(spec.direction) << ": " << outgoing.Path() << " -> " << incoming.Path()
        << " dims=" << dims.columns << "x" << dims.rows;
    Logger::Debug(oss.str());
  }

  timing::FramePacer pacer(spec.frames_per_second, wait_);
  TransitionResult result;
  switch (spec.algorithm) {
    case TransitionAlgorithm::kCrossfade:
    case TransitionAlgorithm::kWipe:
      result = RunBudgeted(spec, outgoing, incoming, dims, sink, pacer);
      break;
    case TransitionAlgorithm::kScan:
      result = RunScan(spec, outgoing, incoming, dims, sink, pacer);
      break;
  }

  std::ostringstream oss;
  oss << "[TransitionEngine] " << ToString(spec.algorithm)
      << " done frames=" << result.frames_emitted
      << " completed=" << (result.completed ? "yes" : "no")
      << (result.interrupted ? " interrupted" : "");
  Logger::Debug(oss.str());
  return result;
}

TransitionResult TransitionEngine::RunBudgeted(const TransitionSpec& spec,
                                               decode::IFrameSource& outgoing,
                                               decode::IFrameSource& incoming,
                                               render::TerminalDimensions dims,
                                               output::IRenderSink& sink,
                                               timing::FramePacer& pacer) {
  TransitionResult result;
  const double duration = 1.0 / spec.frames_per_second;

  for (int i = 0; i < spec.frame_budget; ++i) {
    if (Interrupted()) {
      result.interrupted = true;
      return result;
    }

    buffer::Frame out_frame;
    buffer::Frame in_frame;
    const bool have_out = outgoing.Read(out_frame);
    const bool have_in = incoming.Read(in_frame);
    if (!have_out || !have_in) {
      if (have_in) {
        result.last_frame = std::move(in_frame);
      } else if (have_out) {
        result.last_frame = std::move(out_frame);
      } else {
        result.last_frame.reset();
      }
      return result;
    }

    NormalizePair(out_frame, in_frame, dims);
    const double progress = static_cast<double>(i) / spec.frame_budget;
    buffer::Frame composite =
        spec.algorithm == TransitionAlgorithm::kCrossfade
            ? Blend(out_frame, in_frame, progress)
            : WipeComposite(out_frame, in_frame, spec.direction, progress);

    Emit(composite, dims, sink, pacer, duration);
    ++result.frames_emitted;
    result.last_frame = std::move(composite);
  }

  result.completed = true;
  return result;
}

TransitionResult TransitionEngine::RunScan(const TransitionSpec& spec,
                                           decode::IFrameSource& outgoing,
                                           decode::IFrameSource& incoming,
                                           render::TerminalDimensions dims,
                                           output::IRenderSink& sink,
                                           timing::FramePacer& pacer) {
  TransitionResult result;
  const double duration = 1.0 / spec.frames_per_second;

  buffer::Frame out_frame;
  buffer::Frame in_frame;
  const bool have_out = outgoing.Read(out_frame);
  const bool have_in = incoming.Read(in_frame);
  if (!have_out || !have_in) {
    if (have_in) {
      result.last_frame = std::move(in_frame);
    } else if (have_out) {
      result.last_frame = std::move(out_frame);
    }
    return result;
  }
  NormalizePair(out_frame, in_frame, dims);

  const int extent = ScanExtent(out_frame, spec.direction);
  for (int cursor = 0; cursor < extent; cursor += spec.scan_speed) {
    if (Interrupted()) {
      result.interrupted = true;
      return result;
    }

    if (cursor > 0) {
      // A dry source keeps its last frame.
      buffer::Frame next_out;
      buffer::Frame next_in;
      const bool fresh_out = outgoing.Read(next_out);
      const bool fresh_in = incoming.Read(next_in);
      if (fresh_out) out_frame = std::move(next_out);
      if (fresh_in) in_frame = std::move(next_in);
      if (fresh_out || fresh_in) {
        NormalizePair(out_frame, in_frame, dims);
      }
    }

    buffer::Frame composite =
        ScanComposite(out_frame, in_frame, spec.direction, cursor, spec.scan_speed);
    Emit(composite, dims, sink, pacer, duration);
    ++result.frames_emitted;
    result.last_frame = std::move(composite);
  }

  result.completed = true;
  return result;
}

void TransitionEngine::Emit(const buffer::Frame& composite, render::TerminalDimensions dims,
                            output::IRenderSink& sink, timing::FramePacer& pacer,
                            double duration_seconds) {
  sink.Present(rasterizer_->ToCharacters(composite, dims, sink.line_mode()), duration_seconds);
  if (sink.IsRealtime()) {
    pacer.Delay();
  }
}

}  // namespace termreel::transition
