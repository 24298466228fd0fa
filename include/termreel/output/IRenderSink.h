// Repository: TermReel
// Component: IRenderSink Interface
// Purpose: Interface for surfaces that consume rasterized text blocks.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_OUTPUT_IRENDER_SINK_H_
#define TERMREEL_OUTPUT_IRENDER_SINK_H_

#include <string>

#include "termreel/render/Rasterizer.hpp"
#include "termreel/render/TerminalDimensions.hpp"

namespace termreel::output {

// SinkStatus represents the current state of a render sink.
enum class SinkStatus {
  kIdle,      // Sink created but not started
  kRunning,   // Sink is accepting frames
  kError,     // A write failed; further frames are dropped
  kStopped    // Sink has been finalized
};

// IRenderSink is the interface for render surfaces.
//
// A sink receives one fully-formed text block per frame. It owns its
// surface (terminal or capture file), reports the printing area, and says
// whether frames must be paced in real time.
//
// A sink explicitly does NOT:
// - Rasterize (the caller rasterizes with line_mode())
// - Pace (the caller sleeps when IsRealtime() is true)
// - Know about playback state
class IRenderSink {
 public:
  virtual ~IRenderSink() = default;

  // Prepares the surface. Returns false if it cannot be used.
  virtual bool Start() = 0;

  // Finalizes the surface. Safe to call multiple times.
  virtual void Stop() = 0;

  // Emits one frame. duration_seconds is the frame's nominal display time.
  virtual void Present(const std::string& block, double duration_seconds) = 0;

  // Blanks the surface.
  virtual void Clear() = 0;

  // Printing area, sampled fresh on every call.
  virtual render::TerminalDimensions Dimensions() const = 0;

  // Row layout the sink expects from the Rasterizer.
  virtual render::LineMode line_mode() const = 0;

  // True for live surfaces (paced), false for capture (no delay).
  virtual bool IsRealtime() const = 0;

  virtual SinkStatus GetStatus() const = 0;

  // Human-readable name for logging.
  virtual std::string GetName() const = 0;
};

}  // namespace termreel::output

#endif  // TERMREEL_OUTPUT_IRENDER_SINK_H_
