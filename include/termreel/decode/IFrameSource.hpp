// Repository: TermReel
// Component: IFrameSource
// Purpose: Minimal decoder surface consumed by the renderer, the transition
//          engine and the player engine. Production uses FFmpegFrameSource;
//          tests inject scripted sources.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_DECODE_IFRAME_SOURCE_HPP_
#define TERMREEL_DECODE_IFRAME_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "termreel/buffer/Frame.h"

namespace termreel::decode {

// Frame rate used when a container does not report one.
inline constexpr double kFallbackFps = 30.0;

// IFrameSource yields decoded RGB frames on demand.
//
// Thread Safety:
// - Not thread-safe. A source is owned by exactly one loop at a time.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Opens the source. Returns false if the identifier cannot be resolved or
  // its codec is unsupported.
  virtual bool Open() = 0;

  // Releases decoder resources. Safe to call multiple times.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // Decodes the next frame. Returns false at end-of-stream or on error.
  virtual bool Read(buffer::Frame& output_frame) = 0;

  // Repositions so that the next Read() returns frame `frame_index`.
  virtual bool SeekToFrame(int64_t frame_index) = 0;

  virtual int Width() const = 0;
  virtual int Height() const = 0;

  // Total frames, or 0 if the container does not say.
  virtual int64_t FrameCount() const = 0;

  // Nominal frame rate; kFallbackFps when unreported.
  virtual double Fps() const = 0;

  // Index of the frame the next Read() will return.
  virtual int64_t Position() const = 0;

  virtual const std::string& Path() const = 0;

  // Frames left before end-of-stream, or -1 if the frame count is unknown.
  int64_t RemainingFrames() const {
    const int64_t total = FrameCount();
    if (total <= 0) return -1;
    const int64_t left = total - Position();
    return left > 0 ? left : 0;
  }
};

// Creates and opens a source for a path. Returns nullptr if Open() failed.
using FrameSourceFactory =
    std::function<std::unique_ptr<IFrameSource>(const std::string& path)>;

}  // namespace termreel::decode

#endif  // TERMREEL_DECODE_IFRAME_SOURCE_HPP_
