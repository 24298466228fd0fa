// Repository: TermReel
// Component: Frame Scaler
// Purpose: libswscale bilinear resize of RGB24 frames.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RENDER_FRAME_SCALER_HPP_
#define TERMREEL_RENDER_FRAME_SCALER_HPP_

#include <cstdint>
#include <vector>

#include "termreel/buffer/Frame.h"

// Forward declaration (keeps FFmpeg headers out of this header)
struct SwsContext;

namespace termreel::render {

// FrameScaler resizes RGB24 frames with sws_scale.
//
// Each colour channel is scaled as its own GRAY8 plane so no colour-space
// round trip is involved; a solid colour stays that exact colour. The
// scaler context is cached across calls and rebuilt only when the source or
// destination size changes.
//
// Thread Safety:
// - Not thread-safe: one instance per thread.
class FrameScaler {
 public:
  FrameScaler();
  ~FrameScaler();

  FrameScaler(const FrameScaler&) = delete;
  FrameScaler& operator=(const FrameScaler&) = delete;

  // Writes `input` resized to width x height into `output` (metadata is
  // copied). Returns false, leaving `output` untouched, on an empty input,
  // a non-positive size or a scaler failure.
  bool Scale(const buffer::Frame& input, int width, int height, buffer::Frame& output);

 private:
  SwsContext* sws_ctx_;
  std::vector<uint8_t> src_plane_;
  std::vector<uint8_t> dst_plane_;
};

}  // namespace termreel::render

#endif  // TERMREEL_RENDER_FRAME_SCALER_HPP_
