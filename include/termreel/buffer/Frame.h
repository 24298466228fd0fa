// Repository: TermReel
// Component: Frame
// Purpose: Decoded RGB24 pixel grid passed between decode, render and
//          transition stages.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_BUFFER_FRAME_H_
#define TERMREEL_BUFFER_FRAME_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace termreel::buffer {

// FrameMetadata carries where a frame came from.
struct FrameMetadata {
  int64_t frame_index;   // Index within its source (0-based), -1 if synthetic
  double duration;       // Seconds (1 / fps)

  FrameMetadata() : frame_index(-1), duration(0.0) {}
};

// Frame is a height x width x 3 grid, row-major, 8 bits per channel (R, G, B).
//
// A frame is moved from stage to stage and dropped after it has been
// rasterized or composited; nothing keeps one longer than a single step.
struct Frame {
  int width;
  int height;
  std::vector<uint8_t> data;  // width * height * 3 bytes
  FrameMetadata metadata;

  Frame() : width(0), height(0) {}

  Frame(int w, int h) : width(w), height(h), data(Size(w, h), 0) {}

  static std::size_t Size(int w, int h) {
    if (w <= 0 || h <= 0) return 0;
    return static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3;
  }

  bool Empty() const { return width <= 0 || height <= 0 || data.empty(); }

  bool SameShape(const Frame& other) const {
    return width == other.width && height == other.height;
  }

  uint8_t* Pixel(int x, int y) {
    return data.data() + (static_cast<std::size_t>(y) * width + x) * 3;
  }

  const uint8_t* Pixel(int x, int y) const {
    return data.data() + (static_cast<std::size_t>(y) * width + x) * 3;
  }

  // Fill every pixel with one color.
  void Fill(uint8_t r, uint8_t g, uint8_t b) {
    for (std::size_t i = 0; i + 2 < data.size(); i += 3) {
      data[i] = r;
      data[i + 1] = g;
      data[i + 2] = b;
    }
  }
};

}  // namespace termreel::buffer

#endif  // TERMREEL_BUFFER_FRAME_H_
