// Repository: TermReel
// Component: Rasterizer
// Copyright (c) 2025 TermReel

#include "termreel/render/Rasterizer.hpp"

#include <algorithm>
#include <utility>

#include "termreel/render/FrameScaler.hpp"

namespace termreel::render {

namespace {

// Guards integer truncation against factors like 4.9999999 for exact ratios.
constexpr double kTruncateEpsilon = 1e-9;

int ScaledExtent(int extent, double factor) {
  const double scaled = static_cast<double>(extent) * factor / 100.0;
  return std::max(1, static_cast<int>(scaled + kTruncateEpsilon));
}

}  // namespace

Rasterizer::Rasterizer(std::shared_ptr<const IGlyphMapper> mapper)
    : mapper_(mapper ? std::move(mapper) : std::make_shared<LuminanceGlyphMapper>()) {}

buffer::Frame Rasterizer::Resize(const buffer::Frame& frame, TerminalDimensions dims) {
  if (frame.Empty() || dims.rows <= 0) {
    return frame;
  }
  const double factor = static_cast<double>(dims.rows) / frame.height * 100.0;
  return ResizeTo(frame, ScaledExtent(frame.width, factor), ScaledExtent(frame.height, factor));
}

buffer::Frame Rasterizer::ResizeTo(const buffer::Frame& frame, int width, int height) {
  if (frame.Empty() || width <= 0 || height <= 0) {
    return buffer::Frame();
  }
  if (frame.width == width && frame.height == height) {
    return frame;
  }

  thread_local FrameScaler scaler;
  buffer::Frame out;
  if (!scaler.Scale(frame, width, height, out)) {
    return buffer::Frame();
  }
  return out;
}

int Rasterizer::PrintingWidth(int columns, int frame_width) {
  return std::max(0, std::min(columns, frame_width * 2) / 2);
}

std::string Rasterizer::ToCharacters(const buffer::Frame& frame, TerminalDimensions dims,
                                     LineMode mode) const {
  std::string msg;
  if (frame.Empty() || dims.columns <= 0) {
    msg += "\r\n";
    return msg;
  }

  const int printing_width = PrintingWidth(dims.columns, frame.width);
  const int pad = std::max(dims.columns - printing_width * 2, 0);
  const int row_count = frame.height - 1;

  msg.reserve(static_cast<size_t>(std::max(row_count, 0)) *
                  static_cast<size_t>(dims.columns + 1) + 2);
  for (int y = 0; y < row_count; ++y) {
    for (int x = 0; x < printing_width; ++x) {
      const uint8_t* px = frame.Pixel(x, y);
      const char glyph = mapper_->Map(px[0], px[1], px[2]);
      msg += glyph;
      msg += glyph;
    }
    if (mode == LineMode::kLineBreaks) {
      msg += '\n';
    } else {
      msg.append(static_cast<size_t>(pad), ' ');
    }
  }
  msg += "\r\n";
  return msg;
}

std::string Rasterizer::Rasterize(const buffer::Frame& frame, TerminalDimensions dims,
                                  LineMode mode) const {
  return ToCharacters(Resize(frame, dims), dims, mode);
}

}  // namespace termreel::render
