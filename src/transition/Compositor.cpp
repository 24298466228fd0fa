// Repository: TermReel
// Component: Compositor
// Copyright (c) 2025 TermReel

#include "termreel/transition/Compositor.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

#include "termreel/render/Rasterizer.hpp"

namespace termreel::transition {

namespace {

uint8_t Saturate(double value) {
  return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

bool IsVertical(TransitionDirection direction) {
  return direction == TransitionDirection::kTop || direction == TransitionDirection::kBottom;
}

bool StartsAtOrigin(TransitionDirection direction) {
  return direction == TransitionDirection::kTop || direction == TransitionDirection::kLeft;
}

void CopyRow(buffer::Frame& dst, const buffer::Frame& src, int y) {
  std::memcpy(dst.Pixel(0, y), src.Pixel(0, y), static_cast<std::size_t>(dst.width) * 3);
}

void CopyColumn(buffer::Frame& dst, const buffer::Frame& src, int x) {
  for (int y = 0; y < dst.height; ++y) {
    std::memcpy(dst.Pixel(x, y), src.Pixel(x, y), 3);
  }
}

// Copies line `index` (row or column by direction) from src into dst.
void CopyLine(buffer::Frame& dst, const buffer::Frame& src, TransitionDirection direction,
              int index) {
  if (IsVertical(direction)) {
    CopyRow(dst, src, index);
  } else {
    CopyColumn(dst, src, index);
  }
}

void BandPixel(uint8_t* dst, const uint8_t* out, const uint8_t* in) {
  for (int c = 0; c < 3; ++c) {
    dst[c] = Saturate(0.5 * out[c] + 0.5 * in[c] + kScanBandBoost);
  }
}

void BandLine(buffer::Frame& dst, const buffer::Frame& outgoing, const buffer::Frame& incoming,
              TransitionDirection direction, int index) {
  if (IsVertical(direction)) {
    for (int x = 0; x < dst.width; ++x) {
      BandPixel(dst.Pixel(x, index), outgoing.Pixel(x, index), incoming.Pixel(x, index));
    }
  } else {
    for (int y = 0; y < dst.height; ++y) {
      BandPixel(dst.Pixel(index, y), outgoing.Pixel(index, y), incoming.Pixel(index, y));
    }
  }
}

}  // namespace

buffer::Frame Blend(const buffer::Frame& a, const buffer::Frame& b, double alpha, int gamma) {
  if (a.Empty()) {
    return b;
  }
  const buffer::Frame resized =
      b.SameShape(a) ? buffer::Frame() : render::Rasterizer::ResizeTo(b, a.width, a.height);
  const buffer::Frame& rhs = b.SameShape(a) ? b : resized;
  if (rhs.Empty()) {
    return a;
  }

  buffer::Frame out(a.width, a.height);
  out.metadata = a.metadata;
  const double wa = 1.0 - alpha;
  for (std::size_t i = 0; i < out.data.size(); ++i) {
    out.data[i] = Saturate(a.data[i] * wa + rhs.data[i] * alpha + gamma);
  }
  return out;
}

void NormalizePair(buffer::Frame& outgoing, buffer::Frame& incoming,
                   render::TerminalDimensions dims) {
  outgoing = render::Rasterizer::Resize(outgoing, dims);
  incoming = render::Rasterizer::Resize(incoming, dims);
  if (!incoming.SameShape(outgoing)) {
    incoming = render::Rasterizer::ResizeTo(incoming, outgoing.width, outgoing.height);
  }
}

int WipeBoundary(int extent, TransitionDirection direction, double progress) {
  const double p = std::clamp(progress, 0.0, 1.0);
  const double share = StartsAtOrigin(direction) ? p : 1.0 - p;
  return std::clamp(static_cast<int>(std::floor(extent * share)), 0, extent);
}

int ScanExtent(const buffer::Frame& frame, TransitionDirection direction) {
  return IsVertical(direction) ? frame.height : frame.width;
}

buffer::Frame WipeComposite(const buffer::Frame& outgoing, const buffer::Frame& incoming,
                            TransitionDirection direction, double progress) {
  buffer::Frame composite = outgoing;
  const int extent = ScanExtent(outgoing, direction);
  const int boundary = WipeBoundary(extent, direction, progress);

  const int first = StartsAtOrigin(direction) ? 0 : boundary;
  const int last = StartsAtOrigin(direction) ? boundary : extent;
  for (int i = first; i < last; ++i) {
    CopyLine(composite, incoming, direction, i);
  }
  return composite;
}

buffer::Frame ScanComposite(const buffer::Frame& outgoing, const buffer::Frame& incoming,
                            TransitionDirection direction, int cursor, int lead) {
  buffer::Frame composite = outgoing;
  const int extent = ScanExtent(outgoing, direction);
  const int swept = std::clamp(cursor + lead, 0, extent);

  for (int n = 0; n < swept; ++n) {
    const int index = StartsAtOrigin(direction) ? n : extent - 1 - n;
    CopyLine(composite, incoming, direction, index);
  }

  // Band lines sit just past the swept region; none once it covers the frame.
  for (int offset = 0; offset < kScanBandThickness; ++offset) {
    const int n = swept + offset;
    if (n >= extent) {
      break;
    }
    const int index = StartsAtOrigin(direction) ? n : extent - 1 - n;
    BandLine(composite, outgoing, incoming, direction, index);
  }
  return composite;
}

}  // namespace termreel::transition
