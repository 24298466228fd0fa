// Repository: TermReel
// Component: Frame Scaler
// Copyright (c) 2025 TermReel

#include "termreel/render/FrameScaler.hpp"

#include <sstream>
#include <utility>

#include "termreel/util/Logger.hpp"

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace termreel::render {

using termreel::util::Logger;

namespace {

constexpr int kChannels = 3;
constexpr int kScaleFlags = SWS_BILINEAR | SWS_ACCURATE_RND;

}  // namespace

FrameScaler::FrameScaler() : sws_ctx_(nullptr) {}

FrameScaler::~FrameScaler() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

bool FrameScaler::Scale(const buffer::Frame& input, int width, int height,
                        buffer::Frame& output) {
  if (input.Empty() || width <= 0 || height <= 0) {
    return false;
  }

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      input.width, input.height, AV_PIX_FMT_GRAY8,
      width, height, AV_PIX_FMT_GRAY8,
      kScaleFlags, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    std::ostringstream oss;
    oss << "[FrameScaler] Failed to create scaler context " << input.width << "x"
        << input.height << " -> " << width << "x" << height;
    Logger::Error(oss.str());
    return false;
  }

  const std::size_t src_pixels = static_cast<std::size_t>(input.width) * input.height;
  const std::size_t dst_pixels = static_cast<std::size_t>(width) * height;
  src_plane_.resize(src_pixels);
  dst_plane_.resize(dst_pixels);

  buffer::Frame scaled(width, height);
  scaled.metadata = input.metadata;

  const uint8_t* src_data[4] = {src_plane_.data(), nullptr, nullptr, nullptr};
  const int src_linesize[4] = {input.width, 0, 0, 0};
  uint8_t* dst_data[4] = {dst_plane_.data(), nullptr, nullptr, nullptr};
  const int dst_linesize[4] = {width, 0, 0, 0};

  for (int c = 0; c < kChannels; ++c) {
    for (std::size_t i = 0; i < src_pixels; ++i) {
      src_plane_[i] = input.data[i * kChannels + c];
    }
    const int rows = sws_scale(sws_ctx_, src_data, src_linesize, 0, input.height,
                               dst_data, dst_linesize);
    if (rows != height) {
      std::ostringstream oss;
      oss << "[FrameScaler] sws_scale produced " << rows << " of " << height << " rows";
      Logger::Error(oss.str());
      return false;
    }
    for (std::size_t i = 0; i < dst_pixels; ++i) {
      scaled.data[i * kChannels + c] = dst_plane_[i];
    }
  }

  output = std::move(scaled);
  return true;
}

}  // namespace termreel::render
