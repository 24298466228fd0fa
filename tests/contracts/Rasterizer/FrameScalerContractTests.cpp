// Repository: TermReel
// Component: Frame Scaler Contract Tests
// Purpose: libswscale resize keeps size, colour, gradients and metadata.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include "termreel/buffer/Frame.h"
#include "termreel/render/FrameScaler.hpp"
#include "termreel/render/Rasterizer.hpp"

namespace termreel::tests::contracts {

using buffer::Frame;
using render::FrameScaler;
using render::Rasterizer;

namespace {

// Red ramps left to right, blue is constant.
Frame HorizontalRamp(int w, int h) {
  Frame frame(w, h);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      uint8_t* px = frame.Pixel(x, y);
      px[0] = static_cast<uint8_t>(x * 255 / (w - 1));
      px[1] = 0;
      px[2] = 77;
    }
  }
  return frame;
}

}  // namespace

TEST(FrameScalerContractTest, DownscaleProducesRequestedShape) {
  FrameScaler scaler;
  Frame src(640, 480);
  src.Fill(12, 34, 56);
  src.metadata.frame_index = 9;

  Frame out;
  ASSERT_TRUE(scaler.Scale(src, 32, 24, out));
  EXPECT_EQ(out.width, 32);
  EXPECT_EQ(out.height, 24);
  EXPECT_EQ(out.data.size(), Frame::Size(32, 24));
  EXPECT_EQ(out.metadata.frame_index, 9);
  EXPECT_NEAR(out.Pixel(16, 12)[0], 12, 1);
  EXPECT_NEAR(out.Pixel(16, 12)[1], 34, 1);
  EXPECT_NEAR(out.Pixel(16, 12)[2], 56, 1);
}

TEST(FrameScalerContractTest, UpscaledRampStaysMonotonicPerChannel) {
  FrameScaler scaler;
  Frame out;
  ASSERT_TRUE(scaler.Scale(HorizontalRamp(8, 4), 40, 12, out));

  for (int y = 0; y < out.height; ++y) {
    for (int x = 1; x < out.width; ++x) {
      EXPECT_GE(out.Pixel(x, y)[0], out.Pixel(x - 1, y)[0]) << "x=" << x << " y=" << y;
      EXPECT_NEAR(out.Pixel(x, y)[1], 0, 1);
      EXPECT_NEAR(out.Pixel(x, y)[2], 77, 1);
    }
  }
  EXPECT_LT(out.Pixel(0, 0)[0], 40);
  EXPECT_GT(out.Pixel(out.width - 1, 0)[0], 215);
}

TEST(FrameScalerContractTest, ContextIsReusedAcrossSizeChanges) {
  FrameScaler scaler;
  Frame src(20, 10);
  src.Fill(255, 255, 255);

  Frame small;
  ASSERT_TRUE(scaler.Scale(src, 10, 5, small));
  Frame large;
  ASSERT_TRUE(scaler.Scale(src, 60, 30, large));
  Frame again;
  ASSERT_TRUE(scaler.Scale(src, 10, 5, again));

  EXPECT_EQ(large.width, 60);
  EXPECT_EQ(again.data, small.data);
  EXPECT_NEAR(large.Pixel(59, 29)[0], 255, 1);
}

TEST(FrameScalerContractTest, RejectsEmptyInputAndBadSize) {
  FrameScaler scaler;
  Frame out(2, 2);
  out.Fill(1, 2, 3);

  EXPECT_FALSE(scaler.Scale(Frame(), 4, 4, out));
  Frame src(4, 4);
  EXPECT_FALSE(scaler.Scale(src, 0, 4, out));
  EXPECT_FALSE(scaler.Scale(src, 4, -1, out));

  // Untouched on failure.
  EXPECT_EQ(out.width, 2);
  EXPECT_EQ(out.Pixel(1, 1)[2], 3);
}

TEST(FrameScalerContractTest, RasterizerResizeGoesThroughScaler) {
  const Frame src = HorizontalRamp(64, 48);
  FrameScaler scaler;
  Frame direct;
  ASSERT_TRUE(scaler.Scale(src, 16, 12, direct));

  const Frame resized = Rasterizer::ResizeTo(src, 16, 12);
  EXPECT_EQ(resized.data, direct.data);
}

}  // namespace termreel::tests::contracts
