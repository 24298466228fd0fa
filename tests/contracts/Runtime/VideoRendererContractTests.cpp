// Repository: TermReel
// Component: Video Renderer Contract Tests
// Purpose: Single-clip playback, capture progress reporting and pacing.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "fixtures/FakeFrameSource.h"
#include "fixtures/NoWaitStrategy.h"
#include "fixtures/RecordingSink.h"
#include "termreel/runtime/VideoRenderer.hpp"

namespace termreel::tests::contracts {

using fixtures::FakeClip;
using fixtures::FakeSourceLibrary;
using fixtures::NoWaitStrategy;
using fixtures::RecordingSink;
using runtime::RendererConfig;
using runtime::VideoRenderer;

namespace {

constexpr const char* kFull = "\xe2\x96\x88";
constexpr const char* kEmpty = "\xe2\x96\x91";

std::string Bar(int filled, int empty) {
  std::string out;
  for (int i = 0; i < filled; ++i) out += kFull;
  for (int i = 0; i < empty; ++i) out += kEmpty;
  return out;
}

RendererConfig Config(const std::string& path) {
  RendererConfig config;
  config.input_path = path;
  return config;
}

}  // namespace

class VideoRendererContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FakeClip clip;
    clip.frame_count = 12;
    clip.fps = 24.0;
    clip.r = clip.g = clip.b = 255;
    library_.Add("clip.mp4", clip);
  }

  FakeSourceLibrary library_;
  std::shared_ptr<NoWaitStrategy> wait_ = std::make_shared<NoWaitStrategy>();
};

TEST_F(VideoRendererContractTest, RendersEveryFrameIntoCapture) {
  RecordingSink sink;
  VideoRenderer renderer(library_.Factory(), sink, nullptr, wait_);

  EXPECT_TRUE(renderer.Render(Config("clip.mp4")));
  EXPECT_EQ(renderer.frames_rendered(), 12u);
  EXPECT_EQ(sink.frame_count(), 12u);
  EXPECT_EQ(wait_->wait_count(), 0u);
  for (double d : sink.durations()) {
    EXPECT_DOUBLE_EQ(d, 1.0 / 24.0);
  }
}

TEST_F(VideoRendererContractTest, UnopenableClipFails) {
  RecordingSink sink;
  VideoRenderer renderer(library_.Factory(), sink, nullptr, wait_);
  EXPECT_FALSE(renderer.Render(Config("missing.mp4")));
  EXPECT_EQ(sink.frame_count(), 0u);
}

TEST_F(VideoRendererContractTest, CaptureReportsProgressPerFrame) {
  RecordingSink sink;
  VideoRenderer renderer(library_.Factory(), sink, nullptr, wait_);
  std::vector<std::string> lines;
  renderer.SetProgressCallback([&lines](const std::string& line) { lines.push_back(line); });

  ASSERT_TRUE(renderer.Render(Config("clip.mp4")));
  ASSERT_EQ(lines.size(), 12u);
  EXPECT_EQ(lines.front(), VideoRenderer::FormatProgress(0, 12));
  EXPECT_EQ(lines.back(), VideoRenderer::FormatProgress(11, 12));
}

TEST_F(VideoRendererContractTest, ProgressCanBeDisabled) {
  RecordingSink sink;
  VideoRenderer renderer(library_.Factory(), sink, nullptr, wait_);
  int calls = 0;
  renderer.SetProgressCallback([&calls](const std::string&) { ++calls; });

  RendererConfig config = Config("clip.mp4");
  config.report_progress = false;
  ASSERT_TRUE(renderer.Render(config));
  EXPECT_EQ(calls, 0);
}

TEST_F(VideoRendererContractTest, RealtimeSinkIsPacedWithoutProgress) {
  RecordingSink live(render::TerminalDimensions(40, 8), /*realtime=*/true);
  VideoRenderer renderer(library_.Factory(), live, nullptr, wait_);
  int calls = 0;
  renderer.SetProgressCallback([&calls](const std::string&) { ++calls; });

  ASSERT_TRUE(renderer.Render(Config("clip.mp4")));
  EXPECT_EQ(live.frame_count(), 12u);
  EXPECT_EQ(calls, 0);
  // Each frame either waited out its interval or counted as late.
  EXPECT_LE(wait_->wait_count(), 12u);
  EXPECT_GE(wait_->wait_count(), 1u);
}

TEST_F(VideoRendererContractTest, ClearedRunningFlagStopsPlayback) {
  RecordingSink sink;
  VideoRenderer renderer(library_.Factory(), sink, nullptr, wait_);
  std::atomic<bool> running{false};
  renderer.SetInterruptFlag(&running);

  EXPECT_TRUE(renderer.Render(Config("clip.mp4")));
  EXPECT_EQ(sink.frame_count(), 0u);
}

TEST(VideoRendererProgressTest, FormatsBarAndPercent) {
  EXPECT_EQ(VideoRenderer::FormatProgress(0, 100), "  |" + Bar(0, 20) + "| 0%");
  EXPECT_EQ(VideoRenderer::FormatProgress(42, 100), "  |" + Bar(8, 12) + "| 42%");
  EXPECT_EQ(VideoRenderer::FormatProgress(100, 100), "  |" + Bar(20, 0) + "| 100%");
  EXPECT_EQ(VideoRenderer::FormatProgress(1, 3), "  |" + Bar(6, 14) + "| 33%");
}

TEST(VideoRendererProgressTest, UnknownTotalReadsZeroAndOverflowCaps) {
  EXPECT_EQ(VideoRenderer::FormatProgress(50, 0), "  |" + Bar(0, 20) + "| 0%");
  EXPECT_EQ(VideoRenderer::FormatProgress(150, 100), "  |" + Bar(20, 0) + "| 100%");
  EXPECT_EQ(VideoRenderer::FormatProgress(5, 10, 4), "  |" + Bar(2, 2) + "| 50%");
}

}  // namespace termreel::tests::contracts
