// Repository: TermReel
// Component: Video Renderer
// Purpose: Plays one clip start to finish onto a sink, paced on live
//          surfaces and as fast as possible into captures.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RUNTIME_VIDEO_RENDERER_HPP_
#define TERMREEL_RUNTIME_VIDEO_RENDERER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "termreel/decode/IFrameSource.hpp"
#include "termreel/output/IRenderSink.h"
#include "termreel/render/Rasterizer.hpp"
#include "termreel/timing/IWaitStrategy.hpp"

namespace termreel::runtime {

inline constexpr int kProgressBarCells = 20;

struct RendererConfig {
  std::string input_path;

  // Report progress lines while writing to a non-real-time sink.
  bool report_progress = true;
};

class VideoRenderer {
 public:
  using ProgressCallback = std::function<void(const std::string& line)>;

  VideoRenderer(decode::FrameSourceFactory factory, output::IRenderSink& sink,
                std::shared_ptr<const render::Rasterizer> rasterizer = nullptr,
                std::shared_ptr<timing::IWaitStrategy> wait = nullptr);

  // The loop stops when the flag reads false.
  void SetInterruptFlag(const std::atomic<bool>* running) { running_ = running; }

  // Receives FormatProgress() lines during capture.
  void SetProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

  // Returns false if the clip cannot be opened.
  bool Render(const RendererConfig& config);

  uint64_t frames_rendered() const { return frames_rendered_; }

  // "  |" + filled + empty + "| NN%", `cells` cells wide.
  // percent = floor(done / total * 100); total <= 0 reads as 0%.
  static std::string FormatProgress(int64_t done, int64_t total, int cells = kProgressBarCells);

 private:
  decode::FrameSourceFactory factory_;
  output::IRenderSink& sink_;
  std::shared_ptr<const render::Rasterizer> rasterizer_;
  std::shared_ptr<timing::IWaitStrategy> wait_;
  const std::atomic<bool>* running_ = nullptr;
  ProgressCallback progress_;
  uint64_t frames_rendered_ = 0;
};

}  // namespace termreel::runtime

#endif  // TERMREEL_RUNTIME_VIDEO_RENDERER_HPP_
