// Repository: TermReel
// Component: Video Renderer
// Copyright (c) 2025 TermReel

#include "termreel/runtime/VideoRenderer.hpp"

#include <sstream>

#include "termreel/timing/FramePacer.hpp"
#include "termreel/util/Logger.hpp"

namespace termreel::runtime {

using termreel::util::Logger;

namespace {

constexpr const char* kFilledCell = "\xe2\x96\x88";  // U+2588
constexpr const char* kEmptyCell = "\xe2\x96\x91";   // U+2591

}  // namespace

VideoRenderer::VideoRenderer(decode::FrameSourceFactory factory, output::IRenderSink& sink,
                             std::shared_ptr<const render::Rasterizer> rasterizer,
                             std::shared_ptr<timing::IWaitStrategy> wait)
    : factory_(std::move(factory)),
      sink_(sink),
      rasterizer_(rasterizer ? std::move(rasterizer)
                             : std::make_shared<const render::Rasterizer>()),
      wait_(std::move(wait)) {}

bool VideoRenderer::Render(const RendererConfig& config) {
  std::unique_ptr<decode::IFrameSource> source = factory_ ? factory_(config.input_path) : nullptr;
  if (!source) {
    Logger::Error("[VideoRenderer] Cannot open " + config.input_path);
    return false;
  }

  timing::FramePacer pacer(source->Fps(), wait_);
  const int64_t total = source->FrameCount();
  const bool realtime = sink_.IsRealtime();
  const double duration = 1.0 / pacer.fps();

  {
    std::ostringstream oss;
    oss << "[VideoRenderer] Rendering " << config.input_path << " " << source->Width() << "x"
        << source->Height() << " @" << pacer.fps() << "fps frames=" << total << " sink="
        << sink_.GetName();
    Logger::Info(oss.str());
  }

  frames_rendered_ = 0;
  while (running_ == nullptr || running_->load(std::memory_order_acquire)) {
    pacer.BeginFrame();
    buffer::Frame frame;
    if (!source->Read(frame)) {
      break;
    }

    if (!realtime && config.report_progress && progress_) {
      progress_(FormatProgress(static_cast<int64_t>(frames_rendered_), total));
    }

    const render::TerminalDimensions dims = sink_.Dimensions();
    sink_.Present(rasterizer_->Rasterize(frame, dims, sink_.line_mode()), duration);
    ++frames_rendered_;

    if (sink_.GetStatus() == output::SinkStatus::kError) {
      Logger::Error("[VideoRenderer] Sink failed: " + sink_.GetName());
      source->Close();
      return false;
    }
    if (realtime) {
      pacer.EndFrame();
    }
  }

  source->Close();
  std::ostringstream oss;
  oss << "[VideoRenderer] Done frames=" << frames_rendered_ << " late=" << pacer.late_frames();
  Logger::Info(oss.str());
  return true;
}

std::string VideoRenderer::FormatProgress(int64_t done, int64_t total, int cells) {
  int percent = 0;
  if (total > 0 && done > 0) {
    percent = static_cast<int>(static_cast<double>(done) / static_cast<double>(total) * 100.0);
  }
  if (percent > 100) percent = 100;
  const int filled = cells * percent / 100;

  std::string line = "  |";
  for (int i = 0; i < cells; ++i) {
    line += i < filled ? kFilledCell : kEmptyCell;
  }
  line += "| " + std::to_string(percent) + "%";
  return line;
}

}  // namespace termreel::runtime
