// Repository: TermReel
// Component: Player Engine
// Copyright (c) 2025 TermReel

#include "termreel/runtime/PlayerEngine.h"

#include <algorithm>
#include <sstream>

#include "termreel/sensor/DistanceSignal.hpp"
#include "termreel/util/Logger.hpp"

namespace termreel::runtime {

using termreel::util::Logger;
using transition::TransitionAlgorithm;
using transition::TransitionDirection;
using transition::TransitionSpec;

PlayerEngine::PlayerEngine(PlayerConfig config, decode::FrameSourceFactory factory,
                           output::IRenderSink& sink,
                           std::shared_ptr<const render::Rasterizer> rasterizer,
                           std::shared_ptr<timing::IWaitStrategy> wait)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      sink_(sink),
      rasterizer_(rasterizer ? std::move(rasterizer)
                             : std::make_shared<const render::Rasterizer>()),
      transitions_(rasterizer_, wait),
      pacer_(decode::kFallbackFps, wait) {
  transitions_.SetInterruptFlag(&running_);
}

PlayerEngine::~PlayerEngine() {
  Shutdown();
}

void PlayerEngine::AttachDistanceSignal(const sensor::DistanceSignal* signal,
                                        sensor::DistanceBandTable table) {
  distance_signal_ = signal;
  band_table_ = std::move(table);
}

void PlayerEngine::Enqueue(const std::string& path) {
  queue_.Push(PlaybackRequest::Play(path));
}

void PlayerEngine::EnqueueReturnToIdle() {
  queue_.Push(PlaybackRequest::ReturnToIdle());
}

EngineResult PlayerEngine::Start(TransitionAlgorithm algorithm, TransitionDirection direction) {
  EngineResult result = Initialize(algorithm, direction);
  if (!result.success) {
    return result;
  }
  while (Step()) {
  }
  Shutdown();
  return EngineResult(true, "Player stopped");
}

void PlayerEngine::Stop() {
  running_.store(false, std::memory_order_release);
}

EngineResult PlayerEngine::Initialize(TransitionAlgorithm algorithm,
                                      TransitionDirection direction) {
  if (initialized_) {
    return EngineResult(false, "Player already initialized", "ALREADY_RUNNING");
  }
  if (config_.transition_frames <= 0 || config_.scan_speed <= 0) {
    std::ostringstream oss;
    oss << "Invalid transition settings: frames=" << config_.transition_frames
        << " scan_speed=" << config_.scan_speed;
    Logger::Error("[PlayerEngine] " + oss.str());
    return EngineResult(false, oss.str(), "INVALID_CONFIG");
  }

  idle_source_ = factory_ ? factory_(config_.idle_path) : nullptr;
  if (!idle_source_) {
    Logger::Error("[PlayerEngine] Idle source unavailable: " + config_.idle_path);
    return EngineResult(false, "Cannot open idle source: " + config_.idle_path,
                        "IDLE_SOURCE_UNAVAILABLE");
  }

  algorithm_ = algorithm;
  direction_ = direction;
  pending_.reset();
  current_.reset();
  failed_path_.clear();
  retry_holdoff_ = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::kIdle;
    current_path_.clear();
    metrics_.state = State::kIdle;
  }
  initialized_ = true;
  running_.store(true, std::memory_order_release);

  std::ostringstream oss;
  oss << "[PlayerEngine] Started idle=" << config_.idle_path
      << " transition=" << transition::ToString(algorithm)
      << " direction=" << transition::ToString(direction)
      << " frames=" << config_.transition_frames;
  Logger::Info(oss.str());
  return EngineResult(true, "Player initialized");
}

bool PlayerEngine::Step() {
  if (!running_.load(std::memory_order_acquire) || !initialized_) {
    return false;
  }

  switch (state()) {
    case State::kIdle:
      PollDistanceSignal();
      StepIdle();
      break;
    case State::kTransitioning:
      StepTransition();
      break;
    case State::kPlaying:
      PollDistanceSignal();
      StepPlaying();
      break;
    case State::kStopped:
      return false;
  }
  return running_.load(std::memory_order_acquire);
}

void PlayerEngine::Shutdown() {
  running_.store(false, std::memory_order_release);
  if (!initialized_) {
    return;
  }
  initialized_ = false;

  if (current_) {
    current_->Close();
    current_.reset();
  }
  if (idle_source_) {
    idle_source_->Close();
    idle_source_.reset();
  }
  pending_.reset();
  queue_.Clear();
  sink_.Clear();

  SetCurrentPath(std::string());
  TransitionTo(State::kStopped);

  const MetricsSnapshot snapshot = Snapshot();
  std::ostringstream oss;
  oss << "[PlayerEngine] Stopped segment_frames=" << snapshot.segment_frames_total
      << " composite_frames=" << snapshot.composite_frames_total
      << " served=" << snapshot.requests_served_total
      << " dropped=" << snapshot.requests_dropped_total
      << " direct_cuts=" << snapshot.direct_cut_total
      << " self_loops=" << snapshot.self_loop_total;
  Logger::Info(oss.str());
}

// =============================================================================
// Idle
// =============================================================================

void PlayerEngine::StepIdle() {
  if (auto request = queue_.TryPop()) {
    if (request->IsReturnToIdle()) {
      Logger::Debug("[PlayerEngine] Return-to-idle while idle: ignored");
      return;
    }
    pending_ = std::move(request);
    transition_origin_ = State::kIdle;
    TransitionTo(State::kTransitioning);
    return;
  }

  if (RenderSegmentFrame(*idle_source_)) {
    return;
  }
  // End of the idle clip: loop from the top.
  if (!idle_source_->SeekToFrame(0)) {
    Logger::Warn("[PlayerEngine] Idle source rewind failed: " + config_.idle_path);
    return;
  }
  if (!RenderSegmentFrame(*idle_source_)) {
    Logger::Warn("[PlayerEngine] Idle source produced no frame after rewind: " +
                 config_.idle_path);
  }
}

// =============================================================================
// Transitioning: exactly one transition per request
// =============================================================================

void PlayerEngine::StepTransition() {
  if (!pending_) {
    TransitionTo(transition_origin_);
    return;
  }
  const PlaybackRequest request = std::move(*pending_);
  pending_.reset();

  if (request.IsReturnToIdle()) {
    if (!current_) {
      TransitionTo(State::kIdle);
      return;
    }
    if (!idle_source_->SeekToFrame(0)) {
      Logger::Warn("[PlayerEngine] Idle source rewind failed before return: " +
                   config_.idle_path);
    }
    RunTransition(*current_, *idle_source_, transition::Opposite(direction_));
    current_->Close();
    current_.reset();
    SetCurrentPath(std::string());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.requests_served_total;
    }
    TransitionTo(State::kIdle);
    return;
  }

  std::unique_ptr<decode::IFrameSource> next = factory_(request.path);
  if (!next) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.requests_dropped_total;
    }
    failed_path_ = request.path;
    retry_holdoff_ = config_.distance_retry_steps;
    const State fallback = current_ ? State::kPlaying : State::kIdle;
    Logger::Warn(std::string("[PlayerEngine] Cannot open ") + request.path +
                 ", request dropped; staying " + StateName(fallback));
    TransitionTo(fallback);
    return;
  }

  decode::IFrameSource& outgoing = current_ ? *current_ : *idle_source_;
  RunTransition(outgoing, *next, direction_);

  if (current_) {
    current_->Close();
  }
  current_ = std::move(next);
  SetCurrentPath(request.path);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.requests_served_total;
  }
  Logger::Info("[PlayerEngine] Playing " + request.path);
  TransitionTo(State::kPlaying);
}

void PlayerEngine::RunTransition(decode::IFrameSource& outgoing,
                                 decode::IFrameSource& incoming,
                                 TransitionDirection direction) {
  const int64_t remaining = outgoing.RemainingFrames();
  if (remaining >= 0 && remaining < config_.transition_frames) {
    std::ostringstream oss;
    oss << "[PlayerEngine] Direct cut " << outgoing.Path() << " -> " << incoming.Path()
        << " (remaining=" << remaining << " < " << config_.transition_frames << ")";
    Logger::Debug(oss.str());
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.direct_cut_total;
    return;
  }

  TransitionSpec spec;
  spec.algorithm = algorithm_;
  spec.direction = direction;
  spec.frame_budget = config_.transition_frames;
  spec.scan_speed = config_.scan_speed;
  spec.frames_per_second = transition::kTransitionFps;

  const transition::TransitionResult result =
      transitions_.Run(spec, outgoing, incoming, sink_.Dimensions(), sink_);

  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.composite_frames_total += static_cast<uint64_t>(result.frames_emitted);
}

// =============================================================================
// Playing
// =============================================================================

void PlayerEngine::StepPlaying() {
  if (auto request = queue_.TryPop()) {
    pending_ = std::move(request);
    transition_origin_ = State::kPlaying;
    TransitionTo(State::kTransitioning);
    return;
  }

  if (RenderSegmentFrame(*current_)) {
    return;
  }
  SelfLoop();
}

void PlayerEngine::SelfLoop() {
  const std::string path = current_->Path();
  const int64_t total = current_->FrameCount();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.self_loop_total;
  }

  if (total <= 0) {
    Logger::Debug("[PlayerEngine] Self-loop with unknown length, cutting: " + path);
    if (!current_->SeekToFrame(0)) {
      Logger::Warn("[PlayerEngine] Rewind failed: " + path);
    }
    return;
  }

  std::unique_ptr<decode::IFrameSource> fresh = factory_(path);
  if (!fresh) {
    Logger::Warn("[PlayerEngine] Self-loop reopen failed, rewinding: " + path);
    if (!current_->SeekToFrame(0)) {
      Logger::Warn("[PlayerEngine] Rewind failed: " + path);
    }
    return;
  }

  const int64_t tail_start = std::max<int64_t>(0, total - config_.transition_frames);
  if (!current_->SeekToFrame(tail_start)) {
    Logger::Warn("[PlayerEngine] Tail seek failed, cutting: " + path);
  } else {
    TransitionSpec spec;
    spec.algorithm = TransitionAlgorithm::kWipe;
    spec.direction = direction_;
    spec.frame_budget = config_.transition_frames;
    spec.scan_speed = config_.scan_speed;
    spec.frames_per_second = transition::kTransitionFps;

    const transition::TransitionResult result =
        transitions_.Run(spec, *current_, *fresh, sink_.Dimensions(), sink_);
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.composite_frames_total += static_cast<uint64_t>(result.frames_emitted);
  }

  current_->Close();
  current_ = std::move(fresh);
}

// =============================================================================
// Segment rendering
// =============================================================================

bool PlayerEngine::RenderSegmentFrame(decode::IFrameSource& source) {
  pacer_.SetFps(source.Fps());
  pacer_.BeginFrame();

  buffer::Frame frame;
  if (!source.Read(frame)) {
    return false;
  }

  const render::TerminalDimensions dims = sink_.Dimensions();
  sink_.Present(rasterizer_->Rasterize(frame, dims, sink_.line_mode()), 1.0 / pacer_.fps());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.segment_frames_total;
  }

  if (sink_.IsRealtime()) {
    pacer_.EndFrame();
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.late_frame_total = pacer_.late_frames();
  }
  return true;
}

void PlayerEngine::PollDistanceSignal() {
  if (distance_signal_ == nullptr || !band_table_) {
    return;
  }
  const std::string& target = band_table_->Lookup(distance_signal_->Latest());
  if (retry_holdoff_ > 0) {
    --retry_holdoff_;
    if (target == failed_path_) {
      return;
    }
  }
  if (target == HeadingIdentifier()) {
    return;
  }

  if (target == band_table_->fallback()) {
    Logger::Debug("[PlayerEngine] Distance band -> idle");
    EnqueueReturnToIdle();
  } else {
    Logger::Debug("[PlayerEngine] Distance band -> " + target);
    Enqueue(target);
  }
}

std::string PlayerEngine::HeadingIdentifier() const {
  if (std::optional<PlaybackRequest> newest = queue_.Newest()) {
    return newest->IsReturnToIdle() ? band_table_->fallback() : newest->path;
  }
  if (current_) {
    return current_->Path();
  }
  return band_table_->fallback();
}

// =============================================================================
// State bookkeeping
// =============================================================================

PlayerEngine::State PlayerEngine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string PlayerEngine::current_path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_path_;
}

PlayerEngine::MetricsSnapshot PlayerEngine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot = metrics_;
  snapshot.state = state_;
  return snapshot;
}

void PlayerEngine::TransitionTo(State to) {
  State from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    if (from == to) {
      return;
    }
    state_ = to;
    metrics_.state = to;
    ++metrics_.transitions[{from, to}];
  }
  Logger::Debug(std::string("[PlayerEngine] ") + StateName(from) + " -> " + StateName(to));
}

void PlayerEngine::SetCurrentPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_path_ = path;
}

const char* PlayerEngine::StateName(State state) {
  switch (state) {
    case State::kIdle: return "IDLE";
    case State::kTransitioning: return "TRANSITIONING";
    case State::kPlaying: return "PLAYING";
    case State::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

}  // namespace termreel::runtime
