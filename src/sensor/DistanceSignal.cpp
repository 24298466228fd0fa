// Repository: TermReel
// Component: Distance Signal
// Copyright (c) 2025 TermReel

#include "termreel/sensor/DistanceSignal.hpp"

#include <sstream>

#include "termreel/util/Logger.hpp"

namespace termreel::sensor {

using termreel::util::Logger;

DistanceSignal::DistanceSignal(std::unique_ptr<IDistanceTransport> transport,
                               DistanceSignalConfig config)
    : transport_(std::move(transport)),
      config_(config),
      window_(config.window_capacity, config.initial_value),
      published_(config.initial_value) {}

DistanceSignal::~DistanceSignal() {
  Stop();
}

bool DistanceSignal::Start() {
  if (running_.load(std::memory_order_acquire)) {
    Logger::Warn("[DistanceSignal] Start ignored: already running");
    return false;
  }
  if (!transport_) {
    Logger::Error("[DistanceSignal] Start failed: no transport");
    return false;
  }
  if (!transport_->Open()) {
    Logger::Error("[DistanceSignal] Start failed: cannot open " + transport_->Describe());
    return false;
  }

  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&DistanceSignal::SamplingLoop, this);
  Logger::Info("[DistanceSignal] Sampling " + transport_->Describe());
  return true;
}

void DistanceSignal::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    running_.store(false, std::memory_order_release);
  }
  stop_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    transport_->Close();

    std::ostringstream oss;
    oss << "[DistanceSignal] Stopped accepted=" << accepted_samples()
        << " rejected=" << rejected_samples() << " errors=" << transport_errors();
    Logger::Info(oss.str());
  }
}

double DistanceSignal::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

bool DistanceSignal::Offer(float sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!(sample > 0.0f && sample <= config_.ceiling)) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  window_.Push(sample);
  published_ = window_.Mean();
  accepted_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

// =============================================================================
// SamplingLoop: one reading per iteration until Stop()
// =============================================================================

void DistanceSignal::SamplingLoop() {
  while (running_.load(std::memory_order_acquire)) {
    float value = 0.0f;
    switch (transport_->ReadSample(value)) {
      case SampleStatus::kSample:
        if (!Offer(value)) {
          std::ostringstream oss;
          oss << "[DistanceSignal] Rejected sample " << value;
          Logger::Debug(oss.str());
        }
        break;
      case SampleStatus::kTimeout:
        break;
      case SampleStatus::kError: {
        errors_.fetch_add(1, std::memory_order_relaxed);
        Logger::Warn("[DistanceSignal] Read failed on " + transport_->Describe() +
                     ", backing off");
        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait_for(lock, config_.error_backoff, [this] {
          return !running_.load(std::memory_order_acquire);
        });
        break;
      }
    }
  }
}

}  // namespace termreel::sensor
