// Repository: TermReel
// Component: Distance Signal
// Purpose: Background sampling of a distance transport into a smoothed,
//          non-blocking readable value.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_SENSOR_DISTANCE_SIGNAL_HPP_
#define TERMREEL_SENSOR_DISTANCE_SIGNAL_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "termreel/sensor/IDistanceTransport.hpp"
#include "termreel/sensor/SmoothingWindow.hpp"

namespace termreel::sensor {

struct DistanceSignalConfig {
  // Samples must satisfy 0 < v <= ceiling.
  float ceiling = 700.0f;

  std::size_t window_capacity = 10;

  // Published before the first valid sample.
  double initial_value = 100.0;

  // Pause after a transport error.
  std::chrono::milliseconds error_backoff{100};
};

// DistanceSignal owns one sampling thread.
//
// Loop: poll running flag -> read transport -> validity filter -> window
// push -> mean publish. Filter, push and publish happen under one short
// mutex; Latest() takes the same mutex and never waits on the transport.
//
// Transport errors are logged (warn) and followed by error_backoff; the
// loop keeps going. Timeouts are silent.
class DistanceSignal {
 public:
  explicit DistanceSignal(std::unique_ptr<IDistanceTransport> transport,
                          DistanceSignalConfig config = DistanceSignalConfig{});
  ~DistanceSignal();

  DistanceSignal(const DistanceSignal&) = delete;
  DistanceSignal& operator=(const DistanceSignal&) = delete;

  // Opens the transport and spawns the sampling thread. Returns false if
  // the transport cannot be opened or the signal is already running.
  bool Start();

  // Joins the sampling thread and closes the transport. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Current smoothed value.
  double Latest() const;

  // Filter + push + publish for one sample. Returns true if accepted.
  // The sampling loop calls this; exposed for deterministic tests.
  bool Offer(float sample);

  uint64_t accepted_samples() const { return accepted_.load(std::memory_order_relaxed); }
  uint64_t rejected_samples() const { return rejected_.load(std::memory_order_relaxed); }
  uint64_t transport_errors() const { return errors_.load(std::memory_order_relaxed); }

 private:
  void SamplingLoop();

  std::unique_ptr<IDistanceTransport> transport_;
  DistanceSignalConfig config_;

  mutable std::mutex mutex_;
  SmoothingWindow window_;
  double published_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> errors_{0};
};

}  // namespace termreel::sensor

#endif  // TERMREEL_SENSOR_DISTANCE_SIGNAL_HPP_
