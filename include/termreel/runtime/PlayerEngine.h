// Repository: TermReel
// Component: Player Engine
// Purpose: Root execution unit; idle loop, queued playback and transitions
//          over one render surface.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RUNTIME_PLAYER_ENGINE_H_
#define TERMREEL_RUNTIME_PLAYER_ENGINE_H_

// PlayerEngine
//
// PlayerEngine owns:
// - the idle source (open for the whole session)
// - the current playing source (exclusively, on the render loop)
// - the request queue and the state machine
//
// PlayerEngine does NOT:
// - own the render sink's lifecycle (caller starts/stops it; the engine
//   only clears it on shutdown)
// - own the distance signal thread (caller starts/stops it)
// - parse input
//
// State machine:
//   kIdle ──request──> kTransitioning ──video──> kPlaying
//     ^                   │    ^                   │
//     └────sentinel───────┘    └──────request──────┘
//
// Every step of the render loop is one call to Step(): one rendered
// segment frame, or one complete transition.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "termreel/decode/IFrameSource.hpp"
#include "termreel/output/IRenderSink.h"
#include "termreel/render/Rasterizer.hpp"
#include "termreel/runtime/PlaybackRequest.hpp"
#include "termreel/sensor/DistanceBandTable.hpp"
#include "termreel/timing/FramePacer.hpp"
#include "termreel/timing/IWaitStrategy.hpp"
#include "termreel/transition/TransitionEngine.hpp"
#include "termreel/transition/TransitionTypes.hpp"

namespace termreel::sensor {
class DistanceSignal;
}

namespace termreel::runtime {

// Result at the engine boundary.
struct EngineResult {
  bool success;
  std::string message;
  std::string error_code;  // e.g. "IDLE_SOURCE_UNAVAILABLE"

  EngineResult(bool s, const std::string& msg, const std::string& code = std::string())
      : success(s), message(msg), error_code(code) {}
};

struct PlayerConfig {
  // Looping background clip. Must open or Start() fails.
  std::string idle_path;

  // Composite frames per crossfade/wipe; also the degrade threshold.
  int transition_frames = 15;

  int scan_speed = 2;

  // Idle/playing steps the distance signal waits before asking again for a
  // clip that failed to open.
  int distance_retry_steps = 30;
};

class PlayerEngine {
 public:
  enum class State {
    kIdle = 0,
    kTransitioning = 1,
    kPlaying = 2,
    kStopped = 3,
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t composite_frames_total = 0;
    uint64_t segment_frames_total = 0;
    uint64_t requests_served_total = 0;
    uint64_t requests_dropped_total = 0;
    uint64_t direct_cut_total = 0;
    uint64_t self_loop_total = 0;
    uint64_t late_frame_total = 0;
    State state = State::kIdle;
  };

  // factory opens every source, the idle one included. nullptr rasterizer
  // selects the default ramp; nullptr wait selects real-time sleeping.
  PlayerEngine(PlayerConfig config, decode::FrameSourceFactory factory,
               output::IRenderSink& sink,
               std::shared_ptr<const render::Rasterizer> rasterizer = nullptr,
               std::shared_ptr<timing::IWaitStrategy> wait = nullptr);
  ~PlayerEngine();

  PlayerEngine(const PlayerEngine&) = delete;
  PlayerEngine& operator=(const PlayerEngine&) = delete;

  // Distance mode. Each idle/playing step maps signal->Latest() through
  // table and enqueues an implicit request whenever the mapped identifier
  // differs from where the engine is headed (the newest queued request, else
  // the playing clip, else idle); the table's fallback identifier means
  // return-to-idle. A mapped clip that failed to open is asked for again
  // after distance_retry_steps steps. signal must outlive the engine.
  void AttachDistanceSignal(const sensor::DistanceSignal* signal,
                            sensor::DistanceBandTable table);

  // Thread-safe, non-blocking.
  void Enqueue(const std::string& path);
  void EnqueueReturnToIdle();

  // Initialize + Step loop + Shutdown. Blocks until Stop().
  EngineResult Start(transition::TransitionAlgorithm algorithm,
                     transition::TransitionDirection direction);

  // Async-signal-safe: a single atomic store.
  void Stop();

  // Stepping API.
  EngineResult Initialize(transition::TransitionAlgorithm algorithm,
                          transition::TransitionDirection direction);
  // Returns false once the engine has been stopped.
  bool Step();
  // Releases every source and clears the sink. Idempotent.
  void Shutdown();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  [[nodiscard]] State state() const;
  // Path of the playing source; empty when idle.
  [[nodiscard]] std::string current_path() const;
  [[nodiscard]] std::size_t pending_requests() const { return queue_.Size(); }
  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  void StepIdle();
  void StepTransition();
  void StepPlaying();

  // Reads and presents one frame of a segment. Returns false at end-of-stream.
  bool RenderSegmentFrame(decode::IFrameSource& source);

  // Runs one transition, or a direct cut when the outgoing source has fewer
  // than transition_frames left.
  void RunTransition(decode::IFrameSource& outgoing, decode::IFrameSource& incoming,
                     transition::TransitionDirection direction);

  void SelfLoop();
  void PollDistanceSignal();

  // Identifier the engine ends up on once every queued request is served.
  std::string HeadingIdentifier() const;

  void TransitionTo(State to);
  void SetCurrentPath(const std::string& path);

  static const char* StateName(State state);

  PlayerConfig config_;
  decode::FrameSourceFactory factory_;
  output::IRenderSink& sink_;
  std::shared_ptr<const render::Rasterizer> rasterizer_;
  transition::TransitionEngine transitions_;
  timing::FramePacer pacer_;

  transition::TransitionAlgorithm algorithm_ = transition::TransitionAlgorithm::kWipe;
  transition::TransitionDirection direction_ = transition::TransitionDirection::kTop;

  PlaybackRequestQueue queue_;
  std::optional<PlaybackRequest> pending_;
  State transition_origin_ = State::kIdle;

  std::unique_ptr<decode::IFrameSource> idle_source_;
  std::unique_ptr<decode::IFrameSource> current_;

  const sensor::DistanceSignal* distance_signal_ = nullptr;
  std::optional<sensor::DistanceBandTable> band_table_;
  std::string failed_path_;
  int retry_holdoff_ = 0;

  std::atomic<bool> running_{false};
  bool initialized_ = false;

  // Guards state_, current_path_ and metrics.
  mutable std::mutex mutex_;
  State state_ = State::kIdle;
  std::string current_path_;
  MetricsSnapshot metrics_;
};

}  // namespace termreel::runtime

#endif  // TERMREEL_RUNTIME_PLAYER_ENGINE_H_
