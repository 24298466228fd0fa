// Repository: TermReel
// Component: Playback Request Queue
// Purpose: FIFO of pending source switches, fed from any thread and drained
//          by the render loop.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RUNTIME_PLAYBACK_REQUEST_HPP_
#define TERMREEL_RUNTIME_PLAYBACK_REQUEST_HPP_

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace termreel::runtime {

struct PlaybackRequest {
  enum class Kind {
    kPlay,          // Switch to `path`
    kReturnToIdle,  // Sentinel: go back to the idle loop
  };

  Kind kind = Kind::kPlay;
  std::string path;

  static PlaybackRequest Play(std::string path) {
    return PlaybackRequest{Kind::kPlay, std::move(path)};
  }

  static PlaybackRequest ReturnToIdle() {
    return PlaybackRequest{Kind::kReturnToIdle, std::string()};
  }

  bool IsReturnToIdle() const { return kind == Kind::kReturnToIdle; }
};

// Unbounded multi-producer / single-consumer queue. Push and TryPop never
// block on anything but the short internal mutex.
class PlaybackRequestQueue {
 public:
  void Push(PlaybackRequest request);

  // Oldest pending request, or nullopt if empty.
  std::optional<PlaybackRequest> TryPop();

  // Copy of the most recently pushed request, or nullopt if empty.
  std::optional<PlaybackRequest> Newest() const;

  std::size_t Size() const;
  bool Empty() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::deque<PlaybackRequest> requests_;
};

}  // namespace termreel::runtime

#endif  // TERMREEL_RUNTIME_PLAYBACK_REQUEST_HPP_
