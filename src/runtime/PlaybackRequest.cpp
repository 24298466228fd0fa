// Repository: TermReel
// Component: Playback Request Queue
// Copyright (c) 2025 TermReel

#include "termreel/runtime/PlaybackRequest.hpp"

namespace termreel::runtime {

void PlaybackRequestQueue::Push(PlaybackRequest request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(std::move(request));
}

std::optional<PlaybackRequest> PlaybackRequestQueue::TryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.empty()) {
    return std::nullopt;
  }
  PlaybackRequest front = std::move(requests_.front());
  requests_.pop_front();
  return front;
}

std::optional<PlaybackRequest> PlaybackRequestQueue::Newest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.empty()) {
    return std::nullopt;
  }
  return requests_.back();
}

std::size_t PlaybackRequestQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

bool PlaybackRequestQueue::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.empty();
}

void PlaybackRequestQueue::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.clear();
}

}  // namespace termreel::runtime
