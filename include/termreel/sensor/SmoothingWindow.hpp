// Repository: TermReel
// Component: Smoothing Window
// Purpose: Fixed-capacity moving average over recent distance samples.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_SENSOR_SMOOTHING_WINDOW_HPP_
#define TERMREEL_SENSOR_SMOOTHING_WINDOW_HPP_

#include <cstddef>
#include <deque>

namespace termreel::sensor {

// Not thread-safe; DistanceSignal guards it.
class SmoothingWindow {
 public:
  // capacity 0 is treated as 1.
  explicit SmoothingWindow(std::size_t capacity = 10, double initial_value = 100.0);

  // Appends a sample, evicting the oldest when full.
  void Push(double sample);

  // Arithmetic mean of the retained samples; initial_value while empty.
  double Mean() const;

  void Clear() { samples_.clear(); }

  bool Empty() const { return samples_.empty(); }
  std::size_t size() const { return samples_.size(); }
  std::size_t capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  double initial_value_;
  std::deque<double> samples_;
};

}  // namespace termreel::sensor

#endif  // TERMREEL_SENSOR_SMOOTHING_WINDOW_HPP_
