// Repository: TermReel
// Component: Smoothing Window
// Copyright (c) 2025 TermReel

#include "termreel/sensor/SmoothingWindow.hpp"

#include <numeric>

namespace termreel::sensor {

SmoothingWindow::SmoothingWindow(std::size_t capacity, double initial_value)
    : capacity_(capacity > 0 ? capacity : 1), initial_value_(initial_value) {}

void SmoothingWindow::Push(double sample) {
  samples_.push_back(sample);
  while (samples_.size() > capacity_) {
    samples_.pop_front();
  }
}

double SmoothingWindow::Mean() const {
  if (samples_.empty()) {
    return initial_value_;
  }
  const double sum = std::accumulate(samples_.begin(), samples_.end(), 0.0);
  return sum / static_cast<double>(samples_.size());
}

}  // namespace termreel::sensor
