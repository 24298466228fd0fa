// Repository: TermReel
// Component: Transition Types
// Purpose: Algorithm/direction tags, per-transition settings and their result.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TRANSITION_TRANSITION_TYPES_HPP_
#define TERMREEL_TRANSITION_TRANSITION_TYPES_HPP_

#include <optional>
#include <string>

#include "termreel/buffer/Frame.h"

namespace termreel::transition {

enum class TransitionAlgorithm {
  kCrossfade,
  kWipe,
  kScan,
};

// Edge the sweep starts from. Crossfade ignores it.
enum class TransitionDirection {
  kTop,
  kBottom,
  kLeft,
  kRight,
};

// Rows (top/bottom) or columns (left/right) blended ahead of the scan cursor.
inline constexpr int kScanBandThickness = 2;

// Additive brightness of the scan band.
inline constexpr int kScanBandBoost = 50;

// Composite emission rate, independent of either clip's frame rate.
inline constexpr double kTransitionFps = 30.0;

struct TransitionSpec {
  TransitionAlgorithm algorithm = TransitionAlgorithm::kWipe;
  TransitionDirection direction = TransitionDirection::kTop;

  // Composite frames a crossfade/wipe spans. Must be > 0.
  int frame_budget = 15;

  // Scan cursor advance per emitted frame (rows or columns).
  int scan_speed = 2;

  // Emission rate on real-time sinks (fixed delay per composite).
  double frames_per_second = kTransitionFps;

  bool IsValid() const {
    return frame_budget > 0 && scan_speed > 0 && frames_per_second > 0.0;
  }
};

// Outcome of one transition.
struct TransitionResult {
  int frames_emitted = 0;

  // True when the full sequence was emitted.
  bool completed = false;

  // True when the running flag dropped mid-sequence.
  bool interrupted = false;

  // Final composite; the raw still-available frame on early termination;
  // empty when both sources were exhausted.
  std::optional<buffer::Frame> last_frame;
};

TransitionDirection Opposite(TransitionDirection direction);

const char* ToString(TransitionAlgorithm algorithm);
const char* ToString(TransitionDirection direction);

std::optional<TransitionAlgorithm> ParseTransitionAlgorithm(const std::string& name);
std::optional<TransitionDirection> ParseTransitionDirection(const std::string& name);

}  // namespace termreel::transition

#endif  // TERMREEL_TRANSITION_TRANSITION_TYPES_HPP_
