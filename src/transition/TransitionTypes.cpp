// Repository: TermReel
// Component: Transition Types
// Copyright (c) 2025 TermReel

#include "termreel/transition/TransitionTypes.hpp"

namespace termreel::transition {

TransitionDirection Opposite(TransitionDirection direction) {
  switch (direction) {
    case TransitionDirection::kTop: return TransitionDirection::kBottom;
    case TransitionDirection::kBottom: return TransitionDirection::kTop;
    case TransitionDirection::kLeft: return TransitionDirection::kRight;
    case TransitionDirection::kRight: return TransitionDirection::kLeft;
  }
  return TransitionDirection::kTop;
}

const char* ToString(TransitionAlgorithm algorithm) {
  switch (algorithm) {
    case TransitionAlgorithm::kCrossfade: return "crossfade";
    case TransitionAlgorithm::kWipe: return "wipe";
    case TransitionAlgorithm::kScan: return "scan";
  }
  return "unknown";
}

const char* ToString(TransitionDirection direction) {
  switch (direction) {
    case TransitionDirection::kTop: return "top";
    case TransitionDirection::kBottom: return "bottom";
    case TransitionDirection::kLeft: return "left";
    case TransitionDirection::kRight: return "right";
  }
  return "unknown";
}

std::optional<TransitionAlgorithm> ParseTransitionAlgorithm(const std::string& name) {
  if (name == "crossfade") return TransitionAlgorithm::kCrossfade;
  if (name == "wipe") return TransitionAlgorithm::kWipe;
  if (name == "scan") return TransitionAlgorithm::kScan;
  return std::nullopt;
}

std::optional<TransitionDirection> ParseTransitionDirection(const std::string& name) {
  if (name == "top") return TransitionDirection::kTop;
  if (name == "bottom") return TransitionDirection::kBottom;
  if (name == "left") return TransitionDirection::kLeft;
  if (name == "right") return TransitionDirection::kRight;
  return std::nullopt;
}

}  // namespace termreel::transition
