// Repository: TermReel
// Component: Terminal Dimensions
// Purpose: Printing area of a render surface in character cells.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RENDER_TERMINAL_DIMENSIONS_HPP_
#define TERMREEL_RENDER_TERMINAL_DIMENSIONS_HPP_

namespace termreel::render {

// Printing area in character cells. Sampled fresh before every segment and
// every transition; the terminal may be resized between plays.
struct TerminalDimensions {
  int columns;
  int rows;

  constexpr TerminalDimensions(int c = 80, int r = 24) : columns(c), rows(r) {}

  constexpr bool IsValid() const { return columns > 0 && rows > 0; }

  constexpr bool operator==(const TerminalDimensions& other) const {
    return columns == other.columns && rows == other.rows;
  }
  constexpr bool operator!=(const TerminalDimensions& other) const {
    return !(*this == other);
  }
};

inline constexpr TerminalDimensions kDefaultTerminalDimensions{80, 24};

}  // namespace termreel::render

#endif  // TERMREEL_RENDER_TERMINAL_DIMENSIONS_HPP_
