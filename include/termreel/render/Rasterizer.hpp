// Repository: TermReel
// Component: Rasterizer
// Purpose: Resize frames to the terminal row budget and convert pixels to a
//          fixed-width text block.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RENDER_RASTERIZER_HPP_
#define TERMREEL_RENDER_RASTERIZER_HPP_

#include <memory>
#include <string>

#include "termreel/buffer/Frame.h"
#include "termreel/render/GlyphMapper.hpp"
#include "termreel/render/TerminalDimensions.hpp"

namespace termreel::render {

// How rows are separated inside a rasterized block.
enum class LineMode {
  kPadded,      // Rows right-padded to the column width (in-place redraw)
  kLineBreaks,  // Rows terminated by '\n' (capture / scrolling output)
};

// Rasterizer is a pure function of (frame, dimensions): no state besides
// the glyph strategy, no side effects.
//
// Layout of a block:
// - rows 0 .. height-2 of the frame (height-1 rows)
// - per row, printing_width = min(columns, width * 2) / 2 sampled pixels,
//   each drawn as its glyph twice, since a cell is about twice as tall as
//   it is wide
// - kPadded: columns - 2 * printing_width trailing spaces per row
//   kLineBreaks: '\n' per row
// - the block ends with "\r\n"
class Rasterizer {
 public:
  // nullptr selects a LuminanceGlyphMapper with the default ramp.
  explicit Rasterizer(std::shared_ptr<const IGlyphMapper> mapper = nullptr);

  // Scales so the height matches dims.rows; width follows the same factor.
  static buffer::Frame Resize(const buffer::Frame& frame, TerminalDimensions dims);

  // Bilinear resize to an explicit size through a per-thread FrameScaler.
  // Same size is a plain copy; an empty frame or a scaler failure yields an
  // empty frame.
  static buffer::Frame ResizeTo(const buffer::Frame& frame, int width, int height);

  std::string ToCharacters(const buffer::Frame& frame, TerminalDimensions dims,
                           LineMode mode = LineMode::kPadded) const;

  // Resize + ToCharacters.
  std::string Rasterize(const buffer::Frame& frame, TerminalDimensions dims,
                        LineMode mode = LineMode::kPadded) const;

  static int PrintingWidth(int columns, int frame_width);

  const IGlyphMapper& mapper() const { return *mapper_; }

 private:
  std::shared_ptr<const IGlyphMapper> mapper_;
};

}  // namespace termreel::render

#endif  // TERMREEL_RENDER_RASTERIZER_HPP_
