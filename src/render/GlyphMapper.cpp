// Repository: TermReel
// Component: Glyph Mapper
// Copyright (c) 2025 TermReel

#include "termreel/render/GlyphMapper.hpp"

namespace termreel::render {

LuminanceGlyphMapper::LuminanceGlyphMapper(std::string ramp)
    : ramp_(ramp.empty() ? std::string(kDefaultGlyphRamp) : std::move(ramp)) {}

int LuminanceGlyphMapper::Luma(uint8_t r, uint8_t g, uint8_t b) {
  // Integer Rec.601 weights (sum 1000).
  return (299 * r + 587 * g + 114 * b) / 1000;
}

char LuminanceGlyphMapper::Map(uint8_t r, uint8_t g, uint8_t b) const {
  const int last = static_cast<int>(ramp_.size()) - 1;
  const int index = (Luma(r, g, b) * last + 127) / 255;
  return ramp_[static_cast<size_t>(index)];
}

}  // namespace termreel::render
