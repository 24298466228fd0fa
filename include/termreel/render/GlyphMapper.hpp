// Repository: TermReel
// Component: Glyph Mapper
// Purpose: Pluggable pixel-to-character strategy for the Rasterizer.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_RENDER_GLYPH_MAPPER_HPP_
#define TERMREEL_RENDER_GLYPH_MAPPER_HPP_

#include <cstdint>
#include <string>

namespace termreel::render {

// Maps one RGB pixel to exactly one printable character.
class IGlyphMapper {
 public:
  virtual ~IGlyphMapper() = default;
  virtual char Map(uint8_t r, uint8_t g, uint8_t b) const = 0;
};

// Density ramp, darkest first.
inline constexpr const char* kDefaultGlyphRamp = "  .:!+*e$@8";

// LuminanceGlyphMapper picks a ramp entry by Rec.601 luma.
class LuminanceGlyphMapper : public IGlyphMapper {
 public:
  // An empty ramp falls back to kDefaultGlyphRamp.
  explicit LuminanceGlyphMapper(std::string ramp = kDefaultGlyphRamp);

  char Map(uint8_t r, uint8_t g, uint8_t b) const override;

  const std::string& ramp() const { return ramp_; }

  // Luma in [0, 255].
  static int Luma(uint8_t r, uint8_t g, uint8_t b);

 private:
  std::string ramp_;
};

}  // namespace termreel::render

#endif  // TERMREEL_RENDER_GLYPH_MAPPER_HPP_
