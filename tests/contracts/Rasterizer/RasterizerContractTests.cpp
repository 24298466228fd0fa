// Repository: TermReel
// Component: Rasterizer Contract Tests
// Purpose: Resize math, block layout and glyph mapping.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "termreel/buffer/Frame.h"
#include "termreel/render/GlyphMapper.hpp"
#include "termreel/render/Rasterizer.hpp"

namespace termreel::tests::contracts {

using buffer::Frame;
using render::LineMode;
using render::Rasterizer;
using render::TerminalDimensions;

namespace {

Frame SolidFrame(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
  Frame frame(w, h);
  frame.Fill(r, g, b);
  return frame;
}

std::vector<std::string> SplitPaddedRows(const std::string& block, int columns) {
  std::vector<std::string> rows;
  const std::string body = block.substr(0, block.size() - 2);
  for (size_t i = 0; i < body.size(); i += static_cast<size_t>(columns)) {
    rows.push_back(body.substr(i, static_cast<size_t>(columns)));
  }
  return rows;
}

}  // namespace

class RasterizerContractTest : public ::testing::Test {
 protected:
  Rasterizer rasterizer_;
};

// =============================================================================
// Resize
// =============================================================================

TEST_F(RasterizerContractTest, ResizeMatchesRowBudgetAndKeepsAspect) {
  const Frame src = SolidFrame(640, 480, 10, 20, 30);
  const Frame out = Rasterizer::Resize(src, TerminalDimensions(80, 24));
  EXPECT_EQ(out.height, 24);
  EXPECT_EQ(out.width, 32);
  EXPECT_EQ(out.data.size(), Frame::Size(32, 24));
}

TEST_F(RasterizerContractTest, ResizeUpscalesSmallFrames) {
  const Frame src = SolidFrame(16, 8, 0, 0, 0);
  const Frame out = Rasterizer::Resize(src, TerminalDimensions(80, 24));
  EXPECT_EQ(out.height, 24);
  EXPECT_EQ(out.width, 48);
}

TEST_F(RasterizerContractTest, ResizePreservesSolidColor) {
  const Frame src = SolidFrame(64, 32, 200, 100, 50);
  const Frame out = Rasterizer::Resize(src, TerminalDimensions(80, 20));
  ASSERT_FALSE(out.Empty());
  for (int y = 0; y < out.height; ++y) {
    for (int x = 0; x < out.width; ++x) {
      const uint8_t* px = out.Pixel(x, y);
      ASSERT_NEAR(px[0], 200, 2);
      ASSERT_NEAR(px[1], 100, 2);
      ASSERT_NEAR(px[2], 50, 2);
    }
  }
}

TEST_F(RasterizerContractTest, ResizeToSameShapeIsIdentity) {
  Frame src(4, 3);
  for (size_t i = 0; i < src.data.size(); ++i) {
    src.data[i] = static_cast<uint8_t>(i * 7);
  }
  const Frame out = Rasterizer::ResizeTo(src, 4, 3);
  EXPECT_EQ(out.data, src.data);
}

TEST_F(RasterizerContractTest, ResizeOfEmptyFrameStaysEmpty) {
  EXPECT_TRUE(Rasterizer::Resize(Frame(), TerminalDimensions(80, 24)).Empty());
  EXPECT_TRUE(Rasterizer::ResizeTo(SolidFrame(4, 4, 1, 1, 1), 0, 4).Empty());
}

// =============================================================================
// ToCharacters layout
// =============================================================================

TEST_F(RasterizerContractTest, RowCountIsHeightMinusOne) {
  const TerminalDimensions dims(80, 24);
  const Frame frame = Rasterizer::Resize(SolidFrame(640, 480, 128, 128, 128), dims);
  const std::string block = rasterizer_.ToCharacters(frame, dims, LineMode::kLineBreaks);

  ASSERT_GE(block.size(), 2u);
  EXPECT_EQ(block.substr(block.size() - 2), "\r\n");
  const std::string body = block.substr(0, block.size() - 2);
  int rows = 0;
  for (char c : body) {
    if (c == '\n') ++rows;
  }
  EXPECT_EQ(rows, frame.height - 1);
}

TEST_F(RasterizerContractTest, PaddedRowsFillColumnsExactly) {
  const std::vector<TerminalDimensions> all_dims = {
      TerminalDimensions(80, 24), TerminalDimensions(81, 24), TerminalDimensions(120, 30),
      TerminalDimensions(20, 10), TerminalDimensions(200, 12)};
  const std::vector<std::pair<int, int>> sources = {{640, 480}, {1920, 1080}, {100, 400}};

  for (const auto& dims : all_dims) {
    for (const auto& [w, h] : sources) {
      const Frame frame = Rasterizer::Resize(SolidFrame(w, h, 255, 255, 255), dims);
      const std::string block = rasterizer_.ToCharacters(frame, dims, LineMode::kPadded);
      const size_t expected =
          static_cast<size_t>(frame.height - 1) * static_cast<size_t>(dims.columns) + 2;
      ASSERT_EQ(block.size(), expected) << dims.columns << "x" << dims.rows << " src " << w
                                        << "x" << h;

      const int printing_width = Rasterizer::PrintingWidth(dims.columns, frame.width);
      for (const std::string& row : SplitPaddedRows(block, dims.columns)) {
        ASSERT_EQ(row.size(), static_cast<size_t>(dims.columns));
        const size_t glyphs = row.find_last_not_of(' ') + 1;
        EXPECT_EQ(glyphs, static_cast<size_t>(printing_width * 2));
      }
    }
  }
}

TEST_F(RasterizerContractTest, NarrowFrameIsPaddedToColumns) {
  const TerminalDimensions dims(80, 24);
  const Frame frame = Rasterizer::Resize(SolidFrame(20, 24, 255, 255, 255), dims);
  ASSERT_EQ(frame.width, 20);
  const std::string block = rasterizer_.ToCharacters(frame, dims, LineMode::kPadded);
  const auto rows = SplitPaddedRows(block, dims.columns);
  ASSERT_EQ(rows.size(), 23u);
  EXPECT_EQ(rows[0], std::string(40, '8') + std::string(40, ' '));
}

TEST_F(RasterizerContractTest, LineBreakRowsCarryDoubledGlyphs) {
  const TerminalDimensions dims(10, 4);
  Frame frame = SolidFrame(5, 4, 0, 0, 0);
  frame.Pixel(0, 0)[0] = 255;
  frame.Pixel(0, 0)[1] = 255;
  frame.Pixel(0, 0)[2] = 255;

  const std::string block = rasterizer_.ToCharacters(frame, dims, LineMode::kLineBreaks);
  EXPECT_EQ(block, "88        \n          \n          \n\r\n");
}

TEST_F(RasterizerContractTest, WideFrameIsTruncatedToColumns) {
  const TerminalDimensions dims(10, 3);
  const Frame frame = SolidFrame(40, 3, 255, 255, 255);
  EXPECT_EQ(Rasterizer::PrintingWidth(dims.columns, frame.width), 5);
  const std::string block = rasterizer_.ToCharacters(frame, dims, LineMode::kPadded);
  EXPECT_EQ(block, std::string(10, '8') + std::string(10, '8') + "\r\n");
}

TEST_F(RasterizerContractTest, EmptyFrameYieldsBareTerminator) {
  EXPECT_EQ(rasterizer_.ToCharacters(Frame(), TerminalDimensions(80, 24)), "\r\n");
}

TEST_F(RasterizerContractTest, RasterizeResizesThenConverts) {
  const TerminalDimensions dims(80, 24);
  const Frame src = SolidFrame(640, 480, 0, 0, 0);
  EXPECT_EQ(rasterizer_.Rasterize(src, dims),
            rasterizer_.ToCharacters(Rasterizer::Resize(src, dims), dims));
}

// =============================================================================
// Glyph mapping
// =============================================================================

TEST(GlyphMapperContractTest, DefaultRampEndpoints) {
  render::LuminanceGlyphMapper mapper;
  EXPECT_EQ(mapper.ramp(), render::kDefaultGlyphRamp);
  EXPECT_EQ(mapper.Map(0, 0, 0), ' ');
  EXPECT_EQ(mapper.Map(255, 255, 255), '8');
  EXPECT_EQ(mapper.Map(128, 128, 128), '+');
}

TEST(GlyphMapperContractTest, LumaUsesRec601Weights) {
  EXPECT_EQ(render::LuminanceGlyphMapper::Luma(255, 0, 0), 76);
  EXPECT_EQ(render::LuminanceGlyphMapper::Luma(0, 255, 0), 149);
  EXPECT_EQ(render::LuminanceGlyphMapper::Luma(0, 0, 255), 29);
  EXPECT_EQ(render::LuminanceGlyphMapper::Luma(255, 255, 255), 255);
}

TEST(GlyphMapperContractTest, CustomRampAndEmptyFallback) {
  render::LuminanceGlyphMapper two("ab");
  EXPECT_EQ(two.Map(0, 0, 0), 'a');
  EXPECT_EQ(two.Map(255, 255, 255), 'b');

  render::LuminanceGlyphMapper fallback("");
  EXPECT_EQ(fallback.ramp(), render::kDefaultGlyphRamp);
}

TEST(GlyphMapperContractTest, RasterizerUsesInjectedMapper) {
  Rasterizer rasterizer(std::make_shared<render::LuminanceGlyphMapper>("#@"));
  const Frame frame = SolidFrame(2, 2, 0, 0, 0);
  EXPECT_EQ(rasterizer.ToCharacters(frame, TerminalDimensions(4, 2), LineMode::kLineBreaks),
            "####\n\r\n");
}

}  // namespace termreel::tests::contracts
