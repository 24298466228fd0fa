// Repository: TermReel
// Component: Compositor
// Purpose: Pure per-pixel kernels behind the transition algorithms.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TRANSITION_COMPOSITOR_HPP_
#define TERMREEL_TRANSITION_COMPOSITOR_HPP_

#include "termreel/buffer/Frame.h"
#include "termreel/render/TerminalDimensions.hpp"
#include "termreel/transition/TransitionTypes.hpp"

namespace termreel::transition {

// out = saturate(round(a * (1 - alpha) + b * alpha + gamma)) per channel.
// b is resized to a's shape first if the shapes differ.
buffer::Frame Blend(const buffer::Frame& a, const buffer::Frame& b, double alpha,
                    int gamma = 0);

// Resizes both operands to the terminal row budget; if the incoming frame
// still differs in shape (odd aspect ratios) it is resized to the outgoing
// frame's exact shape.
void NormalizePair(buffer::Frame& outgoing, buffer::Frame& incoming,
                   render::TerminalDimensions dims);

// Position of the wipe boundary along the swept axis.
// top/left:     floor(extent * progress)       (incoming is [0, boundary))
// bottom/right: floor(extent * (1 - progress)) (incoming is [boundary, extent))
int WipeBoundary(int extent, TransitionDirection direction, double progress);

// Operands must share a shape.
buffer::Frame WipeComposite(const buffer::Frame& outgoing, const buffer::Frame& incoming,
                            TransitionDirection direction, double progress);

// Scan composite at a cursor position. The swept region covers
// cursor + lead lines from the starting edge and comes from the incoming
// frame; the kScanBandThickness lines just ahead of it are a 50/50 blend
// plus kScanBandBoost; the rest is the outgoing frame.
// Operands must share a shape.
buffer::Frame ScanComposite(const buffer::Frame& outgoing, const buffer::Frame& incoming,
                            TransitionDirection direction, int cursor, int lead);

// Lines along the scan axis: height for top/bottom, width for left/right.
int ScanExtent(const buffer::Frame& frame, TransitionDirection direction);

}  // namespace termreel::transition

#endif  // TERMREEL_TRANSITION_COMPOSITOR_HPP_
