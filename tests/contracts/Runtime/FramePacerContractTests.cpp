// Repository: TermReel
// Component: Frame Pacer Contract Tests
// Purpose: Interval derivation, compensated sleeps and fixed delays.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "fixtures/NoWaitStrategy.h"
#include "termreel/timing/FramePacer.hpp"

namespace termreel::tests::contracts {

using fixtures::NoWaitStrategy;
using timing::FramePacer;

class FramePacerContractTest : public ::testing::Test {
 protected:
  std::shared_ptr<NoWaitStrategy> wait_ = std::make_shared<NoWaitStrategy>();
};

TEST_F(FramePacerContractTest, IntervalFollowsFps) {
  FramePacer pacer(25.0, wait_);
  EXPECT_DOUBLE_EQ(pacer.fps(), 25.0);
  EXPECT_EQ(pacer.interval(), std::chrono::milliseconds(40));

  pacer.SetFps(50.0);
  EXPECT_EQ(pacer.interval(), std::chrono::milliseconds(20));
}

TEST_F(FramePacerContractTest, NonPositiveFpsFallsBackToThirty) {
  FramePacer pacer(0.0, wait_);
  EXPECT_DOUBLE_EQ(pacer.fps(), 30.0);
  pacer.SetFps(-12.0);
  EXPECT_DOUBLE_EQ(pacer.fps(), 30.0);
}

TEST_F(FramePacerContractTest, EndFrameWaitsForRemainderOfInterval) {
  FramePacer pacer(1.0, wait_);
  const auto before = std::chrono::steady_clock::now();
  pacer.BeginFrame();
  pacer.EndFrame();

  ASSERT_EQ(wait_->wait_count(), 1u);
  const auto deadline = wait_->deadlines().front();
  EXPECT_GT(deadline, before + std::chrono::milliseconds(900));
  EXPECT_LE(deadline, std::chrono::steady_clock::now() + std::chrono::seconds(1));
  EXPECT_EQ(pacer.late_frames(), 0u);
}

TEST_F(FramePacerContractTest, OverrunFrameIsNotDelayed) {
  FramePacer pacer(1000.0, wait_);
  pacer.BeginFrame();
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  pacer.EndFrame();

  EXPECT_EQ(wait_->wait_count(), 0u);
  EXPECT_EQ(pacer.late_frames(), 1u);
}

TEST_F(FramePacerContractTest, DelayWaitsOneFullInterval) {
  FramePacer pacer(10.0, wait_);
  const auto before = std::chrono::steady_clock::now();
  pacer.Delay();
  pacer.Delay();

  ASSERT_EQ(wait_->wait_count(), 2u);
  EXPECT_GE(wait_->deadlines()[0], before + std::chrono::milliseconds(100));
}

}  // namespace termreel::tests::contracts
