// Repository: TermReel
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from pacing math.
//          Production: RealtimeWaitStrategy sleeps until deadline.
//          Tests: a strategy that records deadlines and returns immediately.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TIMING_IWAIT_STRATEGY_HPP_
#define TERMREEL_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace termreel::timing {

class IWaitStrategy {
 public:
  virtual void WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::this_thread::sleep_until(deadline);
  }
};

}  // namespace termreel::timing

#endif  // TERMREEL_TIMING_IWAIT_STRATEGY_HPP_
