// Repository: TermReel
// Component: No Wait Strategy
// Purpose: Wait strategy that records deadlines and returns immediately.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_TESTS_FIXTURES_NO_WAIT_STRATEGY_H_
#define TERMREEL_TESTS_FIXTURES_NO_WAIT_STRATEGY_H_

#include <chrono>
#include <vector>

#include "termreel/timing/IWaitStrategy.hpp"

namespace termreel::tests::fixtures {

class NoWaitStrategy : public timing::IWaitStrategy {
 public:
  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    deadlines_.push_back(deadline);
  }

  std::size_t wait_count() const { return deadlines_.size(); }
  const std::vector<std::chrono::steady_clock::time_point>& deadlines() const {
    return deadlines_;
  }

 private:
  std::vector<std::chrono::steady_clock::time_point> deadlines_;
};

}  // namespace termreel::tests::fixtures

#endif  // TERMREEL_TESTS_FIXTURES_NO_WAIT_STRATEGY_H_
