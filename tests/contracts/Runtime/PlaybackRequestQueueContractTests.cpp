// Repository: TermReel
// Component: Playback Request Queue Contract Tests
// Purpose: FIFO order, sentinel requests and multi-producer safety.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "termreel/runtime/PlaybackRequest.hpp"

namespace termreel::tests::contracts {

using runtime::PlaybackRequest;
using runtime::PlaybackRequestQueue;

TEST(PlaybackRequestQueueContractTest, EmptyQueuePopsNothing) {
  PlaybackRequestQueue queue;
  EXPECT_TRUE(queue.Empty());
  EXPECT_FALSE(queue.TryPop().has_value());
}

TEST(PlaybackRequestQueueContractTest, PopsInSubmissionOrder) {
  PlaybackRequestQueue queue;
  queue.Push(PlaybackRequest::Play("a.mp4"));
  queue.Push(PlaybackRequest::ReturnToIdle());
  queue.Push(PlaybackRequest::Play("b.mp4"));
  EXPECT_EQ(queue.Size(), 3u);

  auto first = queue.TryPop();
  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(first->IsReturnToIdle());
  EXPECT_EQ(first->path, "a.mp4");

  auto second = queue.TryPop();
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->IsReturnToIdle());
  EXPECT_TRUE(second->path.empty());

  auto third = queue.TryPop();
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->path, "b.mp4");
  EXPECT_TRUE(queue.Empty());
}

TEST(PlaybackRequestQueueContractTest, ClearDropsPending) {
  PlaybackRequestQueue queue;
  queue.Push(PlaybackRequest::Play("a.mp4"));
  queue.Push(PlaybackRequest::Play("b.mp4"));
  queue.Clear();
  EXPECT_EQ(queue.Size(), 0u);
  EXPECT_FALSE(queue.TryPop().has_value());
}

TEST(PlaybackRequestQueueContractTest, NewestPeeksWithoutConsuming) {
  PlaybackRequestQueue queue;
  EXPECT_FALSE(queue.Newest().has_value());

  queue.Push(PlaybackRequest::Play("a.mp4"));
  queue.Push(PlaybackRequest::ReturnToIdle());
  auto newest = queue.Newest();
  ASSERT_TRUE(newest.has_value());
  EXPECT_TRUE(newest->IsReturnToIdle());
  EXPECT_EQ(queue.Size(), 2u);

  queue.Push(PlaybackRequest::Play("b.mp4"));
  EXPECT_EQ(queue.Newest()->path, "b.mp4");
  EXPECT_EQ(queue.TryPop()->path, "a.mp4");
}

TEST(PlaybackRequestQueueContractTest, ConcurrentProducersLoseNothing) {
  PlaybackRequestQueue queue;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.Push(PlaybackRequest::Play(std::to_string(p) + ":" + std::to_string(i)));
      }
    });
  }
  for (auto& t : producers) t.join();

  EXPECT_EQ(queue.Size(), static_cast<std::size_t>(kProducers * kPerProducer));

  // Per-producer order is preserved.
  std::vector<int> next(kProducers, 0);
  while (auto request = queue.TryPop()) {
    const auto colon = request->path.find(':');
    const int p = std::stoi(request->path.substr(0, colon));
    const int i = std::stoi(request->path.substr(colon + 1));
    EXPECT_EQ(i, next[p]);
    next[p] = i + 1;
  }
  for (int p = 0; p < kProducers; ++p) EXPECT_EQ(next[p], kPerProducer);
}

}  // namespace termreel::tests::contracts
