/**
 * @file RingBuffer_uTest.cpp
 * @brief Unit tests for gpumon::history::RingBuffer.
 */

#include "src/history/inc/RingBuffer.hpp"

#include <gtest/gtest.h>

#include <vector>

using gpumon::history::RingBuffer;

/** @test A new buffer is empty with the requested capacity. */
TEST(RingBufferTest, StartsEmpty) {
  const RingBuffer<int> RING(5);
  EXPECT_TRUE(RING.empty());
  EXPECT_FALSE(RING.full());
  EXPECT_EQ(RING.capacity(), 5U);
  EXPECT_TRUE(RING.toVector().empty());
}

/** @test Capacity zero is raised to one. */
TEST(RingBufferTest, ZeroCapacityRaised) {
  RingBuffer<int> ring(0);
  EXPECT_EQ(ring.capacity(), 1U);
  ring.push(1);
  ring.push(2);
  EXPECT_EQ(ring.toVector(), std::vector<int>{2});
}

/** @test Below capacity, elements are kept in insertion order. */
TEST(RingBufferTest, InsertionOrder) {
  RingBuffer<int> ring(4);
  ring.push(1);
  ring.push(2);
  ring.push(3);
  EXPECT_EQ(ring.toVector(), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(ring.front(), 1);
  EXPECT_EQ(ring.back(), 3);
}

/** @test After overflow exactly the N most recent remain, oldest first. */
TEST(RingBufferTest, OverflowKeepsMostRecent) {
  RingBuffer<int> ring(15);
  for (int i = 1; i <= 100; ++i) {
    ring.push(i);
    ASSERT_LE(ring.size(), ring.capacity());
  }
  ASSERT_TRUE(ring.full());
  const std::vector<int> CONTENTS = ring.toVector();
  ASSERT_EQ(CONTENTS.size(), 15U);
  for (int i = 0; i < 15; ++i) {
    EXPECT_EQ(CONTENTS[static_cast<std::size_t>(i)], 86 + i);
  }
}

/** @test Size never exceeds capacity for any push count. */
TEST(RingBufferTest, SizeBoundedProperty) {
  for (std::size_t cap = 1; cap <= 8; ++cap) {
    RingBuffer<std::size_t> ring(cap);
    for (std::size_t n = 0; n < 40; ++n) {
      ring.push(n);
      EXPECT_EQ(ring.size(), std::min(n + 1, cap));
      EXPECT_EQ(ring.back(), n);
    }
  }
}

/** @test clear() empties but keeps capacity. */
TEST(RingBufferTest, Clear) {
  RingBuffer<int> ring(3);
  ring.push(1);
  ring.push(2);
  ring.clear();
  EXPECT_TRUE(ring.empty());
  EXPECT_EQ(ring.capacity(), 3U);
  ring.push(7);
  EXPECT_EQ(ring.toVector(), std::vector<int>{7});
}
