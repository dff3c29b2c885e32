#include "server/safeQueue.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace fishbowl::gtest {

using server::SafeQueue;

TEST(SafeQueue, FifoOrder) {
	SafeQueue<int> queue;
	queue.Push(1);
	queue.Push(2);

	EXPECT_FALSE(queue.Empty());
	EXPECT_EQ(queue.PopFor(std::chrono::milliseconds(10)), 1);
	EXPECT_EQ(queue.PopFor(std::chrono::milliseconds(10)), 2);
	EXPECT_TRUE(queue.Empty());
}

TEST(SafeQueue, PopTimesOut) {
	SafeQueue<int> queue;
	EXPECT_FALSE(queue.PopFor(std::chrono::milliseconds(10)).has_value());
}

TEST(SafeQueue, PopWakesOnPush) {
	SafeQueue<int> queue;
	std::thread producer([&queue] {
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
		queue.Push(7);
	});

	EXPECT_EQ(queue.PopFor(std::chrono::seconds(5)), 7);
	producer.join();
}

TEST(SafeQueue, ReleaseDrainsThenStopsBlocking) {
	SafeQueue<int> queue;
	queue.Push(3);
	queue.Release();

	EXPECT_EQ(queue.PopFor(std::chrono::seconds(5)), 3);

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(queue.PopFor(std::chrono::seconds(5)).has_value());
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

} // namespace fishbowl::gtest
