//
//  ActionQueueTests.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Concurrency/ActionQueue.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <vector>

TEST(ActionQueue, NothingHappensUntilPerform) {
	Concurrency::ActionQueue queue;
	bool performed = false;
	queue.enqueue([&] { performed = true; });

	EXPECT_FALSE(performed);
	EXPECT_FALSE(queue.empty());
	EXPECT_TRUE(queue.perform());
	EXPECT_TRUE(performed);
	EXPECT_TRUE(queue.empty());
	EXPECT_FALSE(queue.perform());
}

TEST(ActionQueue, PerformsInOrderOfEnqueueing) {
	Concurrency::ActionQueue queue;
	std::vector<int> order;
	for(int c = 0; c < 5; c++) {
		queue.enqueue([&order, c] { order.push_back(c); });
	}

	queue.perform();
	EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ActionQueue, ActionsEnqueuedDuringPerformWaitForTheNext) {
	Concurrency::ActionQueue queue;
	std::vector<int> order;
	queue.enqueue([&] {
		order.push_back(1);
		queue.enqueue([&] { order.push_back(3); });
	});
	queue.enqueue([&] { order.push_back(2); });

	queue.perform();
	EXPECT_EQ(order, (std::vector<int>{1, 2}));

	queue.perform();
	EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ActionQueue, FlushDrainsChains) {
	Concurrency::ActionQueue queue;
	int depth = 0;
	std::function<void(void)> recurse = [&] {
		if(++depth < 4) queue.enqueue(recurse);
	};
	queue.enqueue(recurse);

	queue.flush();
	EXPECT_EQ(depth, 4);
	EXPECT_TRUE(queue.empty());
}
