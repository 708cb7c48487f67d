#include "main.h"
#include "sessionpool.h"

#include <deque>

using namespace dlbr;
using namespace std;

TEST(sessionpool, grant_async)
{
	auto pool = make_lptr<tSessionPool>(2);
	tPermit p;
	auto sub = pool->Acquire([&](tPermit&& x) { p = move(x); });
	// never granted inline
	EXPECT_FALSE(p.valid());
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return p.valid(); }));
	EXPECT_EQ(1u, pool->GetInUse());
	p.reset();
	EXPECT_EQ(0u, pool->GetInUse());
	EXPECT_EQ(1u, pool->GetAcquiredCount());
	EXPECT_EQ(1u, pool->GetReleasedCount());
	// repeated reset is harmless
	p.reset();
	EXPECT_EQ(1u, pool->GetReleasedCount());
}

TEST(sessionpool, capacity_and_fifo)
{
	auto pool = make_lptr<tSessionPool>(2);
	deque<tPermit> granted;
	vector<int> order;
	deque<TFinalAction> subs;
	for (int i = 0; i < 5; ++i)
	{
		subs.emplace_back(pool->Acquire([&, i](tPermit&& x)
		{
			order.push_back(i);
			granted.emplace_back(move(x));
		}));
	}
	pushEventsUntil(1, [&]() { return granted.size() >= 2; });
	pushEvents(1, nullptr);
	ASSERT_EQ(2u, granted.size());
	EXPECT_EQ(2u, pool->GetInUse());
	EXPECT_EQ(3u, pool->GetWaiterCount());

	granted.pop_front();
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return granted.size() == 2; }));
	granted.clear();
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return granted.size() == 2; }));
	EXPECT_EQ(vector<int>({0, 1, 2, 3, 4}), order);
	granted.clear();
	EXPECT_EQ(0u, pool->GetInUse());
	EXPECT_EQ(5u, pool->GetAcquiredCount());
	EXPECT_EQ(5u, pool->GetReleasedCount());
}

TEST(sessionpool, withdrawn_waiter)
{
	auto pool = make_lptr<tSessionPool>(1);
	tPermit first, second, third;
	auto s1 = pool->Acquire([&](tPermit&& x) { first = move(x); });
	auto s2 = pool->Acquire([&](tPermit&& x) { second = move(x); });
	auto s3 = pool->Acquire([&](tPermit&& x) { third = move(x); });
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return first.valid(); }));

	// the second gives up, the third is next in line
	s2.reset();
	first.reset();
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return third.valid(); }));
	EXPECT_FALSE(second.valid());
	EXPECT_EQ(1u, pool->GetInUse());
	EXPECT_EQ(0u, pool->GetWaiterCount());
	third.reset();
	EXPECT_EQ(0u, pool->GetInUse());
}

TEST(sessionpool, zero_capacity_is_one)
{
	auto pool = make_lptr<tSessionPool>(0);
	EXPECT_EQ(1u, pool->GetCapacity());
}

TEST(sessionpool, permit_outlives_pool_handle)
{
	tPermit p;
	{
		auto pool = make_lptr<tSessionPool>(1);
		auto sub = pool->Acquire([&](tPermit&& x) { p = move(x); });
		ASSERT_TRUE(pushEventsUntil(5, [&]() { return p.valid(); }));
	}
	// the permit keeps the pool alive until it is returned
	EXPECT_TRUE(p.valid());
	p.reset();
	EXPECT_FALSE(p.valid());
}
