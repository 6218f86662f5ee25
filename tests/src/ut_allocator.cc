#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "allocator.h"
#include "connpool.h"

using namespace sgate;

struct allocatorTest : public ::testing::Test
{
	std::vector<int64_t> live;
	time_t now = 1000000;
	allocator alloc;

	allocatorTest() : alloc([this]() { return live; }, 100, [this]() { return now; })
	{
	}
};

TEST(allocator, groups)
{
	EXPECT_EQ(1u, allocator::SmallGroupSize(1));
	EXPECT_EQ(1u, allocator::SmallGroupSize(2));
	EXPECT_EQ(1u, allocator::SmallGroupSize(3));
	EXPECT_EQ(1u, allocator::SmallGroupSize(4));
	EXPECT_EQ(2u, allocator::SmallGroupSize(5));
	EXPECT_EQ(2u, allocator::SmallGroupSize(6));
	EXPECT_EQ(3u, allocator::SmallGroupSize(7));

	auto g = allocator::Partition({});
	EXPECT_TRUE(g.small.empty());
	EXPECT_TRUE(g.large.empty());
	// a single connection serves both
	g = allocator::Partition({7});
	EXPECT_THAT(g.small, testing::ElementsAre(7));
	EXPECT_THAT(g.large, testing::ElementsAre(7));
	g = allocator::Partition({7, 8});
	EXPECT_THAT(g.small, testing::ElementsAre(7));
	EXPECT_THAT(g.large, testing::ElementsAre(8));
	g = allocator::Partition({1, 2, 3, 4, 5});
	EXPECT_THAT(g.small, testing::ElementsAre(1, 2));
	EXPECT_THAT(g.large, testing::ElementsAre(3, 4, 5));
}

TEST_F(allocatorTest, acquire_by_size)
{
	live = {1, 2, 3, 4, 5};
	EXPECT_TRUE(alloc.IsSmall(99));
	EXPECT_FALSE(alloc.IsSmall(100));

	EXPECT_EQ(1, alloc.Acquire(10, "t1"));
	EXPECT_EQ(2, alloc.Acquire(10, "t2"));
	// small group exhausted, overflow into the large one
	EXPECT_EQ(3, alloc.Acquire(10, "t3"));
	EXPECT_EQ(EConnStatus::BUSY, alloc.GetStatus(3));
	EXPECT_EQ("t3", alloc.GetTask(3));

	EXPECT_EQ(5, alloc.Acquire(1000, "t4"));
	EXPECT_EQ(4, alloc.Acquire(1000, "t5"));
	EXPECT_THROW(alloc.Acquire(1000, "t6"), tNoConnectionsAvailable);

	// large files never take the small group
	alloc.Release(1, "t1");
	EXPECT_EQ(EConnStatus::IDLE, alloc.GetStatus(1));
	EXPECT_THROW(alloc.Acquire(1000, "t6"), tNoConnectionsAvailable);
	EXPECT_EQ(1, alloc.Acquire(10, "t6"));
}

TEST_F(allocatorTest, round_robin)
{
	live = {1, 2, 3, 4, 5, 6};
	std::vector<int64_t> got;
	for (int i = 0; i < 6; ++i)
	{
		auto id = alloc.Acquire(1000, "t");
		got.push_back(id);
		alloc.Release(id, "t");
	}
	EXPECT_EQ(std::vector<int64_t>({3, 4, 5, 6, 3, 4}), got);

	// the pool changed, start over
	live = {1, 2, 3, 4, 5};
	EXPECT_EQ(3, alloc.Acquire(1000, "u"));
}

TEST_F(allocatorTest, release)
{
	live = {1, 2};
	EXPECT_EQ(1, alloc.Acquire(10, "a"));
	// not the owner
	alloc.Release(1, "b");
	EXPECT_EQ(EConnStatus::BUSY, alloc.GetStatus(1));
	EXPECT_EQ("a", alloc.GetTask(1));
	alloc.Release(1, "a");
	EXPECT_EQ(EConnStatus::IDLE, alloc.GetStatus(1));
	EXPECT_EQ("", alloc.GetTask(1));

	// without recorded task the connection becomes idle in any case
	EXPECT_EQ(2, alloc.Acquire(1000, "c"));
	EXPECT_FALSE(alloc.OnRateLimited(2, 60, 1000, "c"));
	EXPECT_EQ(EConnStatus::RATE_LIMITED, alloc.GetStatus(2));
	alloc.Release(2, "c");
	EXPECT_EQ(EConnStatus::IDLE, alloc.GetStatus(2));
}

TEST_F(allocatorTest, rate_limited_failover)
{
	live = {1, 2, 3};
	EXPECT_EQ(2, alloc.Acquire(1000, "big"));
	auto alt = alloc.OnRateLimited(2, 30, 1000, "big");
	ASSERT_TRUE(alt);
	EXPECT_EQ(3, *alt);
	EXPECT_EQ("big", alloc.GetTask(3));
	EXPECT_EQ(EConnStatus::BUSY, alloc.GetStatus(3));
	EXPECT_EQ(EConnStatus::RATE_LIMITED, alloc.GetStatus(2));
	EXPECT_EQ("", alloc.GetTask(2));

	EXPECT_THROW(alloc.Acquire(1000, "x"), tNoConnectionsAvailable);
	now += 29;
	EXPECT_THROW(alloc.Acquire(1000, "x"), tNoConnectionsAvailable);
	now += 1;
	EXPECT_EQ(2, alloc.Acquire(1000, "x"));

	// small files may move into the large group
	auto small = alloc.Acquire(10, "s");
	EXPECT_EQ(1, small);
	alloc.Release(3, "big");
	alt = alloc.OnRateLimited(1, 5, 10, "s");
	ASSERT_TRUE(alt);
	EXPECT_EQ(3, *alt);
	EXPECT_FALSE(alloc.OnRateLimited(3, 5, 10, "s"));

	auto st = alloc.GetStats();
	EXPECT_EQ(3u, st.live);
	EXPECT_EQ(1u, st.smallGroup);
	EXPECT_EQ(2u, st.largeGroup);
	EXPECT_EQ(1u, st.busy);
	EXPECT_EQ(2u, st.rateLimited);
	EXPECT_EQ(1u, st.tasks);
	EXPECT_FALSE(alloc.FormatStats().empty());
}

TEST_F(allocatorTest, sweep)
{
	live = {1, 2, 3};
	EXPECT_EQ(2, alloc.Acquire(1000, "a"));
	auto alt = alloc.OnRateLimited(2, 10, 1000, "a");
	ASSERT_TRUE(alt);
	EXPECT_EQ(3, *alt);
	alloc.Sweep();
	EXPECT_EQ(EConnStatus::RATE_LIMITED, alloc.GetStatus(2));
	now += 11;
	alloc.Sweep();
	EXPECT_EQ(EConnStatus::IDLE, alloc.GetStatus(2));

	EXPECT_EQ(1, alloc.Acquire(10, "b"));
	// connection 1 is gone
	live = {2, 3};
	alloc.Sweep();
	EXPECT_EQ(0u, alloc.m_states.count(1));
	EXPECT_EQ(2, alloc.Acquire(10, "c"));
	EXPECT_THROW(alloc.Acquire(10, "d"), tNoConnectionsAvailable);
	live = {};
	EXPECT_THROW(alloc.Acquire(10, "d"), tNoConnectionsAvailable);
}
