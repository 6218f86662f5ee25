#include "gtest/gtest.h"
#include "chunkfetch.h"
#include "fakeupstream.h"
#include "main.h"

using namespace sgate;

namespace
{
struct tCollector
{
	mstring data;
	tUpstreamStatus st;
	bool eof = false;
	unsigned slices = 0;

	// one step, false on error or timeout
	bool Pull(chunkfetcher& f)
	{
		bool reported = false;
		f.Next([this, &reported](const tUpstreamStatus& status, evbuffer* slice)
		{
			reported = true;
			st = status;
			if (!status.ok())
				return;
			auto n = evbuffer_get_length(slice);
			if (!n)
			{
				eof = true;
				return;
			}
			slices++;
			data.append((const char*) evbuffer_pullup(slice, n), n);
			evbuffer_drain(slice, n);
		});
		return pushEventsUntil(5, [&reported]() { return reported; }) && st.ok();
	}
	bool PullAll(chunkfetcher& f)
	{
		while (!eof)
		{
			if (!Pull(f))
				return false;
		}
		return true;
	}
};
}

TEST(chunkfetch, plan)
{
	auto p = tChunkPlan::Make(5000, 10000, 4096);
	EXPECT_EQ(4096, p.alignedOffset);
	EXPECT_EQ(904u, p.firstCut);
	EXPECT_EQ(1809u, p.lastCut);
	EXPECT_EQ(2, p.partCount);
	EXPECT_EQ(4096, p.GetPartOffset(1));
	EXPECT_EQ(8192, p.GetPartOffset(2));
	EXPECT_EQ(5001, p.GetLength());

	p = tChunkPlan::Make(0, 4095, 4096);
	EXPECT_EQ(0, p.alignedOffset);
	EXPECT_EQ(0u, p.firstCut);
	EXPECT_EQ(4096u, p.lastCut);
	EXPECT_EQ(1, p.partCount);

	// range within one chunk
	p = tChunkPlan::Make(100, 200, 4096);
	EXPECT_EQ(1, p.partCount);
	EXPECT_EQ(100u, p.firstCut);
	EXPECT_EQ(201u, p.lastCut);

	p = tChunkPlan::Make(4096, 4096 * 3, 4096);
	EXPECT_EQ(3, p.partCount);
	EXPECT_EQ(1u, p.lastCut);
}

TEST(chunkfetch, range)
{
	auto s = make_lptr<fakeSession>(1);
	auto& f = s->AddFile(10, 20000);
	chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 5000, 10000, 4096);
	tCollector c;
	ASSERT_TRUE(c.PullAll(fetcher));
	EXPECT_EQ(FakeContent(5000, 10000), c.data);
	EXPECT_EQ(2u, c.slices);
	EXPECT_EQ(5001, fetcher.GetYielded());
	EXPECT_EQ(10001, fetcher.GetNextOffset());
	EXPECT_TRUE(fetcher.AtEnd());
	ASSERT_EQ(2u, s->reads.size());
	EXPECT_EQ(4096, s->reads[0].first);
	EXPECT_EQ(8192, s->reads[1].first);
	EXPECT_EQ(4096u, s->reads[1].second);
}

TEST(chunkfetch, single_part)
{
	auto s = make_lptr<fakeSession>(1);
	auto& f = s->AddFile(10, 20000);
	chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 100, 200, 4096);
	tCollector c;
	ASSERT_TRUE(c.PullAll(fetcher));
	EXPECT_EQ(FakeContent(100, 200), c.data);
	EXPECT_EQ(1u, s->nReads);
}

TEST(chunkfetch, whole_file)
{
	for (off_t size : { 10000, 8192, 1 })
	{
		auto s = make_lptr<fakeSession>(1);
		auto& f = s->AddFile(10, size);
		chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 0, size - 1, 4096, true);
		tCollector c;
		ASSERT_TRUE(c.PullAll(fetcher)) << size;
		EXPECT_EQ(FakeContent(0, size - 1), c.data);
		EXPECT_EQ(size, fetcher.GetYielded());
	}
}

TEST(chunkfetch, short_remote_data)
{
	auto s = make_lptr<fakeSession>(1);
	auto& f = s->AddFile(10, 20000);
	// the remote has less than the range says
	chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 0, 29999, 4096);
	tCollector c;
	ASSERT_TRUE(c.PullAll(fetcher));
	EXPECT_EQ(20000, fetcher.GetYielded());
	EXPECT_TRUE(fetcher.AtEnd());
}

TEST(chunkfetch, retry_and_rebind)
{
	auto s1 = make_lptr<fakeSession>(1), s2 = make_lptr<fakeSession>(2);
	auto& f = s1->AddFile(10, 50000);
	s2->AddFile(10, 50000);
	s1->readsBeforeErrors = 1;
	s1->readErrors.emplace_back(EUpstreamError::TRANSIENT, "reset");
	s1->readErrors.emplace_back(EUpstreamError::RATE_LIMITED, "flood", 30);

	chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s1), f, 1000, 40000, 4096);
	tCollector c;
	ASSERT_TRUE(c.Pull(fetcher));
	EXPECT_FALSE(c.Pull(fetcher));
	EXPECT_EQ(EUpstreamError::TRANSIENT, c.st.code);
	// same part again
	EXPECT_FALSE(c.Pull(fetcher));
	EXPECT_EQ(EUpstreamError::RATE_LIMITED, c.st.code);
	EXPECT_EQ(30, c.st.retryAfter);
	EXPECT_EQ(4096, s1->reads[1].first);
	EXPECT_EQ(4096, s1->reads[2].first);

	fetcher.Rebind(static_lptr_cast<IUpstreamSession>(s2), f);
	ASSERT_TRUE(c.PullAll(fetcher));
	EXPECT_EQ(FakeContent(1000, 40000), c.data);
	ASSERT_FALSE(s2->reads.empty());
	EXPECT_EQ(4096, s2->reads.front().first);
	EXPECT_EQ(3u, s1->nReads);
}

TEST(chunkfetch, oversized_chunk)
{
	auto s = make_lptr<fakeSession>(1);
	auto& f = s->AddFile(10, 20000);
	s->overdeliver = 10;
	chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 0, 19999, 4096);
	tCollector c;
	EXPECT_FALSE(c.Pull(fetcher));
	EXPECT_EQ(EUpstreamError::BAD_ALIGNMENT, c.st.code);
}

TEST(chunkfetch, cancel)
{
	auto s = make_lptr<fakeSession>(1);
	auto& f = s->AddFile(10, 20000);
	bool called = false;
	{
		chunkfetcher fetcher(static_lptr_cast<IUpstreamSession>(s), f, 0, 19999, 4096);
		fetcher.Next([&called](const tUpstreamStatus&, evbuffer*) { called = true; });
		EXPECT_TRUE(fetcher.IsBusy());
	}
	pushEvents(1, &called);
	EXPECT_FALSE(called);
	EXPECT_EQ(1u, s->nReads);
}
