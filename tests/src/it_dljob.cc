#include "gtest/gtest.h"

#include "conn.h"
#include "sgres.h"
#include "sgcfg.h"
#include "connpool.h"
#include "allocator.h"
#include "admission.h"
#include "linkcodec.h"
#include "fakeupstream.h"
#include "main.h"

#include <cerrno>
#include <cstdlib>
#include <map>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sgate;
using namespace std;

namespace
{

struct tResponse
{
	int status = 0;
	mstring head, body;
	bool complete = false;

	mstring Header(string_view name) const
	{
		for (size_t pos = head.find("\r\n"); pos != stmiss && pos + 2 < head.size();)
		{
			auto next = head.find("\r\n", pos + 2);
			string_view line(head.data() + pos + 2, next - pos - 2);
			pos = next;
			auto colon = line.find(':');
			if (colon == stmiss || !scaseequals(line.substr(0, colon), name))
				continue;
			return mstring(trimmed(line.substr(colon + 1)));
		}
		return mstring();
	}
};

/**
 * Client end of a socket pair, the other end is served like an accepted connection.
 */
struct tClient
{
	unique_fd fd;
	mstring data;
	bool eof = false;

	void Pump()
	{
		char buf[65536];
		while (!eof)
		{
			auto n = read(fd.get(), buf, sizeof(buf));
			if (n > 0)
				data.append(buf, n);
			else if (n == 0)
				eof = true;
			else if (errno == EAGAIN || errno == EWOULDBLOCK)
				break;
			else
				eof = true;
		}
	}

	void Send(string_view req)
	{
		while (!req.empty())
		{
			auto n = write(fd.get(), req.data(), req.size());
			if (n <= 0)
				break;
			req.remove_prefix(n);
		}
	}

	bool TryTake(tResponse& r, bool headOnly)
	{
		Pump();
		auto hend = data.find("\r\n\r\n");
		if (hend == stmiss)
			return eof;
		auto head = data.substr(0, hend + 4);
		off_t clen = 0;
		tResponse tmp;
		tmp.head = head;
		if (!headOnly && !tmp.Header("Content-Length").empty())
			clen = atoll(tmp.Header("Content-Length").c_str());
		auto total = hend + 4 + size_t(clen);
		if (data.size() < total && !eof)
			return false;
		r.head = head;
		r.status = atoi(head.c_str() + 9);
		r.body = data.substr(hend + 4, clen);
		r.complete = data.size() >= total;
		data.erase(0, min(total, data.size()));
		return true;
	}

	tResponse Request(string_view req, bool headOnly = false, int timeout = 10)
	{
		Send(req);
		tResponse ret;
		pushEventsUntil(timeout, [&]() { return TryTake(ret, headOnly); });
		return ret;
	}

	// waits for the server to close its end
	bool WaitClosed(int timeout = 5)
	{
		return pushEventsUntil(timeout, [this]() { Pump(); return eof; });
	}
};

mstring Get(cmstring& path, cmstring& extraHeaders = mstring())
{
	return "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n" + extraHeaders + "\r\n";
}

}

class dljobTest : public ::testing::Test
{
protected:
	map<int64_t, lint_ptr<fakeSession>> sessions;
	std::unique_ptr<sgres> res;
	std::vector<lint_ptr<IConnBase>> conns;
	unsigned nTerminated = 0;

	int64_t savedChannel = cfg::channelId;
	int savedChunk = cfg::chunksize, savedExpiry = cfg::linkexpiry, savedFlood = cfg::maxfloodwait,
			savedFailovers = cfg::maxfailovers, savedStreamRetries = cfg::maxstreamretries,
			savedStreamTimeout = cfg::streamtimeout;

	void SetUp() override
	{
		cfg::channelId = -1001234567;
		cfg::chunksize = 4096;
		cfg::linkexpiry = 0;
		cfg::maxfloodwait = 1;
		cfg::maxfailovers = 3;
		cfg::maxstreamretries = 2;
		res.reset(sgres::Create([this](cmstring& token, bool)
		{
			auto s = make_lptr<fakeSession>(atoll(token.c_str()));
			sessions[s->ident.id] = s;
			return static_lptr_cast<IUpstreamSession>(s);
		}));
		int result = -1;
		res->GetPool().Start("1", {"2", "3"}, [&result](bool ok) { result = ok; });
		ASSERT_TRUE(pushEventsUntil(5, [&result]() { return result >= 0; }));
		ASSERT_EQ(1, result);
	}

	void TearDown() override
	{
		pushEventsUntil(5, [this]() { return nTerminated >= conns.size(); });
		conns.clear();
		res.reset();
		cfg::channelId = savedChannel;
		cfg::chunksize = savedChunk;
		cfg::linkexpiry = savedExpiry;
		cfg::maxfloodwait = savedFlood;
		cfg::maxfailovers = savedFailovers;
		cfg::maxstreamretries = savedStreamRetries;
		cfg::streamtimeout = savedStreamTimeout;
	}

	void AddFile(int64_t id, off_t size, mstring name = "file.bin", mstring mime = "video/mp4")
	{
		for (auto& kv : sessions)
			kv.second->AddFile(id, size, name, mime);
	}

	mstring Link(int64_t id)
	{
		return "/dl/" + EncodeLinkId(id, GetLinkKey(cfg::channelId));
	}

	tClient Connect()
	{
		int fds[2];
		tClient ret;
		if (0 != socketpair(AF_UNIX, SOCK_STREAM, 0, fds))
		{
			ADD_FAILURE() << "socketpair failed";
			return ret;
		}
		ret.fd.reset(fds[1]);
		fcntl(fds[1], F_SETFL, O_NONBLOCK);
		auto c = StartServing(unique_fd(fds[0]), "127.0.0.1", *res, [this](IConnBase*) { nTerminated++; });
		EXPECT_TRUE(c);
		conns.emplace_back(move(c));
		return ret;
	}

	size_t BusyCount()
	{
		return res->GetAllocator().GetStats().busy;
	}
};

TEST_F(dljobTest, full_download)
{
	AddFile(5, 20000, "movie.mp4");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("20000", r.Header("Content-Length"));
	EXPECT_EQ("video/mp4", r.Header("Content-Type"));
	EXPECT_EQ("attachment; filename=\"movie.mp4\"", r.Header("Content-Disposition"));
	EXPECT_EQ("bytes", r.Header("Accept-Ranges"));
	EXPECT_EQ("*", r.Header("Access-Control-Allow-Origin"));
	EXPECT_EQ("nosniff", r.Header("X-Content-Type-Options"));
	EXPECT_TRUE(r.Header("Content-Range").empty());
	EXPECT_EQ(FakeContent(0, 19999), r.body);

	// small files go to the first connection, all reads are chunk aligned
	EXPECT_EQ(5u, sessions[1]->nReads);
	for (auto& rd : sessions[1]->reads)
	{
		EXPECT_EQ(0, rd.first % 4096);
		EXPECT_EQ(4096u, rd.second);
	}
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
	EXPECT_TRUE(pushEventsUntil(5, [this]()
	{
		return res->GetAdmission().GetBandwidth().GetCurrentUsage() == 20000;
	}));
}

TEST_F(dljobTest, ranges)
{
	AddFile(5, 20000);
	auto cl = Connect();

	auto r = cl.Request(Get(Link(5), "Range: bytes=5000-12345\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ("bytes 5000-12345/20000", r.Header("Content-Range"));
	EXPECT_EQ("7346", r.Header("Content-Length"));
	EXPECT_EQ(FakeContent(5000, 12345), r.body);

	// same connection, keep-alive
	r = cl.Request(Get(Link(5), "Range: bytes=-100\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ("bytes 19900-19999/20000", r.Header("Content-Range"));
	EXPECT_EQ(FakeContent(19900, 19999), r.body);

	r = cl.Request(Get(Link(5), "Range: bytes=19990-\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ(FakeContent(19990, 19999), r.body);

	r = cl.Request(Get(Link(5), "Range: bytes=4095-4096\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ(FakeContent(4095, 4096), r.body);

	r = cl.Request(Get(Link(5), "Range: bytes=19999-19999\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ("bytes 19999-19999/20000", r.Header("Content-Range"));
	EXPECT_EQ(FakeContent(19999, 19999), r.body);
	EXPECT_FALSE(cl.eof);
}

TEST_F(dljobTest, unsatisfiable_range)
{
	AddFile(5, 20000);
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5), "Range: bytes=20000-\r\n"));
	EXPECT_EQ(416, r.status);
	EXPECT_EQ("bytes */20000", r.Header("Content-Range"));
	EXPECT_EQ(0u, sessions[1]->nReads);

	r = cl.Request(Get(Link(5), "Range: bytes=300-200\r\n"));
	EXPECT_EQ(416, r.status);
	// no clamping of the end
	r = cl.Request(Get(Link(5), "Range: bytes=19000-20000\r\n"));
	EXPECT_EQ(416, r.status);
}

TEST_F(dljobTest, head_and_options)
{
	AddFile(5, 20000, "Übersicht.pdf", "application/pdf");
	auto cl = Connect();
	auto r = cl.Request("HEAD " + Link(5) + " HTTP/1.1\r\n\r\n", true);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("20000", r.Header("Content-Length"));
	EXPECT_EQ("application/pdf", r.Header("Content-Type"));
	EXPECT_NE(stmiss, r.Header("Content-Disposition").find("filename*=UTF-8''%C3%9Cbersicht.pdf"));
	EXPECT_TRUE(r.body.empty());
	for (auto& kv : sessions)
		EXPECT_EQ(0u, kv.second->nReads);
	EXPECT_EQ(0u, BusyCount());

	r = cl.Request("OPTIONS " + Link(5) + " HTTP/1.1\r\n\r\n");
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("0", r.Header("Content-Length"));
	EXPECT_EQ("GET, HEAD, OPTIONS", r.Header("Access-Control-Allow-Methods"));
	EXPECT_EQ("Range, Content-Type", r.Header("Access-Control-Allow-Headers"));
}

TEST_F(dljobTest, empty_file)
{
	AddFile(8, 0, "");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(8)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("0", r.Header("Content-Length"));
	EXPECT_EQ("attachment; filename=\"file_8\"", r.Header("Content-Disposition"));
	EXPECT_EQ(0u, sessions[1]->nReads);

	r = cl.Request(Get(Link(8), "Range: bytes=0-\r\n"));
	EXPECT_EQ(416, r.status);
}

TEST_F(dljobTest, client_errors)
{
	auto cl = Connect();
	auto r = cl.Request(Get(Link(77)));
	EXPECT_EQ(404, r.status);
	EXPECT_NE(stmiss, r.body.find("deleted"));

	r = cl.Request(Get("/dl/!!notbase64!!"));
	EXPECT_EQ(400, r.status);
	// an id made with another channel key
	r = cl.Request(Get("/dl/" + EncodeLinkId(5, 1234567)));
	EXPECT_EQ(400, r.status);

	r = cl.Request(Get("/something/else"));
	EXPECT_EQ(404, r.status);

	r = cl.Request("POST " + Link(5) + " HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
	EXPECT_EQ(405, r.status);
	EXPECT_EQ("GET, HEAD, OPTIONS", r.Header("Allow"));
	EXPECT_EQ(0u, BusyCount());

	auto cl2 = Connect();
	r = cl2.Request("this is not http\r\n\r\n");
	EXPECT_EQ(400, r.status);
	EXPECT_TRUE(cl2.WaitClosed());
}

TEST_F(dljobTest, expired_link)
{
	cfg::linkexpiry = 5;
	AddFile(5, 100);
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(410, r.status);
	EXPECT_NE(stmiss, r.body.find(cfg::expiredtext));

	// fresh enough
	sessions[1]->AddFile(6, 100).created = GetTime();
	r = cl.Request(Get(Link(6)));
	EXPECT_EQ(200, r.status);
	EXPECT_EQ(FakeContent(0, 99), r.body);
}

TEST_F(dljobTest, admission)
{
	AddFile(5, 100);
	res->GetAdmission().GetRateLimiter().m_nMaxRequests = 2;
	auto cl = Connect();
	EXPECT_EQ(200, cl.Request(Get(Link(5))).status);
	EXPECT_EQ(200, cl.Request(Get(Link(5))).status);
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(429, r.status);
	EXPECT_EQ(ltos(cfg::reqwindow), r.Header("Retry-After"));
	// not a download request, not counted
	EXPECT_EQ(404, cl.Request(Get("/favicon.ico")).status);

	res->GetAdmission().GetRateLimiter().m_nMaxRequests = 100;
	auto& bw = res->GetAdmission().GetBandwidth();
	bw.m_nLimit = 150;
	bw.m_lastCheck = 0;
	r = cl.Request(Get(Link(5)));
	EXPECT_EQ(503, r.status);
	EXPECT_NE(stmiss, r.body.find("bandwidth"));
}

TEST_F(dljobTest, info)
{
	auto cl = Connect();
	auto r = cl.Request(Get("/api/info"));
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("application/json", r.Header("Content-Type"));
	EXPECT_NE(stmiss, r.body.find("\"status\":\"ok\""));
	EXPECT_NE(stmiss, r.body.find("\"primary\":{\"id\":1,\"name\":\"fake1\"}"));
	EXPECT_NE(stmiss, r.body.find("\"total\":3,\"live\":3"));

	sessions[1]->connected = false;
	r = cl.Request(Get("/api/info"));
	EXPECT_EQ(503, r.status);
	EXPECT_NE(stmiss, r.body.find("\"status\":\"error\""));
}

TEST_F(dljobTest, metadata_failover)
{
	AddFile(5, 10000);
	sessions[1]->lookupErrors.emplace_back(EUpstreamError::RATE_LIMITED, "flood", 30);
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ(FakeContent(0, 9999), r.body);
	// resolved through a worker, then again on the serving connection
	EXPECT_EQ(2u, sessions[1]->nLookups);
	EXPECT_EQ(1u, sessions[2]->nLookups + sessions[3]->nLookups);
}

TEST_F(dljobTest, metadata_retries_exhausted)
{
	AddFile(5, 10000);
	for (auto& kv : sessions)
	{
		for (int i = 0; i < 5; ++i)
			kv.second->lookupErrors.emplace_back(EUpstreamError::TRANSIENT, "timeout");
	}
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(503, r.status);
	unsigned total = 0;
	for (auto& kv : sessions)
		total += kv.second->nLookups;
	EXPECT_EQ(unsigned(cfg::maxmetaretries), total);
	EXPECT_EQ(0u, BusyCount());
}

TEST_F(dljobTest, stream_rate_limit_failover)
{
	AddFile(5, 20000);
	auto& s1 = sessions[1];
	s1->readsBeforeErrors = 2;
	s1->readErrors.emplace_back(EUpstreamError::RATE_LIMITED, "flood", 60);
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5), "Range: bytes=1000-\r\n"));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(206, r.status);
	EXPECT_EQ(FakeContent(1000, 19999), r.body);

	// nothing is read from the limited session after the failed offset
	ASSERT_EQ(3u, s1->nReads);
	EXPECT_EQ(8192, s1->reads.back().first);
	// the first idle connection of the other group took over, continuing at the failed offset
	ASSERT_EQ(3u, sessions[2]->nReads);
	EXPECT_EQ(8192, sessions[2]->reads.front().first);
	EXPECT_EQ(0u, sessions[3]->nReads);

	auto& alloc = res->GetAllocator();
	EXPECT_EQ(EConnStatus::RATE_LIMITED, alloc.GetStatus(1));
	EXPECT_TRUE(pushEventsUntil(5, [&alloc]() { return alloc.GetStatus(2) == EConnStatus::IDLE; }));

	// the next small file has to overflow into the other group
	AddFile(6, 100);
	r = cl.Request(Get(Link(6)));
	EXPECT_EQ(200, r.status);
	EXPECT_EQ(3u, s1->nReads);
}

TEST_F(dljobTest, stale_reference)
{
	AddFile(5, 20000);
	auto& s1 = sessions[1];
	s1->readsBeforeErrors = 1;
	s1->readErrors.emplace_back(EUpstreamError::STALE_REFERENCE, "file reference expired");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ(FakeContent(0, 19999), r.body);
	// looked up again on the same session
	EXPECT_EQ(2u, s1->nLookups);
	EXPECT_EQ(0u, sessions[2]->nReads + sessions[3]->nReads);
}

TEST_F(dljobTest, connection_lost_while_streaming)
{
	AddFile(5, 40000);
	auto& s1 = sessions[1];
	s1->readsBeforeErrors = 2;
	s1->dropOnError = true;
	s1->readErrors.emplace_back(EUpstreamError::STALE_REFERENCE, "file reference expired");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(200, r.status);
	EXPECT_EQ(FakeContent(0, 39999), r.body);

	EXPECT_EQ(3u, s1->nReads);
	// the small group without the lost session is connection 2, it continues where 1 stopped
	ASSERT_EQ(8u, sessions[2]->nReads);
	EXPECT_EQ(8192, sessions[2]->reads.front().first);
	EXPECT_EQ(0u, sessions[3]->nReads);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
}

TEST_F(dljobTest, stream_timeout)
{
	cfg::streamtimeout = 1;
	AddFile(5, 20000);
	sessions[1]->stallReads = true;
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)), false, 5);
	EXPECT_EQ(504, r.status);
	EXPECT_EQ(1u, sessions[1]->nReads);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
}

TEST_F(dljobTest, misaligned_upstream)
{
	AddFile(5, 20000);
	// more than a chunk on the first read
	sessions[1]->overdeliver = 10;
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(500, r.status);
	EXPECT_EQ(1u, sessions[1]->nReads);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
}

TEST_F(dljobTest, misaligned_upstream_while_streaming)
{
	AddFile(5, 20000);
	sessions[1]->readsBeforeErrors = 1;
	sessions[1]->readErrors.emplace_back(EUpstreamError::BAD_ALIGNMENT, "offset or limit not aligned");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	// never retried, the stream is cut
	EXPECT_EQ(200, r.status);
	EXPECT_FALSE(r.complete);
	EXPECT_EQ(FakeContent(0, 4095), r.body);
	EXPECT_TRUE(cl.eof);
	EXPECT_EQ(2u, sessions[1]->nReads);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
}

TEST_F(dljobTest, transient_retry)
{
	AddFile(5, 20000);
	sessions[1]->readsBeforeErrors = 3;
	sessions[1]->readErrors.emplace_back(EUpstreamError::TRANSIENT, "connection reset");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	ASSERT_TRUE(r.complete);
	EXPECT_EQ(FakeContent(0, 19999), r.body);
	EXPECT_EQ(6u, sessions[1]->nReads);
}

TEST_F(dljobTest, retries_exhausted_before_data)
{
	AddFile(5, 20000);
	for (int i = 0; i < 3; ++i)
		sessions[1]->readErrors.emplace_back(EUpstreamError::TRANSIENT, "connection reset");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(503, r.status);
	EXPECT_EQ(3u, sessions[1]->nReads);
	EXPECT_FALSE(cl.eof);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0; }));
}

TEST_F(dljobTest, retries_exhausted_while_streaming)
{
	AddFile(5, 20000);
	sessions[1]->readsBeforeErrors = 1;
	for (int i = 0; i < 3; ++i)
		sessions[1]->readErrors.emplace_back(EUpstreamError::TRANSIENT, "connection reset");
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	// the head is out, only a disconnect is left
	EXPECT_EQ(200, r.status);
	EXPECT_FALSE(r.complete);
	EXPECT_EQ(FakeContent(0, 4095), r.body);
	EXPECT_TRUE(cl.eof);
	EXPECT_TRUE(pushEventsUntil(5, [this]() { return BusyCount() == 0 && nTerminated == 1; }));
}

TEST_F(dljobTest, short_upstream)
{
	AddFile(5, 20000);
	// the remote has less than announced
	sessions[1]->dataLimit = 10000;
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(200, r.status);
	EXPECT_FALSE(r.complete);
	EXPECT_EQ(FakeContent(0, 9999), r.body);
	EXPECT_TRUE(cl.eof);
}

TEST_F(dljobTest, release_on_disconnect)
{
	AddFile(5, 64 * 1024 * 1024);
	{
		auto cl = Connect();
		cl.Send(Get(Link(5)));
		// started but the client does not take more
		ASSERT_TRUE(pushEventsUntil(5, [&cl]()
		{
			cl.Pump();
			return cl.data.find("\r\n\r\n") != stmiss;
		}));
		EXPECT_EQ(200, atoi(cl.data.c_str() + 9));
		EXPECT_EQ(1u, BusyCount());
		EXPECT_EQ("dl-5-", res->GetAllocator().GetTask(1).substr(0, 5));
	}
	ASSERT_TRUE(pushEventsUntil(5, [this]() { return nTerminated == 1; }));
	EXPECT_EQ(0u, BusyCount());
	EXPECT_EQ(EConnStatus::IDLE, res->GetAllocator().GetStatus(1));
	auto reads = sessions[1]->nReads;
	pushEvents(1, nullptr);
	EXPECT_EQ(reads, sessions[1]->nReads);
	auto used = res->GetAdmission().GetBandwidth().GetCurrentUsage();
	EXPECT_GT(used, 0);
	EXPECT_LT(used, 64 * 1024 * 1024);
}

TEST_F(dljobTest, no_connections)
{
	AddFile(5, 100);
	for (auto& kv : sessions)
		kv.second->connected = false;
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5)));
	EXPECT_EQ(503, r.status);
}

TEST_F(dljobTest, connection_close)
{
	AddFile(5, 100);
	auto cl = Connect();
	auto r = cl.Request(Get(Link(5), "Connection: close\r\n"));
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("close", r.Header("Connection"));
	EXPECT_EQ(FakeContent(0, 99), r.body);
	EXPECT_TRUE(cl.WaitClosed());

	auto cl10 = Connect();
	r = cl10.Request("GET " + Link(5) + " HTTP/1.0\r\n\r\n");
	EXPECT_EQ(200, r.status);
	EXPECT_EQ("HTTP/1.0 200", r.head.substr(0, 12));
	EXPECT_TRUE(cl10.WaitClosed());
}
