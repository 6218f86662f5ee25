#include "admission.h"
#include "sgres.h"
#include "sgclock.h"
#include "sgcfg.h"
#include "sglogger.h"
#include "debug.h"

#include <algorithm>
#include <fstream>
#include <vector>

#include <cstdio>
#include <unistd.h>
#include <sys/time.h>

using namespace std;

namespace sgate
{

#define BW_RECHECK_SECS 60
#define BW_KEEP_MONTHS 3

ratelimiter::ratelimiter(unsigned maxRequests, unsigned windowSecs, size_t maxTracked, tTimeSource now)
	: m_nMaxRequests(maxRequests), m_nWindow(windowSecs), m_nMaxTracked(maxTracked), m_now(move(now))
{
	if (!m_now)
		m_now = GetTime;
	m_lastCleanup = m_now();
}

bool ratelimiter::IsAllowed(cmstring& clientIp)
{
	lguard g(m_mx);
	auto now = m_now();
	if (now - m_lastCleanup > m_nWindow)
		cleanup(now);

	auto& q = m_requests[clientIp];
	while (!q.empty() && q.front() < now - time_t(m_nWindow))
		q.pop_front();
	if (q.size() >= m_nMaxRequests)
		return false;
	q.push_back(now);
	return true;
}

void ratelimiter::Cleanup()
{
	lguard g(m_mx);
	cleanup(m_now());
}

void ratelimiter::cleanup(time_t now)
{
	m_lastCleanup = now;
	for (auto it = m_requests.begin(); it != m_requests.end();)
	{
		auto& q = it->second;
		while (!q.empty() && q.front() < now - 2 * time_t(m_nWindow))
			q.pop_front();
		if (q.empty())
			it = m_requests.erase(it);
		else
			++it;
	}
	if (m_requests.size() <= m_nMaxTracked)
		return;

	vector<pair<time_t, mstring>> byAge;
	for (const auto& it : m_requests)
		byAge.emplace_back(it.second.front(), it.first);
	sort(byAge.begin(), byAge.end());
	auto nDrop = m_requests.size() - m_nMaxTracked / 2;
	for (size_t i = 0; i < nDrop; ++i)
		m_requests.erase(byAge[i].second);
	log::misc("Request tracking trimmed by "s + ltos(nDrop) + " addresses");
}

size_t ratelimiter::GetTrackedCount()
{
	lguard g(m_mx);
	return m_requests.size();
}

bwtracker::bwtracker(cmstring& stateFile, off_t limitBytes, tTimeSource now)
	: m_stateFile(stateFile), m_nLimit(limitBytes), m_now(move(now))
{
	if (!m_now)
		m_now = GetTime;
}

mstring bwtracker::monthKey(time_t when)
{
	struct tm tmp;
	char buf[16];
	localtime_r(&when, &tmp);
	auto len = strftime(buf, sizeof(buf), "%Y-%m", &tmp);
	return mstring(buf, len);
}

mstring bwtracker::GetMonthKey()
{
	return monthKey(m_now());
}

void bwtracker::Add(off_t bytes)
{
	if (bytes <= 0)
		return;
	auto key = GetMonthKey();
	lguard g(m_mx);
	m_months[key] += bytes;
	m_bDirty = true;
}

off_t bwtracker::GetMonthUsage(cmstring& key)
{
	lguard g(m_mx);
	auto it = m_months.find(key);
	return it == m_months.end() ? 0 : it->second;
}

bool bwtracker::IsLimitExceeded()
{
	if (m_nLimit <= 0)
		return false;
	auto now = m_now();
	auto key = monthKey(now);
	lguard g(m_mx);
	if (key != m_checkedMonth)
	{
		// new month, new budget
		m_checkedMonth = key;
		m_bLimitReached = false;
		m_lastCheck = 0;
	}
	if (m_bLimitReached)
		return true;
	if (m_lastCheck && now - m_lastCheck < BW_RECHECK_SECS)
		return false;
	m_lastCheck = now;
	m_bLimitReached = m_months[key] >= m_nLimit;
	if (m_bLimitReached)
		log::err("Monthly bandwidth limit reached: "s + offttosH(m_months[key]) + " of " + offttosH(m_nLimit));
	return m_bLimitReached;
}

void bwtracker::DropOldRecords()
{
	auto now = m_now();
	auto current = monthKey(now);
	auto cutoff = monthKey(now - BW_KEEP_MONTHS * 30 * 86400);
	lguard g(m_mx);
	for (auto it = m_months.begin(); it != m_months.end();)
	{
		if (it->first < cutoff && it->first != current)
		{
			it = m_months.erase(it);
			m_bDirty = true;
		}
		else
			++it;
	}
}

mstring bwtracker::Load()
{
	if (m_stateFile.empty())
		return mstring();
	ifstream in(m_stateFile);
	if (!in.is_open())
		return mstring();
	mstring line;
	unsigned lineNo = 0;
	lguard g(m_mx);
	while (getline(in, line))
	{
		lineNo++;
		tSplitWalk split(line);
		string_view key, val;
		if (split.Next())
			key = split.view();
		if (split.Next())
			val = split.view();
		int64_t bytes;
		if (key.length() != 7 || !ParseInt64(val, bytes) || bytes < 0)
			return "Bad bandwidth record in " + m_stateFile + " line " + ltos(lineNo);
		m_months[mstring(key)] = bytes;
	}
	return mstring();
}

mstring bwtracker::Save()
{
	if (m_stateFile.empty())
		return mstring();
	DropOldRecords();
	lguard g(m_mx);
	if (!m_bDirty)
		return mstring();
	auto temp = m_stateFile + ".new";
	{
		ofstream out(temp, ios::trunc);
		for (const auto& it : m_months)
			out << it.first << " " << it.second << "\n";
		out.flush();
		if (!out)
			return "Cannot write " + temp;
	}
	if (0 != rename(temp.c_str(), m_stateFile.c_str()))
	{
		unlink(temp.c_str());
		return "Cannot replace " + m_stateFile;
	}
	m_bDirty = false;
	return mstring();
}

admission::admission(sgres* res, tTimeSource now)
	: m_limiter(cfg::maxreqsperip, cfg::reqwindow, cfg::maxtrackedips, now),
	  m_bw(cfg::statedir.empty() ? mstring() : cfg::statedir + "bandwidth.dat", cfg::GetBandwidthLimit(), now)
{
	auto err = m_bw.Load();
	if (!err.empty())
		log::err(err);
	if (!res)
		return;
	struct timeval tvClean { cfg::reqwindow, 0 }, tvFlush { cfg::bwflushinterval, 0 };
	m_cleanSub = res->GetCustomBeat(sgres::BEAT_RATE_CLEAN, tvClean).AddListener([this]()
	{
		m_limiter.Cleanup();
	});
	m_flushSub = res->GetCustomBeat(sgres::BEAT_BW_FLUSH, tvFlush).AddListener([this]()
	{
		auto err = m_bw.Save();
		if (!err.empty())
			log::err(err);
	});
}

admission::~admission()
{
	m_cleanSub.reset();
	m_flushSub.reset();
	auto err = m_bw.Save();
	if (!err.empty())
		log::err(err);
}

admission::EVerdict admission::Check(cmstring& clientIp)
{
	if (!m_limiter.IsAllowed(clientIp))
	{
		log::err("Too many download requests", clientIp);
		return EVerdict::RATE_LIMITED;
	}
	if (m_bw.IsLimitExceeded())
		return EVerdict::BANDWIDTH_EXCEEDED;
	return EVerdict::OK;
}

}
