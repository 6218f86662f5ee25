#include "allocator.h"
#include "connpool.h"
#include "sglogger.h"
#include "sgstrop.h"
#include "debug.h"

#include <algorithm>

using namespace std;

namespace sgate
{

LPCSTR GetStatusName(EConnStatus st)
{
	switch (st)
	{
	case EConnStatus::IDLE: return "idle";
	case EConnStatus::BUSY: return "busy";
	case EConnStatus::RATE_LIMITED: return "rate-limited";
	}
	return "unknown";
}

allocator::allocator(tLiveIds liveIds, off_t smallFileThreshold, tTimeSource now)
	: m_liveIds(move(liveIds)), m_smallThreshold(smallFileThreshold), m_now(move(now))
{
	if (!m_now)
		m_now = GetTime;
}

size_t allocator::SmallGroupSize(size_t n)
{
	if (n <= 2)
		return 1;
	return ((n - 2) + (n % 2)) / 2;
}

allocator::tGroups allocator::Partition(const std::vector<int64_t>& ids)
{
	tGroups ret;
	switch (ids.size())
	{
	case 0:
		break;
	case 1:
		ret.small = ids;
		ret.large = ids;
		break;
	default:
	{
		auto nSmall = SmallGroupSize(ids.size());
		ret.small.assign(ids.begin(), ids.begin() + nSmall);
		ret.large.assign(ids.begin() + nSmall, ids.end());
		break;
	}
	}
	return ret;
}

allocator::tGroups allocator::calcGroups()
{
	auto ids = m_liveIds();
	if (ids.size() != m_nLastLiveCount)
	{
		LOG("live connection count changed to " << ids.size() << ", restarting round-robin");
		m_nSmallIdx = m_nLargeIdx = 0;
		m_nLastLiveCount = ids.size();
	}
	return Partition(ids);
}

bool allocator::isAvailable(int64_t id, time_t now)
{
	auto& st = m_states[id];
	if (st.status == EConnStatus::RATE_LIMITED)
	{
		if (now < st.limitedUntil)
			return false;
		st.status = EConnStatus::IDLE;
		st.limitedUntil = 0;
	}
	return st.status == EConnStatus::IDLE;
}

std::vector<int64_t> allocator::filterAvailable(const std::vector<int64_t>& group, int64_t excludeId, time_t now)
{
	std::vector<int64_t> ret;
	for (auto id : group)
	{
		if (id != excludeId && isAvailable(id, now))
			ret.emplace_back(id);
	}
	return ret;
}

int64_t allocator::pickRoundRobin(const std::vector<int64_t>& avail, size_t& idx)
{
	if (idx >= avail.size())
		idx = 0;
	auto ret = avail[idx];
	idx = (idx + 1) % avail.size();
	return ret;
}

void allocator::assign(int64_t id, cmstring& taskId)
{
	auto& st = m_states[id];
	st.status = EConnStatus::BUSY;
	st.task = taskId;
	st.limitedUntil = 0;
}

int64_t allocator::Acquire(off_t fileSize, cmstring& taskId)
{
	lguard g(m_mx);
	auto now = m_now();
	auto groups = calcGroups();
	bool small = IsSmall(fileSize);

	auto avail = filterAvailable(small ? groups.small : groups.large, 0, now);
	bool overflow = false;
	if (avail.empty() && small)
	{
		avail = filterAvailable(groups.large, 0, now);
		overflow = true;
	}
	if (avail.empty())
	{
		size_t busy = 0, limited = 0;
		for (const auto& it : m_states)
		{
			busy += it.second.status == EConnStatus::BUSY;
			limited += it.second.status == EConnStatus::RATE_LIMITED;
		}
		log::err("No connection for "s + (small ? "small"s : "large"s) + " file task " + taskId
				 + ", live: " + ltos(m_nLastLiveCount) + ", busy: " + ltos(busy)
				 + ", rate-limited: " + ltos(limited));
		throw tNoConnectionsAvailable("no connection available for "s + (small ? "small" : "large") + " file");
	}
	auto id = pickRoundRobin(avail, (small && !overflow) ? m_nSmallIdx : m_nLargeIdx);
	assign(id, taskId);
	USRDBG("connection " << id << " allocated for " << offttosH(fileSize) << (overflow ? " (overflow)" : "")
		   << " task " << taskId);
	return id;
}

std::optional<int64_t> allocator::OnRateLimited(int64_t connId, int retryAfter, off_t fileSize, cmstring& taskId)
{
	lguard g(m_mx);
	auto now = m_now();
	auto& st = m_states[connId];
	st.status = EConnStatus::RATE_LIMITED;
	st.limitedUntil = now + retryAfter;
	st.task.clear();
	log::err("Connection "s + ltos(connId) + " is rate-limited for " + ltos(retryAfter)
			 + "s, looking for a replacement for task " + taskId);

	auto groups = calcGroups();
	auto avail = filterAvailable(IsSmall(fileSize) ? groups.small : groups.large, connId, now);
	if (avail.empty() && IsSmall(fileSize))
		avail = filterAvailable(groups.large, connId, now);
	if (avail.empty())
	{
		log::err("No replacement connection for task "s + taskId);
		return std::nullopt;
	}
	// emergency path, no fairness
	auto id = avail.front();
	assign(id, taskId);
	log::misc("Task "s + taskId + " moved from connection " + ltos(connId) + " to " + ltos(id));
	return id;
}

void allocator::Release(int64_t connId, cmstring& taskId)
{
	lguard g(m_mx);
	auto& st = m_states[connId];
	if (st.task == taskId)
	{
		st.task.clear();
		st.status = EConnStatus::IDLE;
	}
	else if (st.task.empty())
	{
		LOG("release of " << connId << " for " << taskId << " without recorded task");
		st.status = EConnStatus::IDLE;
		st.limitedUntil = 0;
	}
	else
	{
		log::err("Connection "s + ltos(connId) + " not released for task " + taskId
				 + ", it is busy with " + st.task);
	}
}

void allocator::Sweep()
{
	auto live = m_liveIds();
	lguard g(m_mx);
	auto now = m_now();
	for (auto it = m_states.begin(); it != m_states.end();)
	{
		if (find(live.begin(), live.end(), it->first) == live.end())
		{
			LOG("forgetting state of connection " << it->first);
			it = m_states.erase(it);
			continue;
		}
		if (it->second.status == EConnStatus::RATE_LIMITED && now >= it->second.limitedUntil)
		{
			it->second.status = EConnStatus::IDLE;
			it->second.limitedUntil = 0;
		}
		++it;
	}
}

EConnStatus allocator::GetStatus(int64_t connId)
{
	lguard g(m_mx);
	auto it = m_states.find(connId);
	return it == m_states.end() ? EConnStatus::IDLE : it->second.status;
}

mstring allocator::GetTask(int64_t connId)
{
	lguard g(m_mx);
	auto it = m_states.find(connId);
	return it == m_states.end() ? mstring() : it->second.task;
}

allocator::tStats allocator::GetStats()
{
	lguard g(m_mx);
	tStats ret;
	auto groups = calcGroups();
	ret.live = m_nLastLiveCount;
	ret.smallGroup = groups.small.size();
	ret.largeGroup = groups.large.size();
	for (const auto& it : m_states)
	{
		switch (it.second.status)
		{
		case EConnStatus::IDLE: ret.idle++; break;
		case EConnStatus::BUSY: ret.busy++; break;
		case EConnStatus::RATE_LIMITED: ret.rateLimited++; break;
		}
		ret.tasks += !it.second.task.empty();
	}
	return ret;
}

mstring allocator::FormatStats()
{
	auto st = GetStats();
	return "live: "s + ltos(st.live) + " (small " + ltos(st.smallGroup) + ", large " + ltos(st.largeGroup)
			+ "), idle: " + ltos(st.idle) + ", busy: " + ltos(st.busy) + ", rate-limited: "
			+ ltos(st.rateLimited) + ", tasks: " + ltos(st.tasks);
}

}
