#ifndef ALLOCATOR_H
#define ALLOCATOR_H

#include "sgtypes.h"
#include "sut.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include <ctime>

namespace sgate
{

enum class EConnStatus : uint8_t
{
	IDLE,
	BUSY,
	RATE_LIMITED
};
LPCSTR GetStatusName(EConnStatus);

/**
 * Binds download tasks to upstream connections, by file size class and connection state.
 *
 * The live connections are split into a group preferred for small files (the first ones)
 * and one for large files. Small files may overflow into the large group, never the other way round.
 * The connections are only known by id, the pool remains their owner.
 */
class SGATE_API allocator
{
public:
	using tLiveIds = std::function<std::vector<int64_t>()>;
	using tTimeSource = std::function<time_t()>;

	allocator(tLiveIds liveIds, off_t smallFileThreshold, tTimeSource now = tTimeSource());

	/**
	 * Picks an idle connection, round-robin within the matching group, and marks it busy.
	 * @throw tNoConnectionsAvailable
	 */
	int64_t Acquire(off_t fileSize, cmstring& taskId);
	/**
	 * Parks the connection until the flood wait is over and hands the task to the first idle
	 * connection of the matching group.
	 * @return The replacement, already busy with the task, or nothing
	 */
	std::optional<int64_t> OnRateLimited(int64_t connId, int retryAfter, off_t fileSize, cmstring& taskId);
	/**
	 * Makes the connection idle, unless it was meanwhile given to another task.
	 */
	void Release(int64_t connId, cmstring& taskId);
	// expires flood waits, forgets connections which are no longer live
	void Sweep();

	EConnStatus GetStatus(int64_t connId);
	mstring GetTask(int64_t connId);
	bool IsSmall(off_t fileSize) const { return fileSize < m_smallThreshold; }

	struct tGroups
	{
		std::vector<int64_t> small, large;
	};
	static size_t SmallGroupSize(size_t n);
	static tGroups Partition(const std::vector<int64_t>& liveIds);

	struct tStats
	{
		size_t live = 0, smallGroup = 0, largeGroup = 0;
		size_t idle = 0, busy = 0, rateLimited = 0, tasks = 0;
	};
	tStats GetStats();
	mstring FormatStats();

	SUTPRIVATE:
	struct tConnState
	{
		EConnStatus status = EConnStatus::IDLE;
		mstring task;
		time_t limitedUntil = 0;
	};

	std::mutex m_mx;
	tLiveIds m_liveIds;
	off_t m_smallThreshold;
	tTimeSource m_now;
	std::map<int64_t, tConnState> m_states;
	size_t m_nSmallIdx = 0, m_nLargeIdx = 0;
	size_t m_nLastLiveCount = 0;

	tGroups calcGroups();
	bool isAvailable(int64_t id, time_t now);
	std::vector<int64_t> filterAvailable(const std::vector<int64_t>& group, int64_t excludeId, time_t now);
	int64_t pickRoundRobin(const std::vector<int64_t>& avail, size_t& idx);
	void assign(int64_t id, cmstring& taskId);
};

}

#endif // ALLOCATOR_H
