#ifndef ADMISSION_H
#define ADMISSION_H

#include "sgtypes.h"
#include "sgstrop.h"
#include "aobservable.h"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace sgate
{

class sgres;
using tTimeSource = std::function<time_t()>;

/**
 * Sliding window request counter per client address.
 */
class SGATE_API ratelimiter
{
public:
	ratelimiter(unsigned maxRequests, unsigned windowSecs, size_t maxTracked = 1000,
				tTimeSource now = tTimeSource());

	// counts the request if it is allowed
	bool IsAllowed(cmstring& clientIp);
	/**
	 * Drops stale timestamps and idle addresses. When too many addresses remain,
	 * the ones with the oldest activity are dropped down to half of the limit.
	 */
	void Cleanup();
	size_t GetTrackedCount();
	unsigned GetWindow() const { return m_nWindow; }

	SUTPRIVATE:
	std::mutex m_mx;
	unsigned m_nMaxRequests, m_nWindow;
	size_t m_nMaxTracked;
	tTimeSource m_now;
	time_t m_lastCleanup;
	std::unordered_map<mstring, std::deque<time_t>> m_requests;

	void cleanup(time_t now);
};

/**
 * Monthly traffic accounting with an optional cap.
 *
 * Totals live in memory and are written to the state file periodically, updates between
 * the last flush and a crash are lost.
 */
class SGATE_API bwtracker
{
public:
	/**
	 * @param stateFile Where the totals are kept, no persistence if empty
	 * @param limitBytes Monthly cap, 0 for unlimited
	 */
	bwtracker(cmstring& stateFile, off_t limitBytes, tTimeSource now = tTimeSource());

	void Add(off_t bytes);
	/**
	 * Checks the usage of the current month, the result is reused for a minute.
	 * Once reached, the limit stays in effect until the month changes.
	 */
	bool IsLimitExceeded();
	off_t GetMonthUsage(cmstring& monthKey);
	off_t GetCurrentUsage() { return GetMonthUsage(GetMonthKey()); }
	mstring GetMonthKey();

	// @return Error description, empty on success
	mstring Load();
	mstring Save();
	// keeps the current month and the ones which started within the last three months
	void DropOldRecords();

	SUTPRIVATE:
	std::mutex m_mx;
	mstring m_stateFile;
	off_t m_nLimit;
	tTimeSource m_now;
	std::map<mstring, off_t> m_months;
	bool m_bDirty = false;
	bool m_bLimitReached = false;
	time_t m_lastCheck = 0;
	mstring m_checkedMonth;

	mstring monthKey(time_t);
};

/**
 * Gate for download requests, consulted before any upstream connection is touched.
 */
class SGATE_API admission
{
public:
	enum class EVerdict : uint8_t
	{
		OK,
		RATE_LIMITED,
		BANDWIDTH_EXCEEDED
	};

	admission(sgres* res, tTimeSource now = tTimeSource());
	~admission();

	EVerdict Check(cmstring& clientIp);
	ratelimiter& GetRateLimiter() { return m_limiter; }
	bwtracker& GetBandwidth() { return m_bw; }

	SUTPRIVATE:
	ratelimiter m_limiter;
	bwtracker m_bw;
	aobservable::subscription m_cleanSub, m_flushSub;
};

}

#endif // ADMISSION_H
