#ifndef METACACHE_H
#define METACACHE_H

#include "upstream.h"
#include "aobservable.h"
#include "sgsmartptr.h"

#include <unordered_map>
#include <list>

namespace sgate
{

class tBeatNotifier;

/**
 * Remote file descriptors of one upstream session, keyed by message id.
 *
 * The whole table is dropped on every beat of the clean clock, there is no per-entry expiration.
 */
class SGATE_API metacache : public tLintRefcounted
{
public:
	using tResult = IUpstreamSession::tLookupResult;

	metacache(lint_ptr<IUpstreamSession> session, tBeatNotifier* cleanBeat);
	~metacache();

	/**
	 * Reports the cached descriptor right away, or looks it up through the session.
	 * Concurrent requests for the same message share one lookup.
	 * @return Handle which withdraws the interest in the result when destroyed
	 */
	TFinalAction Resolve(int64_t messageId, tResult) WARN_UNUSED;
	// drop one entry, i.e. after the remote reported a stale file reference
	void Forget(int64_t messageId);
	void Clear();
	size_t size() const { return m_entries.size(); }

	SUTPRIVATE:
	lint_ptr<IUpstreamSession> m_session;
	std::unordered_map<int64_t, tRemoteFile> m_entries;

	struct tLookup
	{
		TFinalAction handle;
		std::list<std::pair<unsigned, tResult>> waiters;
	};
	std::unordered_map<int64_t, tLookup> m_inflight;
	unsigned m_nLastWaiter = 0;
	aobservable::subscription m_cleanSub;

	void onLookupDone(int64_t messageId, const tUpstreamStatus&, const tRemoteFile&);
};

}

#endif // METACACHE_H
