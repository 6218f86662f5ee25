#ifndef CONNPOOL_H
#define CONNPOOL_H

#include "upstream.h"
#include "sgstrop.h"

#include <mutex>
#include <stdexcept>
#include <vector>

namespace sgate
{

class metacache;
class tBeatNotifier;

struct tNoConnectionsAvailable : public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

/**
 * One authenticated upstream session with its own metadata cache.
 * Created at startup, never recreated while running.
 */
class SGATE_API tUpstreamConn : public tLintRefcounted
{
public:
	enum class ERole : uint8_t
	{
		PRIMARY,
		WORKER
	};

	int64_t id = 0;
	ERole role = ERole::WORKER;
	mstring name;
	lint_ptr<IUpstreamSession> session;
	lint_ptr<metacache> cache;

	bool IsPrimary() const { return role == ERole::PRIMARY; }
	bool IsLive() const { return session && session->IsConnected(); }
	mstring GetLabel() const;
};
using tConnPtr = lint_ptr<tUpstreamConn>;

/**
 * Owner of all upstream connections: one primary and any number of workers.
 */
class SGATE_API connpool
{
public:
	/**
	 * @param cleanBeat Clock for the wholesale cleaning of the metadata caches, optional
	 */
	connpool(tSessionFactory factory, tBeatNotifier* cleanBeat);
	~connpool();

	/**
	 * Starts the primary session, then all workers at once. Failed workers are logged and left out.
	 * @param cb Reports whether the primary session is usable, called when all workers are done.
	 */
	void Start(cmstring& primaryToken, const tStrVec& workerTokens, std::function<void(bool)> cb);
	/**
	 * Round-robin over the connected workers, the primary if none is connected.
	 * @throw tNoConnectionsAvailable
	 */
	tConnPtr SelectForStreaming();
	/**
	 * Like SelectForStreaming but never the excluded one.
	 * @return nullptr if there is nothing else
	 */
	tConnPtr SelectAlternative(int64_t excludeId);
	// nullptr before start or after stop
	tConnPtr GetPrimary();
	tConnPtr Lookup(int64_t id);
	// ids of connected sessions, primary first, workers in configuration order
	std::vector<int64_t> GetLiveIds();
	size_t size();

	/**
	 * Disconnects all sessions at once and drops all connections. Safe to call again.
	 */
	void Stop(tAction done);

	SUTPRIVATE:
	tSessionFactory m_factory;
	tBeatNotifier* m_cleanBeat;
	std::mutex m_mx;
	tConnPtr m_primary;
	std::vector<tConnPtr> m_workers;
	unsigned m_nRoundRobin = 0;
	bool m_bStopped = false;

	tConnPtr makeConn(lint_ptr<IUpstreamSession>, const tSessionIdentity&, tUpstreamConn::ERole);
	void startWorkers(const tStrVec& tokens, std::function<void(bool)> cb);
	tConnPtr pickNext(int64_t excludeId);
};

}

#endif // CONNPOOL_H
