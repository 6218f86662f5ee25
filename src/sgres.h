#ifndef SGRES_H
#define SGRES_H

#include "sut.h"
#include "sgsmartptr.h"
#include "upstream.h"

extern "C"
{
struct timeval;
}

namespace sgate
{
class tBeatNotifier;
class tSslConfig;
class CDnsBase;
class connpool;
class allocator;
class admission;

/**
 * @brief The sgres class provides access to the shared resources of the daemon
 * - predefined notification clocks
 * - TLS and DNS helpers for the gateway sessions
 * - upstream connection pool with its allocator
 * - admission control
 */
class SGATE_API sgres
{
public:
	enum EBeatId
	{
		BEAT_CACHE_CLEAN,
		BEAT_ALLOC_SWEEP,
		BEAT_RATE_CLEAN,
		BEAT_BW_FLUSH
	};

	virtual ~sgres() =default;
	/**
	 * @param factory Creates the upstream sessions, gateway sessions are used if unset
	 */
	static sgres* Create(tSessionFactory factory = tSessionFactory());

	virtual tBeatNotifier& GetIdleCheckBeat() =0;
	/**
	 * @brief GetCustomBeat returns a clock of an own category, created with the first call
	 */
	virtual tBeatNotifier& GetCustomBeat(EBeatId id, const struct timeval& interval) =0;
	virtual tSslConfig &GetSslConfig() =0;
	// might return nullptr if the resolver is not usable
	virtual CDnsBase* GetDnsBase() =0;

	virtual connpool& GetPool() =0;
	virtual allocator& GetAllocator() =0;
	virtual admission& GetAdmission() =0;
};

}

#endif // SGRES_H
