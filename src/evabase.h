#ifndef __EVABASE_H__
#define __EVABASE_H__

#include "config.h"
#include "sgtemplates.h"
#include "aobservable.h"

#include <atomic>

#include <event.h>

namespace sgate
{

/**
 * Owner of the libevent loop. There is only one, it runs on the main thread and all
 * network and timer processing of the daemon happens there.
 *
 * Subscribers are notified when the loop has been stopped, to drop their sockets and timers.
 */
class SGATE_API evabase : public aobservable
{
public:
	static event_base *base;

	static evabase& GetGlobal();
	static lint_ptr<evabase> Create() { return lint_ptr<evabase>(new evabase); }
	~evabase();

	/**
	 * Runs until SignalStop. Reports readiness and shutdown to the service manager if built with systemd support.
	 */
	int MainLoop();
	static void SignalStop();
	// non-binding, true after SignalStop
	bool IsShuttingDown() const { return m_bStopping; }

	/**
	 * Queues an action for one of the next loop cycles, never runs it right away.
	 * Main thread only. Actions still queued at destruction are dropped.
	 */
	static void Post(tAction&&);

private:
	evabase();
	std::atomic_bool m_bStopping;
	// runs the queued actions and other pending events, without waiting
	void drain();
};

}

#endif
