#ifndef AOBSERVABLE_H
#define AOBSERVABLE_H

#include "sgtypes.h"
#include "sgsmartptr.h"
#include "sgtemplates.h"

#include <map>

namespace sgate
{

/**
 * List of listeners which are notified together. A listener stays registered as long as
 * its subscription handle exists.
 *
 * notify() only schedules the delivery, the listeners are called from the event loop.
 * Several notify() calls before that are delivered once.
 */
class aobservable : public tLintRefcounted
{
public:
	using TNotifier = tAction;
	using subscription = TFinalAction;

	virtual ~aobservable() =default;

	subscription subscribe(TNotifier listener) WARN_UNUSED;
	// @return false if nobody listens or a delivery is pending already
	bool notify();
	bool hasObservers() const { return !m_listeners.empty(); }

private:
	std::map<unsigned, TNotifier> m_listeners;
	unsigned m_nLastId = 0;
	bool m_bPending = false;

	void deliver();
};

}

#endif // AOBSERVABLE_H
