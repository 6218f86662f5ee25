#include "sgclock.h"
#include "aevutil.h"
#include "evabase.h"
#include "debug.h"

namespace sgate
{

class tBeatNotifierImpl : public tBeatNotifier
{
	struct timeval m_interval;
	unique_event m_timer;
	bool m_bRunning = false;
	lint_ptr<aobservable> m_listeners;

	static void cbBeat(evutil_socket_t, short, void* arg)
	{
		auto me = (tBeatNotifierImpl*) arg;
		me->m_bRunning = false;
		// goes to sleep when the last listener is gone
		if (!me->m_listeners->hasObservers())
			return;
		me->m_listeners->notify();
		me->start();
	}

	void start()
	{
		if (m_bRunning || !m_timer.valid())
			return;
		m_bRunning = 0 == evtimer_add(*m_timer, &m_interval);
	}

public:
	tBeatNotifierImpl(const struct timeval& interval) :
		m_interval(interval),
		m_timer(evtimer_new(evabase::base, cbBeat, this)),
		m_listeners(make_lptr<aobservable>())
	{
		if (!m_timer.valid())
			throw std::bad_alloc();
	}

	aobservable::subscription AddListener(const tAction& act) override
	{
		auto ret = m_listeners->subscribe(act);
		start();
		return ret;
	}
};

std::unique_ptr<tBeatNotifier> tBeatNotifier::Create(const struct timeval& interval)
{
	return std::unique_ptr<tBeatNotifier>(new tBeatNotifierImpl(interval));
}

}
