#include "evabase.h"
#include "aevutil.h"
#include "debug.h"

#include <deque>
#include <thread>

#ifdef HAVE_SD_NOTIFY
#include <systemd/sd-daemon.h>
#endif

using namespace std;

namespace sgate
{

event_base* evabase::base = nullptr;
static evabase* g_loopOwner = nullptr;

namespace
{
/**
 * Actions from Post, run by a zero timeout timer. New actions added while
 * the batch runs go to the next batch.
 */
struct tPostQueue
{
	unique_event wakeup;
	deque<tAction> incoming;
	thread::id owner;

	static void cbRun(evutil_socket_t, short, void* arg)
	{
		auto q = (tPostQueue*) arg;
		deque<tAction> batch;
		batch.swap(q->incoming);
		for (auto& act : batch)
			act();
	}
	void kick()
	{
		static const struct timeval asap { 0, 0 };
		evtimer_add(*wakeup, &asap);
	}
} g_posted;
}

evabase& evabase::GetGlobal()
{
	return *g_loopOwner;
}

evabase::evabase() : m_bStopping(false)
{
	base = event_base_new();
	if (!base)
		throw std::bad_alloc();
	g_posted.wakeup.reset(evtimer_new(base, tPostQueue::cbRun, &g_posted));
	if (!g_posted.wakeup.valid())
		throw std::bad_alloc();
	g_posted.owner = this_thread::get_id();
	g_loopOwner = this;
}

evabase::~evabase()
{
	g_posted.incoming.clear();
	g_posted.wakeup.reset();
	if (base)
	{
		event_base_free(base);
		base = nullptr;
	}
	if (g_loopOwner == this)
		g_loopOwner = nullptr;
}

int evabase::MainLoop()
{
	LOGSTARTFUNC;
#ifdef HAVE_SD_NOTIFY
	sd_notify(0, "READY=1");
#endif
	auto ret = event_base_loop(base, EVLOOP_NO_EXIT_ON_EMPTY);

	notify();
	drain();

#ifdef HAVE_SD_NOTIFY
	sd_notify(0, "STOPPING=1");
#endif
	return ret;
}

void evabase::SignalStop()
{
	if (g_loopOwner)
		g_loopOwner->m_bStopping = true;
	Post([]()
	{
		if (base)
			event_base_loopbreak(base);
	});
}

void evabase::Post(tAction&& act)
{
	if (!act)
		return;
	ASSERT(this_thread::get_id() == g_posted.owner);
	g_posted.incoming.emplace_back(move(act));
	g_posted.kick();
}

void evabase::drain()
{
	// a few rounds, the actions might post more
	for (int i = 0; i < 10; ++i)
	{
		if (0 != event_base_loop(base, EVLOOP_NONBLOCK))
			break;
	}
}

}
