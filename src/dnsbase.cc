#include "dnsbase.h"
#include "evabase.h"
#include "debug.h"

#include <ares.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>

using namespace std;

namespace sgate
{

const struct timeval timeout_sync_asap{0,0};

// descriptor of a running DNS lookup, passed around with c-ares callbacks
struct tDnsResContext
{
	mstring sHost;
	CDnsBase::tResultCb cb;
};

unique_ptr<CDnsBase> CDnsBase::Create()
{
	ares_channel newDnsBase;
	switch(ares_init(&newDnsBase))
	{
	case ARES_SUCCESS:
		return unique_ptr<CDnsBase>(new CDnsBase(newDnsBase));
	case ARES_EFILE:
		log::err("DNS system error, cannot read config file"sv);
		break;
	case ARES_ENOMEM:
		log::err("DNS system error, out of memory"sv);
		break;
	case ARES_ENOTINITIALIZED:
		log::err("DNS system error, faulty initialization sequence"sv);
		break;
	default:
		log::err("DNS system error, internal error"sv);
		break;
	}
	return unique_ptr<CDnsBase>();
}

CDnsBase::~CDnsBase()
{
	shutdown();
}

static void cb_sync_ares(evutil_socket_t, short, void* arg)
{
	// who knows what it has done with its FDs, simply recreating them all
	auto p=(CDnsBase*) arg;
	p->dropEvents();
	p->setupEvents();
}

static void cb_ares_action(evutil_socket_t fd, short what, void* arg)
{
	auto p=(CDnsBase*) arg;
	if (what&EV_TIMEOUT)
		ares_process_fd(p->get(), ARES_SOCKET_BAD, ARES_SOCKET_BAD);
	else
	{
		auto toread = (what&EV_READ) ? fd : ARES_SOCKET_BAD;
		auto towrite = (what&EV_WRITE) ? fd : ARES_SOCKET_BAD;
		ares_process_fd(p->get(), toread, towrite);
	}
	p->sync();
}

void CDnsBase::sync()
{
	if (!m_aresSyncEvent)
		m_aresSyncEvent = evtimer_new(evabase::base, cb_sync_ares, this);
	event_add(m_aresSyncEvent, &timeout_sync_asap);
}

void CDnsBase::dropEvents()
{
	for (auto& el: m_aresEvents)
	{
		if (el)
			event_free(el);
	}
	m_aresEvents.clear();
}

void CDnsBase::setupEvents()
{
	if (!m_channel)
		return;
	ares_socket_t socks[ARES_GETSOCK_MAXNUM];
	auto bitfield = ares_getsock(m_channel, socks, _countof(socks));
	struct timeval tvbuf;
	auto tmout = ares_timeout(m_channel, nullptr, &tvbuf);
	for(unsigned i = 0; i < ARES_GETSOCK_MAXNUM; ++i)
	{
		short what(0);
		if (ARES_GETSOCK_READABLE(bitfield, i))
			what = EV_READ;
		else if (ARES_GETSOCK_WRITABLE(bitfield, i))
			what = EV_WRITE;
		else
			continue;
		m_aresEvents.emplace_back(event_new(evabase::base, socks[i], what, cb_ares_action, this));
		event_add(m_aresEvents.back(), tmout);
	}
	// nothing to watch but still something to time out?
	if (m_aresEvents.empty() && tmout)
	{
		m_aresEvents.emplace_back(evtimer_new(evabase::base, cb_ares_action, this));
		event_add(m_aresEvents.back(), tmout);
	}
}

void CDnsBase::shutdown()
{
	if (m_channel)
	{
		// pending requests are reported as ARES_EDESTRUCTION here
		ares_destroy(m_channel);
	}
	dropEvents();
	if (m_aresSyncEvent)
		event_free(m_aresSyncEvent), m_aresSyncEvent = nullptr;

	m_channel = nullptr;
}

void CDnsBase::cb_dns(void *arg, int status, int, ares_addrinfo *results)
{
	// take ownership
	unique_ptr<tDnsResContext> args((tDnsResContext*)arg);
	TFinalAction cleaner([results]() { if (results) ares_freeaddrinfo(results); });

	if (status != ARES_SUCCESS || !results)
	{
		auto msg = ares_strerror(status);
		return args->cb(mstring("DNS error for ") + args->sHost + ": " + (msg ? msg : "unknown"), tStrVec());
	}
	tStrVec hosts;
	for (auto p = results->nodes; p; p = p->ai_next)
	{
		char buf[NI_MAXHOST];
		if (getnameinfo(p->ai_addr, p->ai_addrlen, buf, sizeof(buf), nullptr, 0, NI_NUMERICHOST))
			continue;
		DBGQLOG("Resolved: " << buf);
		hosts.emplace_back(buf);
	}
	if (hosts.empty())
		return args->cb(mstring("No usable address for ") + args->sHost, tStrVec());
	args->cb(mstring(), move(hosts));
}

void CDnsBase::Resolve(cmstring &host, cmstring &port, tResultCb cb)
{
	if (!m_channel)
		return cb("DNS resolver is not available", tStrVec());

	auto ctx = new tDnsResContext { host, move(cb) };
	ares_addrinfo_hints hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = ARES_AI_NUMERICSERV;
	ares_getaddrinfo(m_channel, host.c_str(), port.c_str(), &hints, cb_dns, ctx);
	sync();
}

}
