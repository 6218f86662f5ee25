#include "conserver.h"
#include "conn.h"
#include "sgcfg.h"
#include "sgres.h"
#include "sgstrop.h"
#include "sglogger.h"
#include "evabase.h"
#include "sgclock.h"
#include "aevutil.h"
#include "debug.h"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <map>
#include <set>
#include <vector>

using namespace std;

namespace sgate
{

// numeric host part of a peer address, empty on failure
static mstring FormatPeer(const sockaddr* sa, socklen_t len)
{
	char hbuf[NI_MAXHOST];
	if (getnameinfo(sa, len, hbuf, sizeof(hbuf), nullptr, 0, NI_NUMERICHOST))
		return mstring();
	return hbuf;
}

static bool IsResourceShortage(int err)
{
	return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

class conserverImpl : public conserver
{
	sgres& m_res;
	std::vector<unique_fdevent> m_listeners;
	std::map<IConnBase*, lint_ptr<IConnBase>> m_conns;
	// present while accepting is paused
	aobservable::subscription m_retryAccept;

	void onTerminated(IConnBase* p)
	{
		// the connection pins itself while reporting
		m_conns.erase(p);
	}

	void adopt(int fd, mstring peer)
	{
		USRDBG("Client connected: " << peer);
		auto conn = StartServing(unique_fd(fd), move(peer), m_res,
								 [pin = as_lptr(this)](IConnBase* p) { pin->onTerminated(p); });
		if (conn)
			m_conns.emplace(conn.get(), conn);
	}

	void pauseAccepting()
	{
		for (auto& ev : m_listeners)
			event_del(*ev);
		m_retryAccept = m_res.GetIdleCheckBeat().AddListener([this]()
		{
			bool ok = true;
			for (auto& ev : m_listeners)
				ok &= 0 == event_add(*ev, nullptr);
			if (ok)
			{
				log::misc("Accepting connections again");
				m_retryAccept.reset();
			}
		});
	}

	static void cbAccept(evutil_socket_t lfd, short, void* arg)
	{
		auto me = (conserverImpl*) arg;
		for (;;)
		{
			sockaddr_storage addr;
			socklen_t alen = sizeof(addr);
			int fd = accept(lfd, (sockaddr*) &addr, &alen);
			if (fd == -1)
			{
				if (IsResourceShortage(errno))
				{
					log::err("Cannot accept connections, pausing: "s + strerror(errno));
					me->pauseAccepting();
				}
				// EAGAIN or a client which is already gone
				return;
			}
			auto peer = FormatPeer((sockaddr*) &addr, alen);
			if (peer.empty())
			{
				log::err("Cannot format the address of an incoming client");
				justforceclose(fd);
				continue;
			}
			me->adopt(fd, move(peer));
		}
	}

	bool openListener(const addrinfo& ai)
	{
		unique_fd fd(socket(ai.ai_family, ai.ai_socktype, ai.ai_protocol));
		if (!fd.valid())
		{
			// no IPv6 on this host, not worth a complaint
			if (errno != EAFNOSUPPORT && errno != EPFNOSUPPORT && errno != EPROTONOSUPPORT)
				log::err("Cannot create listening socket: "s + strerror(errno));
			return false;
		}
		int on = 1;
#if defined(IPV6_V6ONLY)
		if (ai.ai_family == AF_INET6)
			setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on));
#endif
		setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

		auto where = FormatPeer(ai.ai_addr, ai.ai_addrlen) + " port " + ltos(cfg::port);
		if (::bind(fd.get(), ai.ai_addr, ai.ai_addrlen))
		{
			auto err = errno;
			log::err("Cannot bind "s + where + ": " + strerror(err));
			cerr << "Cannot bind " << where << ": " << strerror(err) << endl;
			if (err == EADDRINUSE)
				cerr << "Another instance might be running already." << endl;
			return false;
		}
		if (::listen(fd.get(), SOMAXCONN))
		{
			log::err("Cannot listen on "s + where + ": " + strerror(errno));
			return false;
		}
		evutil_make_socket_nonblocking(fd.get());
		evutil_make_socket_closeonexec(fd.get());
		unique_fdevent ev(event_new(evabase::base, fd.get(), EV_READ | EV_PERSIST, cbAccept, this));
		if (!ev.valid() || event_add(*ev, nullptr))
			return false;
		// the event owns the socket now
		fd.release();
		m_listeners.emplace_back(move(ev));
		log::misc("Listening on "s + where);
		return true;
	}

	void listenOn(LPCSTR host)
	{
		addrinfo hints {};
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		hints.ai_family = AF_UNSPEC;

		addrinfo* res = nullptr;
		auto sPort = ltos(cfg::port);
		if (auto rc = getaddrinfo(host, sPort.c_str(), &hints, &res))
		{
			log::err("Cannot resolve bind address "s + (host ? host : "<any>") + ": " + gai_strerror(rc));
			return;
		}
		set<mstring> seen;
		for (auto p = res; p; p = p->ai_next)
		{
			if (seen.emplace((const char*) p->ai_addr, p->ai_addrlen).second)
				openListener(*p);
		}
		freeaddrinfo(res);
	}

public:
	conserverImpl(sgres& res) : m_res(res) {}

	unsigned Setup() override
	{
		LOGSTARTFUNC;
		if (!cfg::port)
		{
			cerr << "No TCP port configured, cannot proceed." << endl;
			return 0;
		}
		bool any = true;
		for (auto host : tSplitWalk(cfg::bindaddr))
		{
			any = false;
			listenOn(mstring(host).c_str());
		}
		if (any)
			listenOn(nullptr);
		return m_listeners.size();
	}

	void Shutdown() override
	{
		m_retryAccept.reset();
		m_listeners.clear();
		// might be the last reference of some connections
		auto conns = move(m_conns);
		m_conns.clear();
	}

	size_t GetConnectionCount() override
	{
		return m_conns.size();
	}
};

lint_ptr<conserver> conserver::Create(sgres& res)
{
	return static_lptr_cast<conserver>(make_lptr<conserverImpl>(res));
}

}
