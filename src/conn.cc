#include "debug.h"
#include "conn.h"
#include "sgcfg.h"
#include "sgres.h"
#include "dljob.h"
#include "header.h"
#include "evabase.h"
#include "sgstrop.h"

#include <deque>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

using namespace std;

namespace sgate
{

#ifdef DEBUG
int g_connId = 0;
#endif

class connImpl : public IConnBase
{
	bool m_bTerminated = false;
	bool m_bStopReading = false;
	bool m_bPokePending = false;

	sgres& m_res;
	unique_bufferevent_flushclosing m_be;
	mstring m_sClientHost;
	tConnReleaser m_onTerminated;

	header m_h;
	ssize_t m_hSize = 0;
	deque<dljob> m_jobs;
#ifdef DEBUG
	int m_connId = g_connId++;
#endif

public:

	connImpl(mstring&& clientName, sgres& res, tConnReleaser onTerminated) :
		m_res(res),
		m_sClientHost(move(clientName)),
		m_onTerminated(move(onTerminated))
	{
		LOGSTARTFUNCx(m_sClientHost);
	}

	virtual ~connImpl()
	{
		LOGSTARTFUNC;
		// jobs give their connections back, before the socket goes away
		m_jobs.clear();
	}

private:
	void requestShutdown()
	{
		if (m_bTerminated)
			return;
		m_bTerminated = true;
		// the client is gone or done, stop the downloads ASAP
		m_jobs.clear();
		if (m_onTerminated)
			m_onTerminated(this);
	};

public:

	void poke(uint_fast32_t jobId) override
	{
		LOGSTARTFUNCx(jobId);
		if (AC_UNLIKELY(m_bTerminated) || m_bPokePending)
			return;
		m_bPokePending = true;
		// the caller might be deep in its own processing, or just being destroyed by continueJobs
		evabase::Post([pin = as_lptr(this)]()
		{
			pin->m_bPokePending = false;
			if (!pin->m_bTerminated)
				pin->continueJobs();
		});
	}

	void spawn(unique_bufferevent_flushclosing&& pBE)
	{
		LOGSTARTFUNC;
		m_be.reset(pBE.release());
		int yes = 1;
		setsockopt(bufferevent_getfd(*m_be), IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
		bufferevent_setcb(*m_be, cbRead, cbCanWrite, cbStatus, this);
		// wake up when the client has taken a good part of the window
		bufferevent_setwatermark(*m_be, EV_WRITE, size_t(cfg::sendwindow) / 2, 0);
		bufferevent_enable(*m_be, EV_WRITE|EV_READ);
		setReadTimeout(true);
	}

	static void cbStatus(bufferevent*, short what, void* ctx)
	{
		if (what & (BEV_EVENT_EOF | BEV_EVENT_ERROR | BEV_EVENT_TIMEOUT))
		{
			auto me = as_lptr((connImpl*)ctx);
			LOG("client event " << what);
			if (!evabase::GetGlobal().IsShuttingDown() && me->m_be.get())
				be_free_close(me->m_be.release());
			return me->requestShutdown();
		}
	}
	static void cbRead(bufferevent* pBE, void* ctx)
	{
		auto me = as_lptr((connImpl*)ctx);
		me->onRead(pBE);
	}

	static void cbCanWrite(bufferevent*, void* ctx)
	{
		auto me = as_lptr((connImpl*)ctx);
		me->continueJobs();
	}

	/**
	 * @param errorStatus Optional - forced error status line to report as job result
	 */
	void addRequest(string_view errorStatus = svEmpty)
	{
		LOGSTARTFUNC;
		m_jobs.emplace_back(*this, m_res);
		if (!errorStatus.empty())
		{
			m_jobs.back().PrepareFatalError(errorStatus);
			// cannot find the start of the next request
			m_bStopReading = true;
		}
		else
			m_jobs.back().Prepare(m_h, m_sClientHost);

		if (m_jobs.size() == 1)
			setReadTimeout(false);

		if (m_hSize > 0)
			evbuffer_drain(bereceiver(*m_be), m_hSize);
	}

	void onRead(bufferevent* pBE)
	{
		auto ibuf = bereceiver(pBE);
		while (!m_bStopReading && !m_bTerminated)
		{
			m_hSize = m_h.Load(ibuf);
			if (m_hSize == 0)
			{
				if (evbuffer_get_length(ibuf) >= MAX_HEAD_SIZE)
					addRequest("431 Request Header Fields Too Large"sv);
				break; // more data to come in upcoming callback
			}
			addRequest(m_hSize < 0 ? "400 Bad Request"sv : svEmpty);
		}
		if (m_bStopReading)
			evbuffer_drain(ibuf, evbuffer_get_length(ibuf));
		continueJobs();
	}

	void continueJobs()
	{
		while (!m_jobs.empty() && m_be.valid())
		{
			auto jr = m_jobs.front().Resume(*m_be);
			switch (jr)
			{
			case dljob::eJobResult::R_DISCON:
			{
				DBGQLOG("Discon for " << m_jobs.front().GetId());
				m_jobs.clear();
				be_flush_free_close(m_be.release());
				return requestShutdown();
			}
			case dljob::eJobResult::R_DONE:
				m_jobs.pop_front();
				if (m_jobs.empty())
					setReadTimeout(true);
				continue;
			case dljob::eJobResult::R_WILLNOTIFY:
				return;
			}
		}
		if (m_jobs.empty() && m_bStopReading && m_be.valid())
		{
			be_flush_free_close(m_be.release());
			requestShutdown();
		}
	}

	void setReadTimeout(bool set)
	{
		bufferevent_set_timeouts(*m_be, set ? cfg::GetNetworkTimeout() : nullptr, cfg::GetNetworkTimeout());
	}

	cmstring &getClientName() override
	{
		return m_sClientHost;
	}
};

lint_ptr<IConnBase> StartServing(unique_fd&& fd, string clientName, sgres& res, tConnReleaser onTerminated)
{
	evutil_make_socket_nonblocking(fd.get());
	evutil_make_socket_closeonexec(fd.get());
	// fd ownership moves to bufferevent closer
	unique_bufferevent_flushclosing be(bufferevent_socket_new(evabase::base, fd.release(), BEV_OPT_DEFER_CALLBACKS));
	if (!be.valid())
		return lint_ptr<IConnBase>();

	try
	{
		auto session = make_lptr<connImpl>(move(clientName), res, move(onTerminated));
		session->spawn(move(be));
		return static_lptr_cast<IConnBase>(session);
	}
	catch (const std::bad_alloc&)
	{
		return lint_ptr<IConnBase>();
	}
}

}
