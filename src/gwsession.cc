#include "gwsession.h"
#include "sgres.h"
#include "sgcfg.h"
#include "sgstrop.h"
#include "ahttpurl.h"
#include "dnsbase.h"
#include "evabase.h"
#include "sg3rdparty.h"
#include "debug.h"

#include <map>
#include <deque>

#include <event2/http.h>
#include <event2/bufferevent_ssl.h>
#include <openssl/ssl.h>

using namespace std;

namespace sgate
{

tUpstreamStatus MapGatewayStatus(int httpCode, string_view retryAfter, string_view reason)
{
	switch (httpCode)
	{
	case 200:
	case 206:
		return tUpstreamStatus();
	case 0:
		return tUpstreamStatus(EUpstreamError::TRANSIENT, "gateway not reachable");
	case 400:
		return tUpstreamStatus(EUpstreamError::BAD_ALIGNMENT, mstring(reason));
	case 401:
	case 403:
		return tUpstreamStatus(EUpstreamError::UNAUTHORIZED, mstring(reason));
	case 404:
		return tUpstreamStatus(EUpstreamError::NOT_FOUND, mstring(reason));
	case 410:
		return tUpstreamStatus(EUpstreamError::STALE_REFERENCE, mstring(reason));
	case 420:
	case 429:
	{
		// a flood wait without a hint still needs some pause
		auto secs = atoofft(retryAfter, 1);
		return tUpstreamStatus(EUpstreamError::RATE_LIMITED, mstring(reason), secs > 0 ? int(secs) : 1);
	}
	default:
		return tUpstreamStatus(EUpstreamError::TRANSIENT, "HTTP " + ltos(httpCode) + " " + mstring(reason));
	}
}

static tUpstreamStatus EvalResponse(evhttp_request* req)
{
	if (!req)
		return MapGatewayStatus(0, svEmpty, svEmpty);
	auto ra = evhttp_find_header(evhttp_request_get_input_headers(req), "Retry-After");
	auto line = evhttp_request_get_response_code_line(req);
	return MapGatewayStatus(evhttp_request_get_response_code(req), ra ? ra : "", line ? line : "");
}

static string_view GetHeader(evhttp_request* req, LPCSTR name)
{
	auto p = evhttp_find_header(evhttp_request_get_input_headers(req), name);
	return p ? string_view(p) : string_view();
}

class gwSessionImpl : public IUpstreamSession
{
	sgres& m_res;
	mstring m_token;
	bool m_bPrimary;
	tHttpUrl m_url;
	mstring m_numericHost;
	evhttp_connection* m_conn = nullptr;
	bool m_bRecreatePending = false;

	enum class EState : uint8_t
	{
		IDLE, STARTING, CONNECTED, STOPPED
	} m_state = EState::IDLE;

	struct tPendingCall
	{
		gwSessionImpl* owner;
		unsigned id;
		evhttp_request* req;
		std::function<void(evhttp_request*)> handler;
	};
	map<unsigned, tPendingCall> m_calls;
	unsigned m_nLastCallId = 0;

public:
	gwSessionImpl(sgres& res, cmstring& token, bool isPrimary)
		: m_res(res), m_token(token), m_bPrimary(isPrimary)
	{
	}
	~gwSessionImpl()
	{
		dropCalls(false);
		if (m_conn)
			evhttp_connection_free(m_conn);
	}

	bool IsConnected() override
	{
		return m_state == EState::CONNECTED;
	}

	void Start(tStartResult cb) override
	{
		auto fail = [cb](tUpstreamStatus st)
		{
			evabase::Post([cb, st]() { cb(st, tSessionIdentity()); });
		};
		if (m_state == EState::CONNECTED || m_state == EState::STARTING)
			return fail(tUpstreamStatus(EUpstreamError::TRANSIENT, "session already started"));
		if (!m_url.SetHttpUrl(cfg::gatewayurl, true))
			return fail(tUpstreamStatus(EUpstreamError::TRANSIENT, "bad gateway URL: " + cfg::gatewayurl));
		if (m_url.IsTls() && !m_res.GetSslConfig().GetContext())
			return fail(tUpstreamStatus(EUpstreamError::TRANSIENT, "TLS setup failed: " + m_res.GetSslConfig().GetContextError()));
		auto dns = m_res.GetDnsBase();
		if (!dns)
			return fail(tUpstreamStatus(EUpstreamError::TRANSIENT, "name resolution is not available"));

		m_state = EState::STARTING;
		dns->Resolve(m_url.sHost, ltos(m_url.GetPort()),
					 [pin = as_lptr(this), cb](mstring error, tStrVec hosts)
		{
			if (pin->m_state != EState::STARTING)
				return cb(tUpstreamStatus(EUpstreamError::TRANSIENT, "session stopped"), tSessionIdentity());
			if (!error.empty())
			{
				pin->m_state = EState::IDLE;
				return cb(tUpstreamStatus(EUpstreamError::TRANSIENT, error), tSessionIdentity());
			}
			pin->m_numericHost = hosts.front();
			pin->createConnection();
			pin->fetchIdentity(move(cb));
		});
	}

	void Stop(tAction done) override
	{
		m_state = EState::STOPPED;
		dropCalls(true);
		if (m_conn)
		{
			auto conn = m_conn;
			m_conn = nullptr;
			evabase::Post([conn]() { evhttp_connection_free(conn); });
		}
		evabase::Post(move(done));
	}

	TFinalAction Lookup(int64_t messageId, tLookupResult cb) override
	{
		auto path = m_url.sPath;
		if (!endsWith(path, "/"))
			path += '/';
		path += "v1/channels/" + ltos(cfg::channelId) + "/messages/" + ltos(messageId);

		return call(path, {}, [this, messageId, cb](evhttp_request* req)
		{
			auto st = evalChecked(req);
			tRemoteFile rf;
			rf.messageId = messageId;
			if (!st.ok())
				return cb(st, rf);

			int64_t n;
			if (!ParseInt64(GetHeader(req, "X-Media-Id"), rf.mediaId))
				return cb(tUpstreamStatus(EUpstreamError::NOT_FOUND, "message carries no file"), rf);
			if (!ParseInt64(GetHeader(req, "X-Access-Hash"), rf.accessHash)
					|| !ParseInt64(GetHeader(req, "X-Dc-Id"), n)
					|| (rf.dcId = int(n), !ParseInt64(GetHeader(req, "X-File-Size"), n))
					|| n < 0)
			{
				return cb(tUpstreamStatus(EUpstreamError::TRANSIENT, "incomplete file attributes from gateway"), rf);
			}
			rf.size = n;
			rf.fileReference = GetHeader(req, "X-File-Reference");
			rf.thumbSize = GetHeader(req, "X-Thumb-Size");
			rf.mimeType = GetHeader(req, "X-Mime-Type");
			rf.fileName = GetHeader(req, "X-File-Name");
			if (ParseInt64(GetHeader(req, "X-Message-Date"), n))
				rf.created = time_t(n);
			cb(st, rf);
		});
	}

	TFinalAction ReadChunk(const tRemoteFile& rf, off_t offset, unsigned limit, tReadResult cb) override
	{
		auto path = m_url.sPath;
		if (!endsWith(path, "/"))
			path += '/';
		path += "v1/files/" + ltos(rf.dcId) + "/" + ltos(rf.mediaId)
				+ "?offset=" + ltos(offset) + "&limit=" + ltos(limit);
		if (!rf.thumbSize.empty())
			path += "&thumb=" + rf.thumbSize;

		return call(path, { { "X-Access-Hash", ltos(rf.accessHash) },
							{ "X-File-Reference", rf.fileReference } },
					[this, cb](evhttp_request* req)
		{
			auto st = evalChecked(req);
			cb(st, st.ok() ? evhttp_request_get_input_buffer(req) : nullptr);
		});
	}

private:

	tUpstreamStatus evalChecked(evhttp_request* req)
	{
		auto st = EvalResponse(req);
		if (st.code == EUpstreamError::UNAUTHORIZED && m_state == EState::CONNECTED)
		{
			log::err("Gateway rejected the credentials of "s + (m_bPrimary ? "primary" : "worker")
					 + " session, excluding it"s);
			m_state = EState::IDLE;
		}
		return st;
	}

	void fetchIdentity(tStartResult cb)
	{
		auto path = m_url.sPath;
		if (!endsWith(path, "/"))
			path += '/';
		path += "v1/me";

		// the handle is dropped, a stopped session reports the failure anyway
		call(path, {}, [this, cb](evhttp_request* req)
		{
			tSessionIdentity ident;
			auto st = EvalResponse(req);
			if (st.ok() && !ParseInt64(GetHeader(req, "X-Bot-Id"), ident.id))
				st = tUpstreamStatus(EUpstreamError::TRANSIENT, "gateway did not report the session identity");
			if (!st.ok())
			{
				if (m_state == EState::STARTING)
					m_state = EState::IDLE;
				return cb(st, ident);
			}
			ident.name = GetHeader(req, "X-Bot-Name");
			m_state = EState::CONNECTED;
			cb(st, ident);
		}).release();
	}

	static void cbCallDone(evhttp_request* req, void* arg)
	{
		auto call = (tPendingCall*) arg;
		auto owner = call->owner;
		// keep the session alive until the stack is unwound
		auto pin = as_lptr(owner);
		evabase::Post([pin]() {});
		auto handler = move(call->handler);
		owner->m_calls.erase(call->id);
		if (handler)
			handler(req);
		owner->checkRecreate();
	}

	static void cbConnClosed(evhttp_connection*, void* arg)
	{
		auto me = (gwSessionImpl*) arg;
		// a TLS bufferevent cannot be reconnected, build a new one when idle
		if (me->m_url.IsTls())
		{
			me->m_bRecreatePending = true;
			evabase::Post([pin = as_lptr(me)]() { pin->checkRecreate(); });
		}
	}

	void checkRecreate()
	{
		if (!m_bRecreatePending || !m_calls.empty() || !m_conn)
			return;
		m_bRecreatePending = false;
		auto old = m_conn;
		m_conn = nullptr;
		evabase::Post([old]() { evhttp_connection_free(old); });
		createConnection();
	}

	void createConnection()
	{
		bufferevent* bev = nullptr;
		if (m_url.IsTls())
		{
			auto ssl = SSL_new(m_res.GetSslConfig().GetContext());
			if (!ssl)
				throw std::bad_alloc();
			SSL_set_tlsext_host_name(ssl, m_url.sHost.c_str());
			SSL_set1_host(ssl, m_url.sHost.c_str());
			bev = bufferevent_openssl_socket_new(evabase::base, -1, ssl, BUFFEREVENT_SSL_CONNECTING,
												 BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
			if (!bev)
			{
				SSL_free(ssl);
				throw std::bad_alloc();
			}
			bufferevent_openssl_set_allow_dirty_shutdown(bev, 1);
		}
		m_conn = evhttp_connection_base_bufferevent_new(evabase::base, nullptr, bev,
														m_numericHost.c_str(), m_url.GetPort());
		if (!m_conn)
			throw std::bad_alloc();
		evhttp_connection_set_timeout(m_conn, cfg::nettimeout);
		evhttp_connection_set_retries(m_conn, 1);
		evhttp_connection_set_max_body_size(m_conn, cfg::chunksize + 4096);
		evhttp_connection_set_closecb(m_conn, cbConnClosed, this);
	}

	/**
	 * Fails all pending calls. When reporting, the handlers are called from the event loop.
	 */
	void dropCalls(bool report)
	{
		deque<std::function<void(evhttp_request*)>> handlers;
		for (auto& it : m_calls)
		{
			if (it.second.req)
				evhttp_cancel_request(it.second.req);
			if (report && it.second.handler)
				handlers.emplace_back(move(it.second.handler));
		}
		m_calls.clear();
		for (auto& h : handlers)
			evabase::Post([h]() { h(nullptr); });
	}

	TFinalAction call(cmstring& path, std::initializer_list<std::pair<LPCSTR, mstring>> headers,
					  std::function<void(evhttp_request*)> handler)
	{
		auto id = ++m_nLastCallId;
		auto& call = m_calls[id];
		call.owner = this;
		call.id = id;
		call.req = nullptr;
		call.handler = move(handler);

		auto cancel = TFinalAction([pin = as_lptr(this), id]()
		{
			auto it = pin->m_calls.find(id);
			if (it == pin->m_calls.end())
				return;
			if (it->second.req)
				evhttp_cancel_request(it->second.req);
			pin->m_calls.erase(it);
			pin->checkRecreate();
		});

		auto failLater = [this, id]()
		{
			evabase::Post([pin = as_lptr(this), id]()
			{
				auto it = pin->m_calls.find(id);
				if (it == pin->m_calls.end())
					return;
				auto h = move(it->second.handler);
				pin->m_calls.erase(it);
				if (h)
					h(nullptr);
			});
		};

		if (!m_conn || m_state == EState::STOPPED)
		{
			failLater();
			return cancel;
		}

		auto req = evhttp_request_new(cbCallDone, &call);
		if (!req)
			throw std::bad_alloc();
		auto hdrs = evhttp_request_get_output_headers(req);
		evhttp_add_header(hdrs, "Host", m_url.sHost.c_str());
		evhttp_add_header(hdrs, "User-Agent", cfg::agentname.c_str());
		evhttp_add_header(hdrs, "Authorization", ("Bot " + m_token).c_str());
		for (const auto& h : headers)
			evhttp_add_header(hdrs, h.first, h.second.c_str());

		if (0 != evhttp_make_request(m_conn, req, EVHTTP_REQ_GET, path.c_str()))
		{
			LOG("evhttp_make_request failed for " << path);
			failLater();
			return cancel;
		}
		call.req = req;
		return cancel;
	}
};

lint_ptr<IUpstreamSession> MakeGatewaySession(sgres& res, cmstring& token, bool isPrimary)
{
	return static_lptr_cast<IUpstreamSession>(make_lptr<gwSessionImpl>(res, token, isPrimary));
}

}
