#include "dljob.h"
#include "conn.h"
#include "header.h"
#include "sgres.h"
#include "sgcfg.h"
#include "sglogger.h"
#include "connpool.h"
#include "metacache.h"
#include "allocator.h"
#include "admission.h"
#include "chunkfetch.h"
#include "linkcodec.h"
#include "httpdate.h"
#include "evabase.h"

#include <algorithm>
#include <atomic>

using namespace std;

namespace sgate
{

uint_fast32_t g_genJobId = 0;
static unsigned long g_nTaskSeq = 0;

tRetryBudget tRetryBudget::FromConfig()
{
	tRetryBudget ret;
	// the first lookup is not a retry
	ret.metadata = cfg::maxmetaretries > 0 ? cfg::maxmetaretries - 1 : 0;
	ret.stream = cfg::maxstreamretries;
	ret.failover = cfg::maxfailovers;
	return ret;
}

dljob::dljob(IConnBase& parent, sgres& res) :
		m_parent(parent),
		m_res(res),
		m_body(evbuffer_new()),
		m_budget(tRetryBudget::FromConfig()),
		m_retryTimer(evtimer_new(evabase::base, cbRetry, this)),
		m_deadline(evtimer_new(evabase::base, cbDeadline, this))
{
	if (!m_body.valid() || !m_retryTimer.valid() || !m_deadline.valid())
		throw std::bad_alloc();
}

dljob::~dljob()
{
	LOGSTARTFUNC;
	m_pending.reset();
	m_fetcher.reset();
	m_release.reset();
	if (m_taskId.empty())
		return;
	// partial deliveries count as well
	m_res.GetAdmission().GetBandwidth().Add(m_nBodySent);
	log::transfer(m_nBodySent, m_sClient, m_sPath, m_taskId, m_state != EState::COMPLETED);
}

inline ebstream dljob::GetBufFmter()
{
	if (!m_preHeadBuf.valid())
		m_preHeadBuf.reset(evbuffer_new());
	if (!m_preHeadBuf.valid())
		throw std::bad_alloc();
	return ebstream(*m_preHeadBuf);
}

void dljob::PrepareFatalError(string_view errorStatus)
{
	SetEarlySimpleResponse(errorStatus, true);
	m_keepAlive = CLOSE;
}

void dljob::Prepare(const header &h, cmstring& clientIp)
{
	LOGSTARTFUNC;
	m_sClient = clientIp;
	m_sPath = h.getRequestUrl();
	m_bIsHttp11 = h.proto == header::HTTP_11;

	if (h.h[header::CONNECTION])
	{
		if (scaseequals(h.h[header::CONNECTION], "close"))
			m_keepAlive = CLOSE;
		else if (scaseequals(h.h[header::CONNECTION], "keep-alive"))
			m_keepAlive = KEEP;
	}
	else if (!m_bIsHttp11)
		m_keepAlive = CLOSE;

	string_view path(m_sPath);
	auto qpos = path.find_first_of("?#");
	if (qpos != stmiss)
		path = path.substr(0, qpos);

	if (h.type == header::OPTIONS)
	{
		m_activity = STATE_SEND_BUF_NOT_FITEM;
		auto SB = GetBufFmter();
		PrependHttpVariant();
		SB << "200 OK\r\n"
			  "Access-Control-Allow-Headers: Range, Content-Type\r\n"
			  "Access-Control-Max-Age: 86400\r\n"
			  "Content-Length: 0\r\n"sv;
		return AppendMetaHeaders();
	}
	if (h.type != header::GET && h.type != header::HEAD)
	{
		m_extraHeaders = "Allow: GET, HEAD, OPTIONS\r\n";
		return SetEarlySimpleResponse("405 Method Not Allowed"sv);
	}
	m_bIsHeadOnly = h.type == header::HEAD;

	constexpr auto dlPrefix = "/dl/"sv;
	if (startsWith(path, dlPrefix))
		return prepareDownload(path.substr(dlPrefix.size()), h);
	if (path == "/api/info"sv)
		return prepareInfo();
	SetEarlySimpleResponse("404 Not Found"sv);
}

void dljob::prepareDownload(string_view encodedId, const header& h)
{
	m_state = EState::VALIDATING;
	if (!DecodeLinkId(encodedId, GetLinkKey(cfg::channelId), m_messageId))
	{
		log::err("Malformed download link: "s + mstring(encodedId.substr(0, 50)), m_sClient);
		m_state = EState::FAILED;
		return SetEarlySimpleResponse("400 Invalid or malformed download link"sv);
	}

	auto& adm = m_res.GetAdmission();
	switch (adm.Check(m_sClient))
	{
	case admission::EVerdict::OK:
		break;
	case admission::EVerdict::RATE_LIMITED:
		m_state = EState::FAILED;
		m_extraHeaders = "Retry-After: " + ltos(adm.GetRateLimiter().GetWindow()) + "\r\n";
		return SetEarlySimpleResponse("429 Too many download requests, please wait"sv);
	case admission::EVerdict::BANDWIDTH_EXCEEDED:
		m_state = EState::FAILED;
		return SetEarlySimpleResponse("503 Monthly bandwidth limit reached"sv);
	}

	if (h.h[header::RANGE])
	{
		m_bHaveRange = true;
		m_rangeSpec = h.h[header::RANGE];
	}
	m_taskId = "dl-" + ltos(m_messageId) + "-" + ltos(++g_nTaskSeq);
	USRDBG(m_taskId << ": download request from " << m_sClient << (m_bHaveRange ? ", range " + m_rangeSpec : ""s));
	m_state = EState::RESOLVING;
	startResolve(true);
}

void dljob::prepareInfo()
{
	auto& pool = m_res.GetPool();
	auto primary = pool.GetPrimary();
	bool ok = primary && primary->IsLive();
	auto st = m_res.GetAllocator().GetStats();
	auto& bw = m_res.GetAdmission().GetBandwidth();
	auto month = bw.GetMonthKey();

	mstring body = "{\"status\":\""s + (ok ? "ok" : "error") + "\",\"version\":\"" SGATE_VERSION "\"";
	if (primary)
	{
		body += ",\"primary\":{\"id\":" + ltos(primary->id) + ",\"name\":\"" + JsonEscape(primary->name) + "\"}";
	}
	body += ",\"connections\":{\"total\":" + ltos(pool.size()) + ",\"live\":" + ltos(st.live)
			+ ",\"small_preferred\":" + ltos(st.smallGroup) + ",\"large_preferred\":" + ltos(st.largeGroup)
			+ ",\"idle\":" + ltos(st.idle) + ",\"busy\":" + ltos(st.busy)
			+ ",\"rate_limited\":" + ltos(st.rateLimited) + "}"
			+ ",\"link_expiry_seconds\":" + ltos(cfg::linkexpiry)
			+ ",\"bandwidth\":{\"month\":\"" + month + "\",\"bytes_used\":" + ltos(bw.GetMonthUsage(month))
			+ ",\"limit_bytes\":" + ltos(cfg::GetBandwidthLimit()) + "}}";

	m_activity = STATE_SEND_BUF_NOT_FITEM;
	auto SB = GetBufFmter();
	PrependHttpVariant();
	SB << (ok ? "200 OK\r\n"sv : "503 Service Unavailable\r\n"sv)
	   << "Content-Type: application/json\r\nContent-Length: "sv << body.size() << svRN;
	AppendMetaHeaders();
	if (!m_bIsHeadOnly)
		SB << body;
}

void dljob::track(TFinalAction&& h)
{
	// a cache hit reports before returning, the result processing might have started the next step already
	if (h)
		m_pending = move(h);
}

void dljob::notifyParent()
{
	m_parent.poke(GetId());
}

void dljob::startResolve(bool preferPrimary)
{
	auto& pool = m_res.GetPool();
	tConnPtr probe;
	if (preferPrimary)
	{
		probe = pool.GetPrimary();
		if (probe && !probe->IsLive())
			probe.reset();
	}
	if (!probe && m_probeId)
		probe = pool.SelectAlternative(m_probeId);
	if (!probe)
	{
		try
		{
			probe = pool.SelectForStreaming();
		}
		catch (const tNoConnectionsAvailable&)
		{
			return fail("503 Download service temporarily unavailable"sv);
		}
	}
	m_probeId = probe->id;
	track(probe->cache->Resolve(m_messageId, [this](const tUpstreamStatus& st, const tRemoteFile& rf)
	{
		onResolved(st, rf);
	}));
}

void dljob::onResolved(const tUpstreamStatus& st, const tRemoteFile& rf)
{
	m_pending.release();
	if (st.ok())
	{
		if (IsLinkExpired(rf.created, cfg::linkexpiry, GetTime()))
		{
			log::err(m_taskId + ": link has expired", m_sClient);
			return fail("410 " + (cfg::expiredtext.empty() ? "This download link has expired"s : cfg::expiredtext));
		}
		m_file = rf;
		switch (ParseRange(m_bHaveRange ? m_rangeSpec.c_str() : nullptr, rf.size, m_range))
		{
		case ERangeResult::UNSATISFIABLE:
			m_extraHeaders = "Content-Range: bytes */" + ltos(rf.size) + "\r\n";
			return fail("416 Requested Range Not Satisfiable"sv);
		case ERangeResult::PARTIAL:
			m_bPartial = true;
			break;
		case ERangeResult::FULL:
			break;
		}
		if (m_bIsHeadOnly || rf.size == 0)
		{
			// nothing to fetch
			CookResponseHeader();
			m_activity = STATE_SEND_BUF_NOT_FITEM;
			m_state = EState::COMPLETED;
			return notifyParent();
		}
		return startAllocation();
	}

	auto& pool = m_res.GetPool();
	switch (st.code)
	{
	case EUpstreamError::NOT_FOUND:
		return fail("404 File link is invalid or the file has been deleted"sv);
	case EUpstreamError::RATE_LIMITED:
	{
		if (!tRetryBudget::Take(m_budget.metadata))
		{
			m_extraHeaders = "Retry-After: " + ltos(max(st.retryAfter, 1)) + "\r\n";
			return fail("503 Upstream is rate-limited, please try again later"sv);
		}
		// another session is the better choice than waiting
		if (pool.SelectAlternative(m_probeId))
			return startResolve(false);
		auto secs = min(max(st.retryAfter, 1), cfg::maxfloodwait);
		return schedule(secs * 1000, [this]() { startResolve(true); });
	}
	case EUpstreamError::STALE_REFERENCE:
		if (auto probe = pool.Lookup(m_probeId))
			probe->cache->Forget(m_messageId);
		__just_fall_through;
	default:
	{
		if (!tRetryBudget::Take(m_budget.metadata))
			return fail("503 Temporary issue communicating with the upstream, please try again later"sv);
		unsigned attempt = max(cfg::maxmetaretries - 1, 1) - m_budget.metadata;
		return schedule(cfg::retrybackoffms * attempt, [this]() { startResolve(false); });
	}
	}
}

void dljob::startAllocation()
{
	m_state = EState::ALLOCATING;
	armDeadline(cfg::acquiretimeout, false);
	auto& alloc = m_res.GetAllocator();
	try
	{
		m_connId = alloc.Acquire(m_file.size, m_taskId);
	}
	catch (const tNoConnectionsAvailable&)
	{
		return fail("503 All download connections are busy, please try again later"sv);
	}
	m_release = TFinalAction([&alloc, id = m_connId, task = m_taskId]()
	{
		alloc.Release(id, task);
	});
	bindConnection();
}

/**
 * Replaces the connection of a running stream. The state and the stream deadline stay as they are.
 */
void dljob::reacquire()
{
	m_release.reset();
	m_connId = 0;
	auto& alloc = m_res.GetAllocator();
	try
	{
		m_connId = alloc.Acquire(m_file.size, m_taskId);
	}
	catch (const tNoConnectionsAvailable&)
	{
		return fail("503 All download connections are busy, please try again later"sv);
	}
	m_release = TFinalAction([&alloc, id = m_connId, task = m_taskId]()
	{
		alloc.Release(id, task);
	});
	bindConnection();
}

void dljob::bindConnection()
{
	if (m_fetcher)
		m_bRebinding = true;
	auto conn = m_res.GetPool().Lookup(m_connId);
	if (!conn || !conn->IsLive())
	{
		log::err(m_taskId + ": connection " + ltos(m_connId) + " is gone");
		return handleTransient(tUpstreamStatus(EUpstreamError::TRANSIENT, "connection gone"), [this]()
		{
			if (m_fetcher)
				return reacquire();
			m_release.reset();
			m_connId = 0;
			startAllocation();
		});
	}
	track(conn->cache->Resolve(m_messageId, [this](const tUpstreamStatus& st, const tRemoteFile& rf)
	{
		onBound(st, rf);
	}));
}

void dljob::onBound(const tUpstreamStatus& st, const tRemoteFile& rf)
{
	m_pending.release();
	if (!st.ok())
	{
		switch (st.code)
		{
		case EUpstreamError::NOT_FOUND:
			return fail("404 File link is invalid or the file has been deleted"sv);
		case EUpstreamError::RATE_LIMITED:
			return handleRateLimit(st);
		case EUpstreamError::STALE_REFERENCE:
			if (auto conn = m_res.GetPool().Lookup(m_connId))
				conn->cache->Forget(m_messageId);
			if (!m_budget.staleReresolved)
			{
				m_budget.staleReresolved = true;
				return bindConnection();
			}
			__just_fall_through;
		default:
			return handleTransient(st, [this]() { bindConnection(); });
		}
	}
	if (rf.size != m_file.size)
	{
		log::err(m_taskId + ": file size changed from " + ltos(m_file.size) + " to " + ltos(rf.size));
		return fail("503 File changed while being served"sv);
	}
	auto conn = m_res.GetPool().Lookup(m_connId);
	if (!conn)
		return handleTransient(tUpstreamStatus(EUpstreamError::TRANSIENT, "connection gone"), [this]() { bindConnection(); });
	m_file = rf;

	if (m_fetcher)
	{
		USRDBG(m_taskId << ": continuing at " << m_fetcher->GetNextOffset() << " on " << conn->GetLabel());
		m_fetcher->Rebind(conn->session, rf);
		m_bFetching = false;
		m_bRebinding = false;
	}
	else
	{
		m_fetcher.reset(new chunkfetcher(conn->session, rf, m_range.from, m_range.until, cfg::chunksize,
										 !m_bPartial));
		CookResponseHeader();
		m_state = EState::STREAMING;
		m_activity = STATE_SEND_DATA;
		armDeadline(cfg::streamtimeout, true);
		USRDBG(m_taskId << ": streaming " << m_range.from << "-" << m_range.until << " via " << conn->GetLabel());
	}
	requestNext();
	notifyParent();
}

void dljob::requestNext()
{
	if (m_bFetching || m_bRebinding || m_bUpstreamEnd || !m_fetcher || m_state != EState::STREAMING)
		return;
	if (m_retryAction)
		return;
	if (m_fetcher->AtEnd())
	{
		m_bUpstreamEnd = true;
		return notifyParent();
	}
	m_bFetching = true;
	m_fetcher->Next([this](const tUpstreamStatus& st, evbuffer* slice)
	{
		onSlice(st, slice);
	});
}

void dljob::onSlice(const tUpstreamStatus& st, evbuffer* slice)
{
	m_bFetching = false;
	if (st.ok())
	{
		if (!slice || !evbuffer_get_length(slice))
			m_bUpstreamEnd = true;
		else if (evbuffer_add_buffer(*m_body, slice))
			return fail("500 Out of memory"sv);
		else if (m_fetcher->AtEnd())
			m_bUpstreamEnd = true;
		return notifyParent();
	}

	log::err(m_taskId + ": read failed at offset " + ltos(m_fetcher->GetNextOffset()) + " after "
			 + ltos(m_fetcher->GetYielded()) + " bytes: " + st.ToString());
	switch (st.code)
	{
	case EUpstreamError::RATE_LIMITED:
		return handleRateLimit(st);
	case EUpstreamError::STALE_REFERENCE:
		if (!m_budget.staleReresolved)
		{
			m_budget.staleReresolved = true;
			auto conn = m_res.GetPool().Lookup(m_connId);
			if (conn)
				conn->cache->Forget(m_messageId);
			return bindConnection();
		}
		return handleTransient(st, [this]() { requestNext(); });
	case EUpstreamError::BAD_ALIGNMENT:
		return fail("500 Upstream rejected the read offset"sv);
	case EUpstreamError::NOT_FOUND:
		return fail("404 File link is invalid or the file has been deleted"sv);
	default:
		return handleTransient(st, [this]() { requestNext(); });
	}
}

void dljob::handleRateLimit(const tUpstreamStatus& st)
{
	if (!tRetryBudget::Take(m_budget.failover))
	{
		m_extraHeaders = "Retry-After: " + ltos(max(st.retryAfter, 1)) + "\r\n";
		return fail("503 Upstream is rate-limited, please try again later"sv);
	}
	auto& alloc = m_res.GetAllocator();
	auto alt = alloc.OnRateLimited(m_connId, st.retryAfter, m_file.size, m_taskId);
	// the limited connection keeps its flood wait, releasing it would make it idle
	m_release.release();
	m_connId = 0;
	if (m_fetcher)
		m_bRebinding = true;
	if (alt)
	{
		m_connId = *alt;
		m_release = TFinalAction([&alloc, id = m_connId, task = m_taskId]()
		{
			alloc.Release(id, task);
		});
		return bindConnection();
	}
	auto secs = min(max(st.retryAfter, 1), cfg::maxfloodwait);
	log::err(m_taskId + ": no replacement connection, waiting " + ltos(secs) + "s");
	schedule(secs * 1000, [this]() { reacquire(); });
}

void dljob::handleTransient(const tUpstreamStatus& st, tAction retry)
{
	if (!tRetryBudget::Take(m_budget.stream))
	{
		log::err(m_taskId + ": giving up after " + ltos(cfg::maxstreamretries) + " retries, "
				 + ltos(m_nBodySent) + " bytes sent: " + st.ToString());
		return fail("503 Upstream not reachable, please try again later"sv);
	}
	unsigned attempt = unsigned(cfg::maxstreamretries) - m_budget.stream;
	schedule(cfg::retrybackoffms * attempt, move(retry));
}

void dljob::schedule(unsigned msecs, tAction act)
{
	m_retryAction = move(act);
	struct timeval tv { time_t(msecs / 1000), suseconds_t((msecs % 1000) * 1000) };
	if (evtimer_add(*m_retryTimer, &tv))
	{
		m_retryAction = tAction();
		fail("500 Internal timer failure"sv);
	}
}

void dljob::cbRetry(evutil_socket_t, short, void* arg)
{
	auto me = (dljob*) arg;
	auto act = move(me->m_retryAction);
	me->m_retryAction = tAction();
	if (act)
		act();
}

void dljob::armDeadline(unsigned secs, bool streamPhase)
{
	m_bStreamDeadline = streamPhase;
	evtimer_del(*m_deadline);
	if (!secs)
		return;
	struct timeval tv { time_t(secs), 0 };
	evtimer_add(*m_deadline, &tv);
}

void dljob::cbDeadline(evutil_socket_t, short, void* arg)
{
	auto me = (dljob*) arg;
	if (me->m_bStreamDeadline)
		me->fail("504 Stream timeout"sv);
	else
		me->fail("503 No download connection became available in time"sv);
}

void dljob::finish(bool ok)
{
	m_state = ok ? EState::COMPLETED : EState::FAILED;
	m_pending.reset();
	m_fetcher.reset();
	m_bFetching = false;
	m_bRebinding = false;
	m_retryAction = tAction();
	evtimer_del(*m_retryTimer);
	evtimer_del(*m_deadline);
	m_release.reset();
}

void dljob::fail(string_view message)
{
	if (m_state == EState::COMPLETED || m_state == EState::FAILED)
		return;
	log::err(m_taskId + ": " + mstring(message) + ", " + ltos(m_nBodySent) + " bytes sent", m_sClient);
	finish(false);
	if (!HandleSuddenError(message))
		m_activity = STATE_DISCO_ASAP;
	notifyParent();
}

bool dljob::HandleSuddenError(string_view message)
{
	LOGSTARTFUNC;
	// response ongoing, can only reject the client now
	if (m_bHeadCommitted)
	{
		m_activity = STATE_DISCO_ASAP;
		return false;
	}
	SetEarlySimpleResponse(message);
	return true;
}

dljob::eJobResult dljob::Resume(bufferevent* be)
{
	LOGSTARTFUNC;

	auto return_discon = [&](int IFDEBUG(line))
	{
		LOG("EXPLICIT DISCONNECT " << line);
		m_activity = STATE_DISCO_ASAP;
		return R_DISCON;
	};
	auto fin_stream_good = [&]()
	{
		LOG("CLEAN JOB FINISH");
		if (m_keepAlive == KEEP)
			return m_activity = STATE_DONE, R_DONE;
		if (m_keepAlive == CLOSE)
			return return_discon(__LINE__);
		if (m_bIsHttp11)
			return m_activity = STATE_DONE, R_DONE;
		return return_discon(__LINE__);
	};

	if (AC_UNLIKELY(!be))
		return return_discon(__LINE__);

	// the head of a download waits for the first data, an error can still replace it until then
	if (m_preHeadBuf.valid()
			&& (m_activity != STATE_SEND_DATA || evbuffer_get_length(*m_body) || m_bUpstreamEnd))
	{
		auto len = evbuffer_get_length(*m_preHeadBuf);
		if (0 != evbuffer_add_buffer(besender(be), *m_preHeadBuf))
			return return_discon(__LINE__);
		m_preHeadBuf.reset();
		m_nHeadSent += len;
		m_bHeadCommitted = true;
		if (m_activity == STATE_SEND_BUF_NOT_FITEM)
			return fin_stream_good();
	}

	switch (m_activity)
	{
	case STATE_PREPARING:
		return R_WILLNOTIFY;
	case STATE_DONE:
	case STATE_SEND_BUF_NOT_FITEM:
		return fin_stream_good();
	case STATE_DISCO_ASAP:
		return R_DISCON;
	case STATE_SEND_DATA:
		break;
	}

	if (m_preHeadBuf.valid())
	{
		requestNext();
		return R_WILLNOTIFY;
	}

	off_t expected = m_range.length();
	auto have = evbuffer_get_length(*m_body);
	if (have)
	{
		auto out = besender(be);
		auto queued = evbuffer_get_length(out);
		if (queued >= size_t(cfg::sendwindow))
			return R_WILLNOTIFY;
		size_t limit = min(have, size_t(cfg::sendwindow) - queued);
		limit = min(limit, size_t(expected - m_nBodySent));
		auto n = eb_move_range(*m_body, out, limit);
		if (n < 0)
			return return_discon(__LINE__);
		m_nBodySent += n;
	}
	if (m_nBodySent >= expected)
	{
		USRDBG(m_taskId << ": completed, " << m_nBodySent << " bytes");
		finish(true);
		m_activity = STATE_DONE;
		return fin_stream_good();
	}
	if (evbuffer_get_length(*m_body))
		return R_WILLNOTIFY;
	if (m_bUpstreamEnd)
	{
		log::err(m_taskId + ": upstream data ended after " + ltos(m_nBodySent) + " of "
				 + ltos(expected) + " bytes", m_sClient);
		finish(false);
		return return_discon(__LINE__);
	}
	requestNext();
	return R_WILLNOTIFY;
}

inline void dljob::CookResponseHeader()
{
	LOGSTARTFUNC;
	auto SB = GetBufFmter();
	SB.clear();
	SB << ebstream::imode::dec;
	PrependHttpVariant();
	if (m_bPartial)
	{
		SB << "206 Partial Content\r\nContent-Range: bytes "sv << m_range.from << '-' << m_range.until
		   << '/' << m_file.size << svRN;
	}
	else
		SB << "200 OK\r\n"sv;
	SB << "Content-Length: "sv << (m_file.size ? m_range.length() : off_t(0)) << svRN
	   << "Content-Type: "sv << (m_file.mimeType.empty() ? "application/octet-stream"s : m_file.mimeType) << svRN
	   << "Content-Disposition: "sv << FormatDisposition(m_file.fileName, "file_" + ltos(m_messageId)) << svRN;
	AppendMetaHeaders();
}

inline void dljob::PrependHttpVariant()
{
	auto SB = GetBufFmter();
	SB << (m_bIsHttp11 ? "HTTP/1.1 "sv : "HTTP/1.0 "sv);
}

void dljob::SetEarlySimpleResponse(string_view message, bool nobody)
{
	LOGSTARTFUNC;

	auto SB = GetBufFmter();
	SB.clear();

	m_activity = STATE_SEND_BUF_NOT_FITEM;

	if (nobody)
	{
		PrependHttpVariant();
		SB << message << svRN;
		AppendMetaHeaders();
		return;
	}

	mstring body = "<!DOCTYPE html>\n<html lang=\"en\"><head><title>"s + mstring(message)
			+ "</title>\n</head>\n<body><h1>" + mstring(message) + "</h1></body></html>";

	PrependHttpVariant();
	SB << message
	   << "\r\nContent-Length: "sv << body.size()
	   << "\r\nContent-Type: text/html\r\n"sv;
	AppendMetaHeaders();
	if (!m_bIsHeadOnly)
		SB << body;
}

inline void dljob::AppendMetaHeaders()
{
	auto SB = GetBufFmter();

	SB << m_extraHeaders
	   << "Accept-Ranges: bytes\r\n"
		  "X-Content-Type-Options: nosniff\r\n"
		  "X-Frame-Options: DENY\r\n"
		  "Access-Control-Allow-Origin: *\r\n"
		  "Access-Control-Allow-Methods: GET, HEAD, OPTIONS\r\n"
		  "Access-Control-Expose-Headers: Content-Length, Content-Range, Accept-Ranges\r\n"sv;

	if (m_keepAlive == KEEP)
		SB << "Connection: Keep-Alive\r\n"sv;
	else if (m_keepAlive == CLOSE)
		SB << "Connection: close\r\n"sv;
#ifdef DEBUG
	static atomic_int genHeadId(0);
	SB << "X-Debug: "sv << int(genHeadId++) << svRN;
#endif
	SB << "Date: "sv << tHttpDate(GetTime()).view()
	   << "\r\nServer: "sv << cfg::agentname << "\r\n\r\n"sv;
}

}
