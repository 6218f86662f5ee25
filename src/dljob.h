#ifndef DLJOB_H
#define DLJOB_H

#include "config.h"
#include "sgtemplates.h"
#include "sgstrop.h"
#include "upstream.h"
#include "byterange.h"
#include "aevutil.h"
#include "debug.h"

#include <memory>

namespace sgate
{

class IConnBase;
class header;
class sgres;
class chunkfetcher;

extern uint_fast32_t g_genJobId;

/**
 * Retry allowance of one download, one counter per failure class.
 */
struct tRetryBudget
{
	unsigned metadata = 0;
	unsigned stream = 0;
	unsigned failover = 0;
	bool staleReresolved = false;

	static tRetryBudget FromConfig();
	// consumes one attempt, false when exhausted
	static bool Take(unsigned& counter)
	{
		if (!counter)
			return false;
		--counter;
		return true;
	}
};

/**
 * One request on a client connection. Downloads pass through
 * VALIDATING, RESOLVING, ALLOCATING and STREAMING and end in COMPLETED or FAILED.
 */
class SGATE_API dljob
{
public:

	enum eJobResult : short
	{
		R_DONE = 0, R_DISCON = 2, R_WILLNOTIFY
	};
	enum class EState : uint8_t
	{
		VALIDATING,
		RESOLVING,
		ALLOCATING,
		STREAMING,
		COMPLETED,
		FAILED
	};

	dljob(IConnBase& parent, sgres& res);
	~dljob();
	dljob(const dljob&) = delete;
	dljob& operator=(const dljob&) = delete;

	void Prepare(const header &h, cmstring& clientIp);
	void PrepareFatalError(string_view errorStatus);
	eJobResult Resume(bufferevent* be);

	uint_fast32_t GetId() { return IFDEBUGELSE(m_id, 0); }
	EState GetState() const { return m_state; }
	off_t GetBodyBytesSent() const { return m_nBodySent; }
	cmstring& GetTaskId() const { return m_taskId; }
	// connection which currently serves the download, 0 if none
	int64_t GetConnId() const { return m_connId; }

	SUTPRIVATE:

	enum eActivity : short
	{
		STATE_PREPARING,
		STATE_SEND_DATA,
		STATE_DONE,
		STATE_DISCO_ASAP,
		// only sending head buffer and finish
		STATE_SEND_BUF_NOT_FITEM
	};

	IConnBase& m_parent;
	sgres& m_res;
#ifdef DEBUG
	uint_fast32_t m_id = g_genJobId++;
#endif
	bool m_bIsHttp11 = true;
	bool m_bIsHeadOnly = false;
	enum EKeepAliveMode : uint8_t
	{
		CLOSE = 'c',
		KEEP,
		UNSPECIFIED
	} m_keepAlive = UNSPECIFIED;

	eActivity m_activity = STATE_PREPARING;
	EState m_state = EState::VALIDATING;
	/**
	 * @brief m_preHeadBuf collects header data which shall be sent out ASAP.
	 *
	 * Initialized by GetBufFmter, invalidated after sending the contents.
	 */
	unique_eb m_preHeadBuf;
	// trimmed body data waiting for the client socket
	unique_eb m_body;
	mstring m_extraHeaders;
	mstring m_sClient, m_sPath;

	int64_t m_messageId = 0;
	tRemoteFile m_file;
	bool m_bHaveRange = false;
	mstring m_rangeSpec;
	tByteRange m_range;
	bool m_bPartial = false;

	mstring m_taskId;
	int64_t m_connId = 0;
	int64_t m_probeId = 0;
	tRetryBudget m_budget;
	// gives the allocated connection back
	TFinalAction m_release;
	// active upstream operation
	TFinalAction m_pending;
	std::unique_ptr<chunkfetcher> m_fetcher;
	bool m_bFetching = false;
	// a new connection is being bound, the fetcher still points to the old one
	bool m_bRebinding = false;
	bool m_bUpstreamEnd = false;
	bool m_bHeadCommitted = false;
	off_t m_nBodySent = 0;
	off_t m_nHeadSent = 0;

	unique_event m_retryTimer, m_deadline;
	tAction m_retryAction;
	bool m_bStreamDeadline = false;

	void SetEarlySimpleResponse(string_view message, bool nobody = false);
	inline void CookResponseHeader();
	inline void AppendMetaHeaders();
	inline void PrependHttpVariant();
	inline ebstream GetBufFmter();
	/**
	 * @brief HandleSuddenError reports the error to the client if nothing was sent yet
	 * @return True to continue on this job, false to disconnect ASAP
	 */
	bool HandleSuddenError(string_view message);

	void prepareDownload(string_view encodedId, const header& h);
	void prepareInfo();
	void startResolve(bool preferPrimary);
	void onResolved(const tUpstreamStatus&, const tRemoteFile&);
	void startAllocation();
	void reacquire();
	void bindConnection();
	void onBound(const tUpstreamStatus&, const tRemoteFile&);
	void requestNext();
	void onSlice(const tUpstreamStatus&, evbuffer* slice);
	void handleRateLimit(const tUpstreamStatus&);
	void handleTransient(const tUpstreamStatus&, tAction retry);
	void finish(bool ok);
	void fail(string_view message);

	void schedule(unsigned msecs, tAction act);
	void armDeadline(unsigned secs, bool streamPhase);
	static void cbRetry(evutil_socket_t, short, void*);
	static void cbDeadline(evutil_socket_t, short, void*);
	void track(TFinalAction&&);
	void notifyParent();
};

}

#endif // DLJOB_H
