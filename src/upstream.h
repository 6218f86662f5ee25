#ifndef UPSTREAM_H
#define UPSTREAM_H

#include "sgtypes.h"
#include "sgsmartptr.h"
#include "sgtemplates.h"

#include <functional>
#include <ctime>

extern "C"
{
struct evbuffer;
}

namespace sgate
{

/**
 * Remote file as resolved from a message id. Immutable once resolved.
 */
struct tRemoteFile
{
	int64_t messageId = 0;
	// remote identity and access token
	int64_t mediaId = 0;
	int64_t accessHash = 0;
	mstring fileReference;
	// storage shard which holds the file bytes
	int dcId = 0;
	mstring thumbSize;

	off_t size = 0;
	mstring mimeType;
	mstring fileName;
	// message creation time
	time_t created = 0;
};

enum class EUpstreamError : uint8_t
{
	NONE,
	NOT_FOUND,
	// flood control, retryAfter says when the session may be used again
	RATE_LIMITED,
	// file reference has moved or expired, resolve the message again
	STALE_REFERENCE,
	// offset or limit violate the chunk rules, never retry with the same parameters
	BAD_ALIGNMENT,
	// timeout, reset, generic failure of the remote side
	TRANSIENT,
	// the session credentials were rejected
	UNAUTHORIZED
};

struct tUpstreamStatus
{
	EUpstreamError code = EUpstreamError::NONE;
	int retryAfter = 0;
	mstring msg;

	tUpstreamStatus() =default;
	tUpstreamStatus(EUpstreamError c, mstring m = mstring(), int ra = 0)
		: code(c), retryAfter(ra), msg(std::move(m)) {}

	bool ok() const { return code == EUpstreamError::NONE; }
	mstring ToString() const;
};

LPCSTR GetErrorName(EUpstreamError);

struct tSessionIdentity
{
	int64_t id = 0;
	mstring name;
};

/**
 * One authenticated session to the remote platform.
 *
 * All methods are called on the event thread and report their results from the event loop.
 * The handles returned by Lookup and ReadChunk cancel the operation when destroyed
 * before the result was reported, the callback is not invoked then.
 */
class IUpstreamSession : public tLintRefcounted
{
public:
	using tStartResult = std::function<void(const tUpstreamStatus&, const tSessionIdentity&)>;
	using tLookupResult = std::function<void(const tUpstreamStatus&, const tRemoteFile&)>;
	// data is valid while the callback runs, the receiver may drain it
	using tReadResult = std::function<void(const tUpstreamStatus&, evbuffer* data)>;

	virtual void Start(tStartResult) =0;
	// safe to call again, done is always reported
	virtual void Stop(tAction done) =0;
	virtual bool IsConnected() =0;

	virtual TFinalAction Lookup(int64_t messageId, tLookupResult) WARN_UNUSED =0;
	/**
	 * Reads up to limit bytes at offset. A result shorter than limit means end of file.
	 */
	virtual TFinalAction ReadChunk(const tRemoteFile&, off_t offset, unsigned limit, tReadResult) WARN_UNUSED =0;
};

/**
 * Creates a session for the given credentials. The primary session is created first.
 */
using tSessionFactory = std::function<lint_ptr<IUpstreamSession>(cmstring& token, bool isPrimary)>;

}

#endif // UPSTREAM_H
