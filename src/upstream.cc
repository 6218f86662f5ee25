#include "upstream.h"
#include "sgstrop.h"

namespace sgate
{

LPCSTR GetErrorName(EUpstreamError code)
{
	switch (code)
	{
	case EUpstreamError::NONE: return "OK";
	case EUpstreamError::NOT_FOUND: return "not found";
	case EUpstreamError::RATE_LIMITED: return "rate limited";
	case EUpstreamError::STALE_REFERENCE: return "stale file reference";
	case EUpstreamError::BAD_ALIGNMENT: return "invalid offset or limit";
	case EUpstreamError::TRANSIENT: return "transient failure";
	case EUpstreamError::UNAUTHORIZED: return "unauthorized";
	}
	return "unknown";
}

mstring tUpstreamStatus::ToString() const
{
	mstring ret(GetErrorName(code));
	if (code == EUpstreamError::RATE_LIMITED)
		ret += " (retry after " + ltos(retryAfter) + "s)";
	if (!msg.empty())
		ret += ": " + msg;
	return ret;
}

}
