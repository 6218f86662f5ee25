#ifndef GWSESSION_H
#define GWSESSION_H

#include "upstream.h"

namespace sgate
{
class sgres;

/**
 * @brief Upstream session talking to the platform through the HTTP bot gateway at cfg::gatewayurl
 *
 * Gateway calls, all authorized with "Authorization: Bot <token>":
 * - GET <base>/v1/me : session identity in X-Bot-Id and X-Bot-Name
 * - GET <base>/v1/channels/<channel>/messages/<id> : file attributes in X-Media-Id, X-Access-Hash,
 *   X-File-Reference, X-Dc-Id, X-Thumb-Size, X-File-Size, X-Mime-Type, X-File-Name, X-Message-Date
 * - GET <base>/v1/files/<dc>/<media>?offset=N&limit=N[&thumb=T] with X-Access-Hash and
 *   X-File-Reference request headers : raw bytes
 * Error signals: 404 not found, 410 stale reference, 400 bad offset/limit, 420 or 429 with
 * Retry-After for flood control, 401 and 403 for rejected credentials.
 */
lint_ptr<IUpstreamSession> MakeGatewaySession(sgres& res, cmstring& token, bool isPrimary);

/**
 * Maps the gateway response code to the error classes of the upstream.
 */
tUpstreamStatus MapGatewayStatus(int httpCode, string_view retryAfter, string_view reason);

}

#endif // GWSESSION_H
