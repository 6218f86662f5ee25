#ifndef LINKCODEC_H
#define LINKCODEC_H

#include "sgtypes.h"

namespace sgate
{

// used when no channel is configured
#define LINK_FALLBACK_KEY 961748927
#define MAX_LINK_ID_LEN 200

/**
 * Public download ids are the URL-safe base64 form (without padding) of the decimal
 * product of message id and key. The key is the absolute channel id.
 */
uint64_t SGATE_API GetLinkKey(int64_t channelId);

mstring SGATE_API EncodeLinkId(int64_t messageId, uint64_t key);
/**
 * @return false if the id is malformed or does not belong to the key
 */
bool SGATE_API DecodeLinkId(string_view encoded, uint64_t key, int64_t& messageId);

/**
 * @param expirySecs Link lifetime, 0 for unlimited
 */
bool SGATE_API IsLinkExpired(time_t created, int expirySecs, time_t now);

}

#endif // LINKCODEC_H
