#include "linkcodec.h"
#include "sgstrop.h"
#include "debug.h"

#include <algorithm>
#include <cctype>
#include <climits>

#include <openssl/evp.h>

using namespace std;

namespace sgate
{

using uint128 = unsigned __int128;

uint64_t GetLinkKey(int64_t channelId)
{
	if (channelId == 0)
		return LINK_FALLBACK_KEY;
	return channelId < 0 ? uint64_t(0) - uint64_t(channelId) : uint64_t(channelId);
}

static mstring ToDecimal(uint128 n)
{
	char buf[48];
	auto p = buf + sizeof(buf);
	do
	{
		*--p = char('0' + unsigned(n % 10));
		n /= 10;
	} while (n);
	return mstring(p, buf + sizeof(buf) - p);
}

mstring EncodeLinkId(int64_t messageId, uint64_t key)
{
	if (messageId <= 0 || !key)
		return mstring();
	auto digits = ToDecimal(uint128(messageId) * key);
	mstring ret;
	ret.resize(4 * ((digits.size() + 2) / 3) + 1);
	auto len = EVP_EncodeBlock((unsigned char*) &ret[0], (const unsigned char*) digits.data(), int(digits.size()));
	ret.resize(len);
	for (auto& c : ret)
	{
		if (c == '+')
			c = '-';
		else if (c == '/')
			c = '_';
	}
	auto padPos = ret.find('=');
	if (padPos != stmiss)
		ret.resize(padPos);
	return ret;
}

bool DecodeLinkId(string_view encoded, uint64_t key, int64_t& messageId)
{
	if (encoded.empty() || encoded.size() > MAX_LINK_ID_LEN || !key)
		return false;
	mstring b64;
	b64.reserve(encoded.size() + 3);
	for (auto c : encoded)
	{
		if (c == '-')
			c = '+';
		else if (c == '_')
			c = '/';
		else if (!isalnum((unsigned char) c))
			return false;
		b64 += c;
	}
	// a single leftover char cannot encode anything
	if (b64.size() % 4 == 1)
		return false;
	unsigned pad = (4 - b64.size() % 4) % 4;
	b64.append(pad, '=');

	string raw;
	raw.resize(b64.size() / 4 * 3);
	auto len = EVP_DecodeBlock((unsigned char*) &raw[0], (const unsigned char*) b64.data(), int(b64.size()));
	if (len < 0 || unsigned(len) < pad)
		return false;
	raw.resize(len - pad);

	if (raw.empty() || raw.size() > 39)
		return false;
	uint128 product = 0;
	const uint128 limit = ~uint128(0) / 10;
	for (auto c : raw)
	{
		if (c < '0' || c > '9' || product > limit)
			return false;
		auto next = product * 10 + unsigned(c - '0');
		if (next < product)
			return false;
		product = next;
	}
	if (product % key)
		return false;
	auto id = product / key;
	if (id == 0 || id > uint128(LLONG_MAX))
		return false;
	messageId = int64_t(id);
	return true;
}

bool IsLinkExpired(time_t created, int expirySecs, time_t now)
{
	if (expirySecs <= 0 || created <= 0)
		return false;
	return now > created + expirySecs;
}

}
