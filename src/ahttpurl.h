#ifndef AHTTPURL_H
#define AHTTPURL_H

#include "sgtypes.h"

namespace sgate
{

#define DEFAULT_PORT_HTTP 80
#define DEFAULT_PORT_HTTPS 443

class SGATE_API tHttpUrl
{
	uint16_t nPort = 0;

public:
	enum class EProtoType : uint8_t
	{
		HTTP,
		HTTPS
	} m_schema = EProtoType::HTTP;

	mstring sHost, sPath;

	/**
	 * Parses [scheme://]host[:port][/path]. IPv6 addresses must be in brackets, which are removed.
	 * @param requireScheme Reject input without http:// or https:// prefix
	 */
	bool SetHttpUrl(string_view uri, bool requireScheme = false);

	uint16_t GetPort(uint16_t nDefault) const { return nPort ? nPort : nDefault; }
	uint16_t GetPort() const { return GetPort(m_schema == EProtoType::HTTPS ? DEFAULT_PORT_HTTPS : DEFAULT_PORT_HTTP); }
	bool HasPort() const { return nPort; }
	bool IsTls() const { return m_schema == EProtoType::HTTPS; }
	mstring ToURI() const;
	void clear();
};

}

#endif // AHTTPURL_H
