#ifndef _HEADER_H
#define _HEADER_H

#include "sgtypes.h"

extern "C"
{
struct evbuffer;
}

namespace sgate
{

// requests with bigger heads are rejected
#define MAX_HEAD_SIZE 16384

/**
 * Head of a client request, with the fields which matter to this server.
 */
class SGATE_API header
{
public:
	enum eHeadType : char
	{
		INVALID,
		HEAD,
		GET,
		POST,
		OPTIONS,
		OTHER
	};
	enum eHeadPos : char
	{
		CONNECTION,			// 0
		CONTENT_LENGTH,
		RANGE,
		IFRANGE,
		XFORWARDEDFOR,
		HOST,				// 5
		USER_AGENT,
		ORIGIN,
		// unreachable entry and size reference
		HEADPOS_MAX
	};
	enum eProto : char
	{
		HTTP_10,
		HTTP_11
	};

	eHeadType type = INVALID;
	eProto proto = HTTP_11;
	mstring frontLine;

	char *h[HEADPOS_MAX] = {0};

	header() {};
	~header();
	header(const header &);
	header(header &&);
	header& operator=(const header&);
	header& operator=(header&&);

	void set(eHeadPos, string_view value);
	void del(eHeadPos);
	void clear();

	cmstring& getRequestUrl() const { return m_url; }
	string_view GetProtoView() const { return proto == HTTP_11 ? "HTTP/1.1"sv : "HTTP/1.0"sv; }
	string_view getMethodView() const;

	/**
	 * Parses a request head.
	 *
	 * @param sv Raw input, might contain more than the head
	 * @return Length of processed data, 0: incomplete, needs more data, <0: error
	 */
	int Load(string_view sv);
	int Load(evbuffer *buf);

private:
	mstring m_url;
	eHeadPos resolvePos(string_view key);
};

}

#endif
