#include "ahttpurl.h"
#include "sgstrop.h"

#include <strings.h>

using namespace std;

namespace sgate
{

void tHttpUrl::clear()
{
	sHost.clear();
	sPath.clear();
	nPort = 0;
	m_schema = EProtoType::HTTP;
}

bool tHttpUrl::SetHttpUrl(string_view url, bool requireScheme)
{
	clear();
	trimBoth(url);
	if (url.empty())
		return false;

	if (url.length() > 7 && 0 == strncasecmp(url.data(), "http://", 7))
		url.remove_prefix(7);
	else if (url.length() > 8 && 0 == strncasecmp(url.data(), "https://", 8))
	{
		url.remove_prefix(8);
		m_schema = EProtoType::HTTPS;
	}
	else if (requireScheme || url.find("://") != stmiss)
		return false;

	auto hEnd = url.find_first_of("/?");
	auto hostPort = url.substr(0, hEnd);
	if (hEnd != stmiss)
	{
		sPath.assign(url.substr(hEnd));
		if (sPath[0] == '?')
			sPath.insert(0, "/");
	}
	else
		sPath = "/";

	string_view portPart;
	if (startsWith(hostPort, "["))
	{
		auto cpos = hostPort.find(']');
		if (cpos == stmiss)
			return false;
		sHost.assign(hostPort.substr(1, cpos - 1));
		auto rest = hostPort.substr(cpos + 1);
		if (!rest.empty())
		{
			if (rest[0] != ':')
				return false;
			portPart = rest.substr(1);
		}
	}
	else
	{
		auto cpos = hostPort.rfind(':');
		// more than one colon is a bare IPv6 address
		if (cpos != stmiss && hostPort.find(':') == cpos)
		{
			portPart = hostPort.substr(cpos + 1);
			hostPort = hostPort.substr(0, cpos);
		}
		sHost.assign(hostPort);
	}
	if (sHost.empty())
		return false;
	if (!portPart.empty())
	{
		int64_t n;
		if (!ParseInt64(portPart, n) || n <= 0 || n > 65535)
			return false;
		nPort = uint16_t(n);
	}
	return true;
}

mstring tHttpUrl::ToURI() const
{
	mstring ret(IsTls() ? "https://" : "http://");
	if (sHost.find(':') != stmiss)
		ret += "[" + sHost + "]";
	else
		ret += sHost;
	if (nPort)
		ret += ":" + ltos(nPort);
	return ret + sPath;
}

}
