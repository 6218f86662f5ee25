#include "httpdate.h"

#include <cstring>

using namespace std;

namespace sgate
{

static const char* fmts[] =
{
		"%a, %d %b %Y %H:%M:%S GMT",
		"%A, %d-%b-%y %H:%M:%S GMT",
		"%a %b %d %H:%M:%S %Y"
};

bool tHttpDate::ParseDate(const char *s, struct tm *tm)
{
	if (!s || !tm)
		return false;
	for (const auto& fmt : fmts)
	{
		memset(tm, 0, sizeof(*tm));
		if (::strptime(s, fmt, tm))
			return true;
	}
	return false;
}

time_t tHttpDate::ParseDate(const char *s, time_t onError)
{
	struct tm t;
	if (!ParseDate(s, &t))
		return onError;
	return timegm(&t);
}

unsigned tHttpDate::FormatTime(char *buf, size_t bufLen, const struct tm * src)
{
	if (bufLen < 30)
		return 0;
	auto len = strftime(buf, bufLen, fmts[0], src);
	if (len >= bufLen || len < 10)
	{
		buf[0] = 0;
		return 0;
	}
	buf[len] = '\0';
	return len;
}

unsigned tHttpDate::FormatTime(char *buf, size_t bufLen, const time_t cur)
{
	struct tm tmp;
	gmtime_r(&cur, &tmp);
	return FormatTime(buf, bufLen, &tmp);
}

tHttpDate::tHttpDate(time_t val) : tHttpDate()
{
	length = FormatTime(buf, sizeof(buf), val);
}

}
