#ifndef HTTPDATE_H
#define HTTPDATE_H

#include "sgtypes.h"

#include <ctime>

namespace sgate
{

/**
 * Date value in the preferred HTTP format (RFC 7231 IMF-fixdate)
 */
class SGATE_API tHttpDate
{
	char buf[32];
	unsigned length = 0;

public:
	tHttpDate() { buf[0] = 0; }
	explicit tHttpDate(time_t val);

	static bool ParseDate(const char *, struct tm*);
	static time_t ParseDate(const char *, time_t onError);
	static unsigned FormatTime(char *buf, size_t bufLen, const struct tm*);
	static unsigned FormatTime(char *buf, size_t bufLen, time_t cur);

	bool isSet() const { return length; }
	string_view view() const { return string_view(buf, length); }
	time_t value(time_t defVal) const { return ParseDate(buf, defVal); }
};

}

#endif // HTTPDATE_H
