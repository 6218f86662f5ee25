#include "sgstrop.h"

#include <charconv>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <strings.h>

using namespace std;

namespace sgate
{

bool scaseequals(string_view a, string_view b)
{
	return a.length() == b.length() && 0 == strncasecmp(a.data(), b.data(), a.length());
}

mstring ltos(long long n)
{
	char buf[24];
	auto res = to_chars(buf, buf + sizeof(buf), n);
	return mstring(buf, res.ptr - buf);
}

mstring offttosH(off_t n)
{
	LPCSTR  pref[] = { "", " KiB", " MiB", " GiB", " TiB" };
	unsigned i = 0;
	for (; i < _countof(pref) - 1 && n >= 1024; ++i)
		n /= 1024;
	return ltos(n) + pref[i];
}

template<typename Tresult>
Tresult aToSomething(string_view s, Tresult nDefVal)
{
	Tresult ret(nDefVal);
	trimFront(s);
	if (s.empty())
		return nDefVal;

	auto ec(std::from_chars(s.data(), s.data() + s.size(), ret, 10).ec);
	switch (ec)
	{
	case std::errc::invalid_argument:
	case std::errc::result_out_of_range:
		return nDefVal;
	default:
		return ret;
	}
}

off_t atoofft(string_view s, off_t nDefVal)
{
	return aToSomething<off_t>(s, nDefVal);
}

bool ParseInt64(string_view s, int64_t& out)
{
	if (s.empty())
		return false;
	auto res = std::from_chars(s.data(), s.data() + s.size(), out, 10);
	return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

mstring JsonEscape(string_view s)
{
	mstring ret;
	for (unsigned char c : s)
	{
		if (c == '"' || c == '\\')
			ret += '\\', ret += char(c);
		else if (c < 0x20)
		{
			char buf[8];
			snprintf(buf, sizeof(buf), "\\u%04x", c);
			ret += buf;
		}
		else
			ret += char(c);
	}
	return ret;
}

mstring FormatDisposition(string_view fileName, string_view fallback)
{
	mstring plain;
	bool needExt = false;
	for (unsigned char c : fileName)
	{
		if (c < 0x20 || c == 0x7f || c == '"' || c == '\\')
			plain += '_';
		else if (c >= 0x80)
			needExt = true, plain += '_';
		else
			plain += char(c);
	}
	if (plain.empty())
		plain = fallback;
	auto ret = "attachment; filename=\"" + plain + "\"";
	if (!needExt)
		return ret;

	ret += "; filename*=UTF-8''";
	constexpr auto hexmap = "0123456789ABCDEF";
	for (unsigned char c : fileName)
	{
		if (isalnum(c) || (c && strchr("!#$&+-.^_`|~", c)))
			ret += char(c);
		else
		{
			ret += '%';
			ret += hexmap[c >> 4];
			ret += hexmap[c & 0xf];
		}
	}
	return ret;
}

bool tSplitWalk::Next()
{
	if (m_end >= m_input.size())
		return false;
	m_start = m_input.find_first_not_of(m_seps, m_end);
	if (m_start == stmiss)
	{
		m_start = m_end = m_input.size();
		return false;
	}
	m_end = m_input.find_first_of(m_seps, m_start);
	if (m_end == stmiss)
		m_end = m_input.size();
	return true;
}

}
