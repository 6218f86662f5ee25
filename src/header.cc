#include "header.h"
#include "sgstrop.h"
#include "debug.h"

#include <cstdlib>
#include <cstring>

#include <event2/buffer.h>

using namespace std;

namespace sgate
{

static const struct
{
	header::eHeadPos pos;
	string_view key;
} mapId2Headname[] =
{
	{ header::CONNECTION, "Connection"sv },
	{ header::CONNECTION, "Proxy-Connection"sv },
	{ header::CONTENT_LENGTH, "Content-Length"sv },
	{ header::RANGE, "Range"sv },
	{ header::IFRANGE, "If-Range"sv },
	{ header::XFORWARDEDFOR, "X-Forwarded-For"sv },
	{ header::HOST, "Host"sv },
	{ header::USER_AGENT, "User-Agent"sv },
	{ header::ORIGIN, "Origin"sv }
};

static const struct
{
	header::eHeadType type;
	string_view name;
} methods[] =
{
	{ header::GET, "GET"sv },
	{ header::HEAD, "HEAD"sv },
	{ header::POST, "POST"sv },
	{ header::OPTIONS, "OPTIONS"sv }
};

header::~header()
{
	clear();
}

header::header(const header &s)
	: type(s.type), proto(s.proto), frontLine(s.frontLine), m_url(s.m_url)
{
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
}

header::header(header &&s)
	: type(s.type), proto(s.proto), frontLine(move(s.frontLine)), m_url(move(s.m_url))
{
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		std::swap(h[i], s.h[i]);
}

header& header::operator=(const header& s)
{
	if (&s == this)
		return *this;
	clear();
	type = s.type;
	proto = s.proto;
	frontLine = s.frontLine;
	m_url = s.m_url;
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
	return *this;
}

header& header::operator=(header&& s)
{
	if (&s == this)
		return *this;
	type = s.type;
	proto = s.proto;
	frontLine.swap(s.frontLine);
	m_url.swap(s.m_url);
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		std::swap(h[i], s.h[i]);
	return *this;
}

void header::set(eHeadPos key, string_view value)
{
	if (key >= HEADPOS_MAX)
		return;
	auto p = (char*) realloc(h[key], value.size() + 1);
	if (!p)
		throw std::bad_alloc();
	memcpy(p, value.data(), value.size());
	p[value.size()] = 0;
	h[key] = p;
}

void header::del(eHeadPos i)
{
	free(h[i]);
	h[i] = nullptr;
}

void header::clear()
{
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
		del((eHeadPos) i);
	frontLine.clear();
	m_url.clear();
	type = INVALID;
	proto = HTTP_11;
}

string_view header::getMethodView() const
{
	auto pos = frontLine.find(' ');
	return pos == stmiss ? string_view(frontLine) : string_view(frontLine).substr(0, pos);
}

header::eHeadPos header::resolvePos(string_view key)
{
	for (const auto& it : mapId2Headname)
	{
		if (scaseequals(key, it.key))
			return it.pos;
	}
	return HEADPOS_MAX;
}

int header::Load(string_view input)
{
	clear();

	auto end = input.find("\n\r\n"sv);
	size_t termLen = 3;
	auto alt = input.find("\n\n"sv);
	if (alt != stmiss && (end == stmiss || alt < end))
		end = alt, termLen = 2;
	if (end == stmiss)
		return input.size() > MAX_HEAD_SIZE ? -1 : 0;
	if (end + termLen > MAX_HEAD_SIZE)
		return -1;
	auto total = int(end + termLen);

	string_view block = input.substr(0, end + 1);
	bool first = true;
	eHeadPos lastPos = HEADPOS_MAX;

	for (tSplitWalk lines(block, "\n"sv); lines.Next();)
	{
		auto line = lines.view();
		trimBack(line, "\r"sv);
		if (line.empty())
			continue;

		if (first)
		{
			first = false;
			frontLine = mstring(line);
			tSplitWalk tokens(line, " "sv);
			string_view parts[3];
			unsigned n = 0;
			for (; n < 3 && tokens.Next(); ++n)
				parts[n] = tokens.view();
			if (n != 3 || tokens.Next())
				return -1;
			type = OTHER;
			for (const auto& m : methods)
			{
				if (m.name == parts[0])
					type = m.type;
			}
			if (parts[2] == "HTTP/1.1"sv)
				proto = HTTP_11;
			else if (parts[2] == "HTTP/1.0"sv)
				proto = HTTP_10;
			else
				return -1;
			m_url = mstring(parts[1]);
			continue;
		}
		// obsolete line folding
		if (line.front() == ' ' || line.front() == '\t')
		{
			if (lastPos == HEADPOS_MAX || !h[lastPos])
				continue;
			mstring joined(h[lastPos]);
			joined += ' ';
			joined += trimmed(line);
			set(lastPos, joined);
			continue;
		}
		auto colon = line.find(':');
		if (colon == stmiss || colon == 0)
			return -1;
		auto key = line.substr(0, colon);
		if (key.find_first_of(SPACECHARSsv) != stmiss)
			return -1;
		lastPos = resolvePos(key);
		if (lastPos == HEADPOS_MAX)
			continue;
		set(lastPos, trimmed(line.substr(colon + 1)));
	}
	if (first)
		return -1;
	return total;
}

int header::Load(evbuffer *buf)
{
	auto len = evbuffer_get_length(buf);
	if (len > MAX_HEAD_SIZE + 4)
		len = MAX_HEAD_SIZE + 4;
	auto p = (const char*) evbuffer_pullup(buf, len);
	if (!p && len)
		return -1;
	return Load(string_view(p, len));
}

}
