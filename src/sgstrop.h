#ifndef SGSTROP_H
#define SGSTROP_H

#include "sgtypes.h"

#include <ctime>
#include <mutex>
#include <vector>

namespace sgate
{

#define SPACECHARS " \f\n\r\t\v"
#define SPACECHARSsv " \f\n\r\t\v"sv
#define szRN "\r\n"

static constexpr string_view svRN = szRN;
static constexpr string_view svRN2 = szRN szRN;
static constexpr string_view svEmpty = "";

using lguard = std::lock_guard<std::mutex>;
using ulock = std::unique_lock<std::mutex>;
using tStrVec = std::vector<mstring>;

static inline time_t GetTime()
{
	return ::time(0);
}

inline bool startsWith(string_view where, string_view what)
{
	return where.size() >= what.size() && where.compare(0, what.size(), what) == 0;
}
inline bool endsWith(string_view where, string_view what)
{
	return where.size() >= what.size() && where.compare(where.size() - what.size(), what.size(), what) == 0;
}

inline void trimFront(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_first_not_of(junk);
	s.remove_prefix(pos == stmiss ? s.length() : pos);
}
inline void trimBack(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_last_not_of(junk);
	s.remove_suffix(pos == stmiss ? s.length() : s.length() - pos - 1);
}
inline void trimBoth(string_view& s, string_view junk = SPACECHARSsv)
{
	trimBack(s, junk);
	trimFront(s, junk);
}
inline string_view trimmed(string_view s)
{
	trimBoth(s);
	return s;
}

bool scaseequals(string_view a, string_view b);

mstring ltos(long long n);
mstring offttosH(off_t n);

/**
 * Convert a decimal number, with optional leading spaces.
 * @return nDefVal if the input is not a number or out of range
 */
off_t atoofft(string_view s, off_t nDefVal = 0);
/**
 * Strict variant, the whole input must be a decimal number.
 */
bool ParseInt64(string_view s, int64_t& out);

/**
 * Escapes quotes, backslashes and control chars for use inside a JSON string.
 */
mstring JsonEscape(string_view s);

/**
 * Value of a Content-Disposition header for a download. Names with non-ASCII chars also get
 * the RFC 5987 filename* form, the plain variant has them replaced.
 * @param fallback Used when nothing printable is left of the name
 */
mstring FormatDisposition(string_view fileName, string_view fallback);

/**
 * Iterator over tokens separated by any of the separator chars, empty tokens are skipped.
 */
class tSplitWalk
{
	string_view m_input;
	string_view m_seps;
	size_t m_start = 0, m_end = 0;

public:
	tSplitWalk(string_view line, string_view separators = SPACECHARSsv)
		: m_input(line), m_seps(separators)
	{
	}
	bool Next();
	string_view view() const { return m_input.substr(m_start, m_end - m_start); }

	struct iterator
	{
		tSplitWalk* walker;
		string_view operator*() const { return walker->view(); }
		iterator& operator++() { if (!walker->Next()) walker = nullptr; return *this; }
		bool operator!=(const iterator& other) const { return walker != other.walker; }
	};
	iterator begin() { return iterator { Next() ? this : nullptr }; }
	iterator end() { return iterator { nullptr }; }
};

}

#endif // SGSTROP_H
