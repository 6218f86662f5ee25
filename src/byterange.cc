#include "byterange.h"
#include "sgstrop.h"

using namespace std;

namespace sgate
{

// digits only, no sign or spaces
static bool ParseOffset(string_view s, off_t& out)
{
	if (s.empty() || s.find_first_not_of("0123456789"sv) != stmiss)
		return false;
	int64_t n;
	if (!ParseInt64(s, n))
		return false;
	out = n;
	return true;
}

ERangeResult ParseRange(const char* rangeHeader, off_t fileSize, tByteRange& out)
{
	out = tByteRange();
	if (!rangeHeader)
	{
		out.until = fileSize - 1;
		return ERangeResult::FULL;
	}
	auto spec = trimmed(rangeHeader);
	constexpr auto unit = "bytes="sv;
	if (spec.size() < unit.size() || !scaseequals(spec.substr(0, unit.size()), unit))
		return ERangeResult::UNSATISFIABLE;
	spec.remove_prefix(unit.size());
	trimBoth(spec);
	if (spec.find(',') != stmiss)
		return ERangeResult::UNSATISFIABLE;

	auto dash = spec.find('-');
	if (dash == stmiss)
		return ERangeResult::UNSATISFIABLE;
	auto sFrom = trimmed(spec.substr(0, dash)), sTo = trimmed(spec.substr(dash + 1));

	if (sFrom.empty())
	{
		off_t suffix;
		if (!ParseOffset(sTo, suffix) || suffix == 0 || fileSize <= 0)
			return ERangeResult::UNSATISFIABLE;
		out.from = suffix >= fileSize ? 0 : fileSize - suffix;
		out.until = fileSize - 1;
		return ERangeResult::PARTIAL;
	}
	if (!ParseOffset(sFrom, out.from))
		return ERangeResult::UNSATISFIABLE;
	if (sTo.empty())
		out.until = fileSize - 1;
	else if (!ParseOffset(sTo, out.until))
		return ERangeResult::UNSATISFIABLE;

	if (out.from > out.until || out.until >= fileSize)
		return ERangeResult::UNSATISFIABLE;
	return ERangeResult::PARTIAL;
}

}
