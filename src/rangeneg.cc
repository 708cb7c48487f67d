#include "rangeneg.h"
#include "astrop.h"

#include <charconv>

using namespace std;

namespace dlbr
{

enum class ENumParse
{
	OK,
	EMPTY,
	BAD,
	OVERFLOW
};

// digits only, no sign, no whitespace inside
static ENumParse parsePosition(string_view s, off_t& out)
{
	if (s.empty())
		return ENumParse::EMPTY;
	for (auto c: s)
		if (c < '0' || c > '9')
			return ENumParse::BAD;
	auto res = from_chars(s.data(), s.data() + s.size(), out);
	if (res.ec == errc::result_out_of_range)
		return ENumParse::OVERFLOW;
	if (res.ec != errc() || res.ptr != s.data() + s.size())
		return ENumParse::BAD;
	return ENumParse::OK;
}

tRangeVerdict NegotiateRange(const char* rangeHeader, off_t totalSize)
{
	tRangeVerdict full { tRangeVerdict::FULL, { 0, totalSize - 1 } };
	tRangeVerdict unsat { tRangeVerdict::UNSATISFIABLE, { 0, -1 } };

	if (!rangeHeader)
		return full;

	string_view hdr(rangeHeader);
	trimBoth(hdr);
	auto eqPos = hdr.find('=');
	if (eqPos == stmiss)
		return full;
	auto unit = hdr.substr(0, eqPos);
	trimBoth(unit);
	if (!CaseEqual(unit, "bytes"sv))
		return full;

	auto set = hdr.substr(eqPos + 1);
	trimBoth(set);
	if (set.find(',') != stmiss)
		return unsat;

	auto dashPos = set.find('-');
	if (dashPos == stmiss)
		return full;
	auto first = set.substr(0, dashPos), last = set.substr(dashPos + 1);
	trimBoth(first);
	trimBoth(last);

	off_t a(0), b(0);
	auto resA = parsePosition(first, a);
	auto resB = parsePosition(last, b);

	if (resA == ENumParse::BAD || resB == ENumParse::BAD)
		return full;

	// suffix form: bytes=-N
	if (resA == ENumParse::EMPTY)
	{
		if (resB == ENumParse::EMPTY)
			return full;
		if (totalSize == 0)
			return unsat;
		// huge suffix means everything
		if (resB == ENumParse::OVERFLOW || b >= totalSize)
			return tRangeVerdict { tRangeVerdict::PARTIAL, { 0, totalSize - 1 } };
		if (b == 0)
			return unsat;
		return tRangeVerdict { tRangeVerdict::PARTIAL, { totalSize - b, totalSize - 1 } };
	}

	if (resA == ENumParse::OVERFLOW || totalSize == 0 || a >= totalSize)
		return unsat;

	// open end: bytes=a-
	if (resB == ENumParse::EMPTY)
		return tRangeVerdict { tRangeVerdict::PARTIAL, { a, totalSize - 1 } };

	if (resB == ENumParse::OK && a > b)
		return unsat;
	// an overflowing end is just very large
	if (resB == ENumParse::OVERFLOW || b >= totalSize)
		b = totalSize - 1;
	return tRangeVerdict { tRangeVerdict::PARTIAL, { a, b } };
}

}
