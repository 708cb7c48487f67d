#include "astrop.h"

#include <charconv>
#include <cctype>

namespace dlbr
{

using namespace std;

off_t atoofft(string_view s, off_t nDefVal)
{
	trimBoth(s);
	if (s.empty())
		return nDefVal;
	if (s.front() == '+')
		s.remove_prefix(1);
	off_t ret(nDefVal);
	auto res = std::from_chars(s.data(), s.data() + s.size(), ret, 10);
	if (res.ec != std::errc() || res.ptr != s.data() + s.size())
		return nDefVal;
	return ret;
}

off_t strsizeToOfft(string_view s, off_t nDefVal)
{
	trimBoth(s);
	if (s.empty())
		return nDefVal;
	off_t mult = 1;
	switch (toupper((unsigned char) s.back()))
	{
	case 'K': mult = 1024; break;
	case 'M': mult = 1024 * 1024; break;
	case 'G': mult = 1024 * 1024 * 1024; break;
	default: break;
	}
	if (mult != 1)
		s.remove_suffix(1);
	auto n = atoofft(s, -1);
	if (n < 0 || n > MAX_VAL(off_t) / mult)
		return nDefVal;
	return n * mult;
}

}
