#include "meta.h"

#include <cstdio>

#include <openssl/evp.h>

using namespace std;

namespace dlbr
{

cmstring se;

mstring ltos(long n)
{
	return to_string(n);
}

mstring offttos(off_t n)
{
	return to_string(n);
}

mstring offttosH(off_t n)
{
	static const LPCSTR units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
	if (n < 1024)
		return to_string(n) + " B";
	double val = n;
	unsigned i = 0;
	while (val >= 1024 && i < (sizeof(units) / sizeof(units[0])) - 1)
	{
		val /= 1024;
		++i;
	}
	char buf[40];
	snprintf(buf, sizeof(buf), "%.2f %s", val, units[i]);
	return buf;
}

static inline bool isUnreserved(char c)
{
	return isalnum((unsigned char) c) || c == '-' || c == '.' || c == '_' || c == '~';
}

void UrlEscapeAppend(string_view s, mstring &sTarget, bool keepSlashes)
{
	static const char hex[] = "0123456789ABCDEF";
	for (auto c: s)
	{
		if (isUnreserved(c) || (keepSlashes && c == '/'))
			sTarget += c;
		else
		{
			sTarget += '%';
			sTarget += hex[(unsigned char) c >> 4];
			sTarget += hex[(unsigned char) c & 0xf];
		}
	}
}

mstring UrlEscape(string_view s, bool keepSlashes)
{
	mstring ret;
	ret.reserve(s.size());
	UrlEscapeAppend(s, ret, keepSlashes);
	return ret;
}

static inline int hexval(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

bool UrlUnescapeAppend(string_view from, mstring & to)
{
	bool ret = true;
	for (size_t i = 0; i < from.size(); ++i)
	{
		if (from[i] != '%')
		{
			to += from[i];
			continue;
		}
		int hi = i + 2 < from.size() ? hexval(from[i + 1]) : -1;
		int lo = hi >= 0 ? hexval(from[i + 2]) : -1;
		if (lo < 0)
		{
			// pass the junk through
			to += from[i];
			ret = false;
			continue;
		}
		to += char(hi * 16 + lo);
		i += 2;
	}
	return ret;
}

mstring UrlUnescape(string_view from)
{
	mstring ret;
	UrlUnescapeAppend(from, ret);
	return ret;
}

mstring BytesToHexString(const uint8_t b[], unsigned short binLength)
{
	static const char hex[] = "0123456789abcdef";
	mstring ret;
	ret.reserve(binLength * 2);
	for (unsigned i = 0; i < binLength; ++i)
	{
		ret += hex[b[i] >> 4];
		ret += hex[b[i] & 0xf];
	}
	return ret;
}

mstring EncodeBase64Auth(cmstring &sPwdString)
{
	auto sNative = UrlUnescape(sPwdString);
	mstring ret;
	ret.resize(4 * ((sNative.size() + 2) / 3) + 1);
	auto n = EVP_EncodeBlock((unsigned char*) &ret[0], (const unsigned char*) sNative.data(), sNative.size());
	ret.resize(n < 0 ? 0 : n);
	return ret;
}

void tErrnoFmter::fmt(int errnoCode, LPCSTR prefix)
{
	char buf[64];
	buf[0] = buf[sizeof(buf) - 1] = 0;
	if (prefix)
		assign(prefix);

#if (_POSIX_C_SOURCE >= 200112L || _XOPEN_SOURCE >= 600) && ! _GNU_SOURCE
	if (0 == strerror_r(errnoCode, buf, sizeof(buf) - 1))
		append(buf);
#else
	append(strerror_r(errnoCode, buf, sizeof(buf) - 1));
#endif
}

}
