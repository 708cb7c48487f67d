#ifndef _META_H
#define _META_H

#include "actypes.h"
#include "actemplates.h"
#include "astrop.h"

#include <ctime>
#include <cstring>

#include <errno.h>
#include <sys/time.h>

namespace dlbr
{


#define szRN "\r\n"
static constexpr string_view svRN = szRN;
static constexpr string_view svRN2 = szRN szRN;

extern DLBR_API cmstring se;

static inline time_t GetTime()
{
	return ::time(0);
}

static const time_t END_OF_TIME(MAX_VAL(time_t)-2);

DLBR_API mstring offttos(off_t n);
DLBR_API mstring ltos(long n);
/**
 * @brief Human readable size, like "1.50 MiB"
 */
DLBR_API mstring offttosH(off_t n);

/**
 * @brief Percent-encode everything but the unreserved characters of RFC3986.
 * @param keepSlashes Leave '/' as-is, for path composition
 */
void UrlEscapeAppend(string_view s, mstring &sTarget, bool keepSlashes = true);
mstring UrlEscape(string_view s, bool keepSlashes = true);
//! Decode %XX sequences, return false on malformed input
bool UrlUnescapeAppend(string_view from, mstring & to);
// Decode with result as return value, malformed sequences are passed through
mstring UrlUnescape(string_view from);

mstring BytesToHexString(const uint8_t b[], unsigned short binLength);
DLBR_API mstring EncodeBase64Auth(cmstring &sPwdString);

struct DLBR_API tErrnoFmter: public mstring
{
	tErrnoFmter(LPCSTR prefix = nullptr) { fmt(errno, prefix);}
	tErrnoFmter(cmstring& prefix) { fmt(errno, prefix.c_str());}
	tErrnoFmter(int errnoCode, LPCSTR prefix = nullptr) { fmt(errnoCode, prefix); }
private:
	void fmt(int errnoCode, LPCSTR prefix);
};

inline struct timeval MsecToTimeval(unsigned msec)
{
	return timeval { time_t(msec / 1000), suseconds_t((msec % 1000) * 1000) };
}

}

#endif // _META_H
