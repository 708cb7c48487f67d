#ifndef HTTPDATE_H
#define HTTPDATE_H

#include "actypes.h"

#include <ctime>

namespace dlbr
{

/**
 * RFC 7231 IMF-fixdate representation, like "Sun, 06 Nov 1994 08:49:37 GMT".
 */
struct DLBR_API tHttpDate
{
	static unsigned FormatTime(char *buf, size_t bufLen, const struct tm*);
	static unsigned FormatTime(char *buf, size_t bufLen, const time_t cur);

	explicit tHttpDate(time_t val);

	string_view view() const { return string_view(buf, length); }
	bool isSet() const { return length != 0; }

private:
	char buf[30];
	unsigned length = 0;
};

}

#endif // HTTPDATE_H
