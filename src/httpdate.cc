#include "httpdate.h"

using namespace std;

namespace dlbr
{

#define IMF_FIXDATE "%a, %d %b %Y %H:%M:%S GMT"

unsigned tHttpDate::FormatTime(char *buf, size_t bufLen, const struct tm * src)
{
	if(bufLen < 30)
		return 0;
	auto len = strftime(buf, bufLen, IMF_FIXDATE, src);
	if (len == 0 || len >= bufLen)
	{
		buf[0] = 0;
		return 0;
	}
	return len;
}

unsigned tHttpDate::FormatTime(char *buf, size_t bufLen, const time_t cur)
{
	struct tm tmp;
	if (!gmtime_r(&cur, &tmp))
		return 0;
	return FormatTime(buf, bufLen, &tmp);
}

tHttpDate::tHttpDate(time_t val)
{
	buf[0] = 0;
	length = FormatTime(buf, sizeof(buf), val);
}

}
