#include "meta.h"
#include "sockio.h"
#include "debug.h"
#include "acfg.h"

#include <event2/event.h>
#include <event2/bufferevent.h>

#define HIGH_WM 128000

namespace dlbr
{
using namespace std;

const int yes(1);

void set_serving_sock_flags(evutil_socket_t fd)
{
	evutil_make_socket_nonblocking(fd);
	::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
	::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
}

void set_connect_sock_flags(evutil_socket_t fd)
{
	evutil_make_socket_nonblocking(fd);
}

void TuneSendWindow(bufferevent *bev)
{
	if (AC_LIKELY(cfg::sendwindow >= 0))
		return;
#if defined(SOL_SOCKET) && defined(SO_SNDBUF)
	auto fd = bufferevent_getfd(bev);
	int res;
	socklen_t optlen = sizeof(res);
	if(getsockopt(fd, SOL_SOCKET, SO_SNDBUF, (void*) &res, &optlen) == 0)
	{
		if (res > HIGH_WM)
			cfg::sendwindow = res;
	}
#endif
	if (cfg::sendwindow < HIGH_WM)
		cfg::sendwindow = HIGH_WM;
}

}
