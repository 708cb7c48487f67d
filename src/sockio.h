#ifndef SOCKIO_H_
#define SOCKIO_H_

#include "actypes.h"
#include "fileio.h"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>

#include <event2/util.h>

#ifndef AI_NUMERICSERV
#define AI_NUMERICSERV 0
#endif
#ifndef AI_ADDRCONFIG
#define AI_ADDRCONFIG 0
#endif

#ifndef SO_MAXCONN
#define SO_MAXCONN 250
#endif

extern "C"
{
struct bufferevent;
}

namespace dlbr
{

// common flags for a CONNECTING socket
void set_connect_sock_flags(evutil_socket_t fd);
void set_serving_sock_flags(evutil_socket_t fd);

//! Determine cfg::sendwindow from the socket buffer if it was not configured
void TuneSendWindow(bufferevent* bev);

}

#endif /*SOCKIO_H_*/
