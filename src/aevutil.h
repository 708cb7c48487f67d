#ifndef AEVUTIL_H
#define AEVUTIL_H

#include "actypes.h"
#include "actemplates.h"

#include <climits>
#include <new>

#include <event2/event.h>
#include <event2/buffer.h>
extern "C"
{
struct bufferevent;
// this is to REMOVE data
struct evbuffer *bufferevent_get_input(struct bufferevent *bufev);
// this is to ADD data
struct evbuffer *bufferevent_get_output(struct bufferevent *bufev);
void bufferevent_free(struct bufferevent*);
}

#define CHECK_ALLOCATED(what) if (!(what)) throw std::bad_alloc();

namespace dlbr
{

inline evbuffer* besender(bufferevent* be) { return bufferevent_get_output(be); }
inline evbuffer* bereceiver(bufferevent* be) { return bufferevent_get_input(be); }

using unique_event = auto_raii<event*, event_free, nullptr>;
using unique_eb = auto_raii<evbuffer*, evbuffer_free, nullptr>;

inline unique_eb make_eb()
{
	unique_eb ret(evbuffer_new());
	CHECK_ALLOCATED(ret.get());
	return ret;
}

/**
 * @brief be_free_close releases the bufferevent AND closes the socket manually.
 */
void be_free_close(bufferevent*);
/**
 * @brief be_flush_free_close delivers the pending output, waits for the peer
 * to confirm the shutdown and closes the socket afterwards.
 */
void be_flush_free_close(bufferevent*);

/**
 * This will simply finish the bufferent by freeing, closing of the FD must be handled by bufferevent (... CLOSE_ON_FREE)
 */
using unique_bufferevent = auto_raii<bufferevent*, bufferevent_free, nullptr>;
/**
 * Flush the outgoing data by getting the confirmation from peer,
 * then free the event when finishing and close its FD explicitly.
 */
using unique_bufferevent_flushclosing = auto_raii<bufferevent*, be_flush_free_close, nullptr>;

inline ssize_t eb_move_range(evbuffer* src, evbuffer *tgt, size_t len)
{
	auto have = evbuffer_get_length(src);
	if (have == 0)
		return 0;

	if (len > have)
		len = have;

	ssize_t total = 0;
	do {
		auto limited = len > INT_MAX;
		int limit = limited ? INT_MAX : len;
		auto n = evbuffer_remove_buffer(src, tgt, limit);
		if (n < 0)
			return total ? total : n;
		total += n;
		if (!limited || n < limit)
			return total;
		len -= limit;
	}
	while (len > 0);
	return total;
}

}
#endif // AEVUTIL_H
