#include "acbuf.h"

#include <cstring>

#include <event2/buffer.h>
#include <event2/bufferevent.h>

namespace dlbr
{

bool acbuf::setsize(size_t c)
{
	if(m_nCapacity == c)
		return true;
	if (c < w)
	{
		move();
		if (c < w)
			return false;
	}
	// one extra byte to keep the contents terminated
	auto p = (char*) realloc(m_buf, c + 1);
	if(!p)
		return false;
	m_buf = p;
	m_nCapacity = c;
	m_buf[w] = 0;
	return true;
}

void acbuf::move()
{
	if (!r)
		return;
	memmove(m_buf, m_buf + r, w - r);
	w -= r;
	r = 0;
	m_buf[w] = 0;
}

bool acbuf::reserve_atleast(size_t n)
{
	if (freecapa() >= n)
		return true;
	move();
	if (freecapa() >= n)
		return true;
	auto want = m_nCapacity * 2;
	if (want < w + n)
		want = w + n;
	if (want < 64)
		want = 64;
	return setsize(want);
}

tSS& tSS::operator<<(string_view val)
{
	if (val.empty())
		return *this;
	if (!reserve_atleast(val.size()))
		throw std::bad_alloc();
	memcpy(wptr(), val.data(), val.size());
	got(val.size());
	return *this;
}

tSS& tSS::operator<<(const void* p)
{
	auto oldMode = m_fmtmode;
	*this << "0x"sv << imode::hex << uintptr_t(p);
	m_fmtmode = oldMode;
	return *this;
}

ebstream::ebstream(bufferevent *be) : m_eb(bufferevent_get_output(be))
{
}

ebstream& ebstream::operator<<(string_view val)
{
	if (val.empty())
		return *this;
	if (0 != evbuffer_add(m_eb, val.data(), val.length()))
		throw std::bad_alloc();
	return *this;
}

void ebstream::clear()
{
	evbuffer_drain(m_eb, evbuffer_get_length(m_eb));
}

}
