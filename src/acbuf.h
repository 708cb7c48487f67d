#ifndef ACBUF_H_
#define ACBUF_H_

#include "actypes.h"

#include <charconv>
#include <cstdlib>
#include <new>
#include <type_traits>
#include <utility>

extern "C"
{
struct evbuffer;
struct bufferevent;
}

namespace dlbr
{

/**
 * Simple buffer class, continuous memory with read and write position.
 * Read window is [rptr(), rptr()+size()), write window is [wptr(), wptr()+freecapa()).
 */
class DLBR_API acbuf
{
public:
	acbuf() =default;
	virtual ~acbuf() { free(m_buf); }
	inline bool empty() const { return w == r;}
	//! Count of the data inside
	inline size_t size() const { return w - r;}
	//! Returns capacity
	//! Erase all characters, reset the positions
	inline void clear() { w = r = 0; }
	//! Returns pointer to the first valid data byte
	inline char *rptr() { return m_buf + r; }
	inline const char *rptr() const { return m_buf + r; }
	//! Equivalent to rptr()
	inline const char *c_str() const { return rptr(); }
	//! Pointer to the first byte of the writable area
	inline char *wptr() { return m_buf + w; }
	//! Free space at the end
	inline size_t freecapa() const { return m_nCapacity - w; }
	//! Mark external data as added
	inline void got(size_t n) { w += n; if (m_buf) m_buf[w] = 0; }
	//! Mark data as consumed
	inline void drop(size_t n) { r += n; if (r == w) clear(); }
	//! Move the readable data to the beginning of the buffer
	void move();
	//! Resize the buffer, fails when the new size would truncate the data
	bool setsize(size_t capacity);
	//! Make sure that at least N more bytes can be appended
	bool reserve_atleast(size_t n);

	string_view view() const { return string_view(rptr(), size()); }

SUTPROTECTED:
	size_t r = 0, w = 0, m_nCapacity = 0;
	char *m_buf = nullptr;

private:
	acbuf(const acbuf&) = delete;
	acbuf& operator=(const acbuf&) = delete;
};

/**
 * Growing string buffer with stream-like formatting operators.
 */
class DLBR_API tSS : public acbuf
{
public:
	enum class imode : uint8_t
	{
		dec, hex
	};
	explicit tSS(size_t sz = 0)
	{
		if (sz && !setsize(sz))
			throw std::bad_alloc();
	}
	tSS(tSS&& src) noexcept : m_fmtmode(src.m_fmtmode)
	{
		std::swap(r, src.r);
		std::swap(w, src.w);
		std::swap(m_nCapacity, src.m_nCapacity);
		std::swap(m_buf, src.m_buf);
	}

	tSS& operator<<(string_view val);
	tSS& operator<<(const char *val) { return *this << string_view(val ? val : "(null)"); }
	tSS& operator<<(cmstring& val) { return *this << string_view(val); }
	tSS& operator<<(char c) { return *this << string_view(&c, 1); }
	tSS& operator<<(imode m) { m_fmtmode = m; return *this; }
	tSS& operator<<(bool b) { return *this << (b ? '1' : '0'); }
	tSS& operator<<(const void* p);

	template<typename T, typename = std::enable_if_t<std::is_integral<T>::value
			&& !std::is_same<T, char>::value && !std::is_same<T, bool>::value>>
	tSS& operator<<(T n)
	{
		char buf[24];
		auto res = std::to_chars(buf, buf + sizeof(buf), n, m_fmtmode == imode::hex ? 16 : 10);
		return *this << string_view(buf, res.ptr - buf);
	}

	operator string_view() const { return view(); }
	mstring str() const { return mstring(rptr(), size()); }
	tSS& clean() { clear(); return *this; }

private:
	imode m_fmtmode = imode::dec;
};

/**
 * Formatter which appends to an evbuffer, ready to be flushed by libevent.
 */
class DLBR_API ebstream
{
	evbuffer* m_eb;
	tSS::imode m_fmtmode = tSS::imode::dec;
public:
	using imode = tSS::imode;
	explicit ebstream(evbuffer* eb) : m_eb(eb) {}
	explicit ebstream(bufferevent* be);

	ebstream& operator<<(string_view val);
	ebstream& operator<<(const char *val) { return *this << string_view(val ? val : "(null)"); }
	ebstream& operator<<(cmstring& val) { return *this << string_view(val); }
	ebstream& operator<<(char c) { return *this << string_view(&c, 1); }
	ebstream& operator<<(imode m) { m_fmtmode = m; return *this; }
	ebstream& operator<<(const tSS& fmt) { return *this << fmt.view(); }

	template<typename T, typename = std::enable_if_t<std::is_integral<T>::value
			&& !std::is_same<T, char>::value && !std::is_same<T, bool>::value>>
	ebstream& operator<<(T n)
	{
		char buf[24];
		auto res = std::to_chars(buf, buf + sizeof(buf), n, m_fmtmode == imode::hex ? 16 : 10);
		return *this << string_view(buf, res.ptr - buf);
	}
	//! Drop all data in the target buffer
	void clear();
	evbuffer* buf() { return m_eb; }
};

}

#endif /* ACBUF_H_ */
