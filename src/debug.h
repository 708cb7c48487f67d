#ifndef DEBUG_H_
#define DEBUG_H_

#include "aclogger.h"
#include "acbuf.h"

#include <cassert>

#define ASSERT(x) assert(x)

#ifdef DEBUG

namespace dlbr
{
/**
 * Function trace helper, prints the entry and exit lines with nesting indentation.
 */
class t_logger
{
	const char * m_szName;
	uintptr_t m_id;
	unsigned m_nLevel;
public:
	t_logger(const char *szFuncName, const void * ptr);
	~t_logger();
	void Write(const tSS& msg);
	template<typename... Targs>
	void Args(const Targs&... args)
	{
		tSS fmt;
		fmt << "args: "sv;
		((fmt << args << ", "sv), ...);
		Write(fmt);
	}
	t_logger(const t_logger&) = delete;
};
}

#define LOGSTART(x) t_logger __logobj(x, this);
#define LOGSTARTs(x) t_logger __logobj(x, nullptr);
#define LOGSTARTFUNC t_logger __logobj(__PRETTY_FUNCTION__, this);
#define LOGSTARTFUNCs t_logger __logobj(__PRETTY_FUNCTION__, nullptr);
#define LOGSTARTFUNCx(...) t_logger __logobj(__PRETTY_FUNCTION__, this); __logobj.Args(__VA_ARGS__);
#define LOGSTARTFUNCxs(...) t_logger __logobj(__PRETTY_FUNCTION__, nullptr); __logobj.Args(__VA_ARGS__);
#define LOG(x) { __logobj.Write(tSS() << x); }
#define ldbg(x) { ::dlbr::log::dbg(tSS() << x); }
#define dbgline ldbg("mark: " << __LINE__ << " in " << __FILE__)
#define DBGQLOG(x) ldbg(x)
#define IFDEBUG(x) x
#define IFDEBUGELSE(x, y) x
#define NONDEBUGVOID(x)

#else

#define LOGSTART(x)
#define LOGSTARTs(x)
#define LOGSTARTFUNC
#define LOGSTARTFUNCs
#define LOGSTARTFUNCx(...)
#define LOGSTARTFUNCxs(...)
#define LOG(x)
#define ldbg(x)
#define dbgline
#define DBGQLOG(x)
#define IFDEBUG(x)
#define IFDEBUGELSE(x, y) y
#define NONDEBUGVOID(x) (void) x

#endif

// user-configurable debug output, also in release builds
#define USRDBG(msg) { if(::dlbr::cfg::debug & ::dlbr::log::LOG_DEBUG) ::dlbr::log::err(tSS() << msg); }
#define USRERR(msg) { ::dlbr::log::err(tSS() << msg); }

#endif /* DEBUG_H_ */
