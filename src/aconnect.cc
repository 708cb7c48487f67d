#include "aconnect.h"
#include "meta.h"
#include "acfg.h"
#include "sockio.h"
#include "evabase.h"
#include "debug.h"
#include "aevutil.h"
#include "acsmartptr.h"
#include "caddrinfo.h"

#include <algorithm>
#include <list>

#include <sys/types.h>
#include <sys/socket.h>

#include <event2/event.h>

using namespace std;

#define CONNECT_SYSCALL_RETRY_LIMIT 50
// seconds until the next candidate address is tried in parallel
#define NEXT_CANDIDATE_DELAY 3

namespace dlbr
{
static cmstring dnsError("Unknown DNS error");

struct ConnProbingContext : public tLintRefcounted
{
	time_t m_deadline;
	mstring target;
	uint16_t port;
	aconnector::tCallback m_cbReport;
	std::deque<tAddrEntry> m_targets;
	// linear search is sufficient for this amount of elements
	std::list<unique_fdevent> m_eventFds;
	mstring m_error2report;
	decltype (m_targets)::iterator m_cursor;
	void processDnsResult(CAddrInfoPtr);
	void step(int fd, short what);
	static void cbStep(int fd, short what, void* arg)
	{
		// the callback might finish the last reference
		auto pin = as_lptr((ConnProbingContext*)arg);
		pin->step(fd, what);
	}
	void retError(mstring, tComError flags);
	void retSuccess(int fd);
	void disable(int fd, int ec);
	void stop()
	{
		m_cbReport = aconnector::tCallback();
		// this should stop all events
		m_eventFds.clear();
	}
	void setError(string_view msg)
	{
		if (m_error2report.empty())
			m_error2report = msg;
	}
};

TFinalAction aconnector::Connect(cmstring& target, uint16_t port, tCallback cbReport, int timeout)
{
	auto ctx = make_lptr<ConnProbingContext>();
	if (timeout < 0)
		ctx->m_deadline = GetTime() + cfg::GetNetworkTimeout()->tv_sec;
	else if (timeout == 0)
		ctx->m_deadline = END_OF_TIME;
	else
		ctx->m_deadline = GetTime() + timeout;

	ctx->target = target;
	ctx->port = port;
	ctx->m_cbReport = move(cbReport);

	CAddrInfo::Resolve(ctx->target, ctx->port, [ctx](CAddrInfoPtr res)
	{
		ctx->processDnsResult(move(res));
	});
	return TFinalAction([ctx]()
	{
		ctx->stop();
	});
}

void ConnProbingContext::processDnsResult(CAddrInfoPtr res)
{
	LOGSTARTFUNC;
	if (!m_cbReport)
		return; // this was cancelled by the caller already!
	if (!res)
		return retError(dnsError, TRANS_DNS_NOTFOUND);
	auto errDns = res->getError();
	if (!errDns.empty())
		return retError(errDns, TRANS_DNS_NOTFOUND);
	m_targets = res->getTargets();
	if (m_targets.empty())
		return retError(dnsError, TRANS_DNS_NOTFOUND);
	m_cursor = m_targets.begin();
	step(-1, 0);
}

void ConnProbingContext::step(int fd, short what)
{
	LOGSTARTFUNCx(fd, what);
	if (!m_cbReport)
		return; // this was cancelled by the caller already!
	if (what & EV_WRITE)
	{
		// ok, some real socket became ready on connecting, let's doublecheck it
		int err;
		socklen_t optlen = sizeof(err);
		if(getsockopt(fd, SOL_SOCKET, SO_ERROR, (void*) &err, &optlen) == 0)
		{
			if (!err)
				return retSuccess(fd);
			disable(fd, err);
		}
		else
			disable(fd, errno);
	}
	else if (what & EV_TIMEOUT)
	{
		// candidate is slow, keep it running but don't wait for it anymore
		ldbg("slow candidate " << fd);
	}

	if (GetTime() > m_deadline)
		return retError("Connection timeout", TRANS_TIMEOUT);

	// open attempt for the selected next candidate, or any valid which comes after
	for (; m_cursor != m_targets.end(); m_cursor++)
	{
		unique_fd nextFd(::socket(m_cursor->ai_family, SOCK_STREAM, 0));
		if (!nextFd.valid())
		{
			setError(tErrnoFmter());
			continue;
		}

		set_connect_sock_flags(nextFd.get());

		unsigned i = CONNECT_SYSCALL_RETRY_LIMIT;
		int res;
		do
		{
			res = connect(nextFd.get(), (sockaddr*) & m_cursor->ai_addr, m_cursor->ai_addrlen);
		} while(res != 0 && errno == EINTR && i--);

		// can we get the connection immediately? Unlikely, but who knows
		if (res == 0)
		{
			auto rep = move(m_cbReport);
			stop();
			if (rep)
				rep({move(nextFd), se, 0});
			return;
		}

		if (errno != EINPROGRESS)
		{
			setError(tErrnoFmter(errno));
			continue;
		}
		timeval tmout { NEXT_CANDIDATE_DELAY, 0 };
		unique_fdevent pe(event_new(evabase::base, nextFd.get(), EV_WRITE | EV_PERSIST, cbStep, this));
		if (AC_LIKELY(pe.valid()))
		{
			// eventfd helper will care from now on
			nextFd.release();
			if (0 == event_add(pe.get(), &tmout))
			{
				m_eventFds.emplace_back(move(pe));
				// next candidate, when this one becomes slow
				m_cursor++;
				return;
			}
		}
		setError("Out of memory"sv);
	}
	// not success if got here, any active connection pending?
	if (m_eventFds.empty())
		return retError(m_error2report.empty() ? tErrnoFmter(EAFNOSUPPORT) : m_error2report, TRANS_TIMEOUT);
}

void ConnProbingContext::retError(mstring msg, tComError errHints)
{
	LOGSTARTFUNCx(msg);
	auto rep = move(m_cbReport);
	stop();
	if (rep)
		rep({unique_fd(), move(msg), errHints});
}

void ConnProbingContext::retSuccess(int fd)
{
	auto rep = move(m_cbReport);
	m_cbReport = decltype (m_cbReport)();

	auto it = find_if(m_eventFds.begin(), m_eventFds.end(), [fd](auto& el)
	{
		return event_get_fd(el.get()) == fd;
	});
	if (it == m_eventFds.end())
	{
		stop();
		if (rep)
			rep({unique_fd(), "Internal error", TRANS_INTERNAL_ERROR});
		return;
	}
	// get a naked event pointer without guard influence, the descriptor goes to the caller
	auto el = it->release();
	m_eventFds.erase(it);
	event_free(el);
	stop();
	if (rep)
		rep({unique_fd(fd), se, 0});
}

void ConnProbingContext::disable(int fd, int ec)
{
	LOGSTARTFUNCx(fd);
	auto it = find_if(m_eventFds.begin(), m_eventFds.end(), [fd](auto& el)
	{
		return event_get_fd(el.get()) == fd;
	});
	if (it == m_eventFds.end())
		return;
	// error from primary always wins, grab before closing it
	if (it == m_eventFds.begin())
		setError(tErrnoFmter(ec));
	// stop observing and release resources
	m_eventFds.erase(it);
}
}
