#include "debug.h"
#include "meta.h"
#include "conn.h"
#include "acfg.h"
#include "job.h"
#include "header.h"
#include "acbuf.h"
#include "sockio.h"
#include "evabase.h"
#include "acsmartptr.h"
#include "dlratelimiter.h"

#include <deque>

#include <event2/bufferevent.h>

using namespace std;

namespace dlbr
{

#ifdef DEBUG
int g_connId = 0;
#endif

class connImpl : public IConnBase
{
	bool m_bTerminated = false;
	// no more requests are accepted on this connection
	bool m_bStopReading = false;

	acres& m_res;
	unique_bufferevent_flushclosing m_be;
	mstring m_sClientHost;
	tConnReleaser m_onFinish;
	tRateLimiterPtr m_limiter;

	header m_h;
	deque<job> m_jobs;

#ifdef DEBUG
	int m_connId = g_connId++;
#endif

public:
	connImpl(mstring&& clientName, acres& res, tConnReleaser&& onFinish) :
		m_res(res),
		m_sClientHost(move(clientName)),
		m_onFinish(move(onFinish))
	{
		LOGSTARTFUNCx(m_sClientHost);
	}

	virtual ~connImpl()
	{
		LOGSTARTFUNC;
		// order matters, the jobs report to us while being destroyed
		m_jobs.clear();
		DetachLimiter();
	}
private:
	void DetachLimiter()
	{
		if (m_limiter && m_be.valid())
			m_limiter->DetachStream(*m_be);
		m_limiter.reset();
	}

	void requestShutdown()
	{
		if (m_bTerminated)
			return;
		m_bTerminated = true;
		auto rel = move(m_onFinish);
		m_onFinish = tConnReleaser();
		if (rel)
			rel(this);
	}

public:
	void poke(uint_fast32_t jobId) override
	{
		LOGSTARTFUNCx(jobId);
		NONDEBUGVOID(jobId);
		if (AC_UNLIKELY(m_bTerminated || !m_be.valid()))
			return;
		auto pin = as_lptr(this);
		continueJobs();
	}

	void spawn(unique_bufferevent_flushclosing&& pBE)
	{
		LOGSTARTFUNC;
		m_be.reset(move(pBE));
		set_serving_sock_flags(bufferevent_getfd(*m_be));
		bufferevent_setcb(*m_be, cbRead, cbCanWrite, cbStatus, this);
		bufferevent_enable(*m_be, EV_WRITE|EV_READ);
		setReadTimeout(true);
		TuneSendWindow(*m_be);
		m_limiter = dlratelimiter::GetSharedLimiter();
		if (m_limiter)
			m_limiter->AddStream(*m_be);
	}

	static void cbStatus(bufferevent*, short what, void* ctx)
	{
		if (what & (BEV_EVENT_EOF | BEV_EVENT_ERROR | BEV_EVENT_TIMEOUT))
		{
			auto me = as_lptr((connImpl*)ctx);
			LOG("Client connection finished: " << what);
			// client is gone, the pending work is dropped silently
			me->m_jobs.clear();
			me->DetachLimiter();
			if (!evabase::GetGlobal().IsShuttingDown() && me->m_be.get())
				be_free_close(me->m_be.release());
			return me->requestShutdown();
		}
	}
	static void cbRead(bufferevent* pBE, void* ctx)
	{
		auto me = as_lptr((connImpl*)ctx);
		me->onRead(pBE);
	}

	static void cbCanWrite(bufferevent*, void* ctx)
	{
		auto me = as_lptr((connImpl*)ctx);
		if (!me->m_bTerminated)
			me->continueJobs();
	}

	void addRequest(ssize_t hSize)
	{
		LOGSTARTFUNCx(hSize);
		m_jobs.emplace_back(*this);
		auto& j = m_jobs.back();
		if (hSize < 0 || (m_h.type != header::GET && m_h.type != header::HEAD
				&& m_h.type != header::OTHER_METHOD))
		{
			m_bStopReading = true;
			j.PrepareFatalError(400, "bad_request"sv);
		}
		else
		{
			j.Prepare(m_h, m_res);
			if (m_h.type == header::OTHER_METHOD)
				m_bStopReading = true;
		}

		if (m_jobs.size() == 1)
			setReadTimeout(false);

		if (hSize > 0)
			evbuffer_drain(bereceiver(*m_be), hSize);
	}

	void onRead(bufferevent* pBE)
	{
		auto obuf = bereceiver(pBE);
		while (!m_bStopReading)
		{
			auto hSize = m_h.Load(obuf);
			if (hSize == 0)
				break; // more data to come in upcoming callback
			addRequest(hSize);
		}
		if (m_bStopReading)
		{
			// whatever comes now is not going to be processed
			evbuffer_drain(obuf, evbuffer_get_length(obuf));
		}
		continueJobs();
	}
	/**
	 * @brief continueJobs runs remaining jobs
	 */
	void continueJobs()
	{
		while (!m_jobs.empty())
		{
			auto jr = m_jobs.front().Resume(*m_be);
			switch (jr)
			{
			case job::eJobResult::R_DISCON:
			{
				DBGQLOG("Discon for " << m_jobs.front().GetId());
				m_jobs.clear();
				DetachLimiter();
				be_flush_free_close(m_be.release());
				return requestShutdown();
			}
			case job::eJobResult::R_DONE:
				m_jobs.pop_front();
				if (m_jobs.empty())
					setReadTimeout(true);
				continue;
			case job::eJobResult::R_WILLNOTIFY:
				return;
			}
		}
	}

	void setReadTimeout(bool set)
	{
		bufferevent_set_timeouts(*m_be, set ? cfg::GetNetworkTimeout() : nullptr, cfg::GetNetworkTimeout());
	}

	cmstring &getClientName() override
	{
		return m_sClientHost;
	}
};

lint_ptr<IConnBase> StartServing(unique_fd&& fd, string clientName, acres& res, tConnReleaser onFinish)
{
	evutil_make_socket_nonblocking(fd.get());
	evutil_make_socket_closeonexec(fd.get());
	// fd ownership moves to bufferevent closer
	unique_bufferevent_flushclosing be(bufferevent_socket_new(evabase::base, fd.release(), BEV_OPT_DEFER_CALLBACKS));
	if (!be.valid())
		return lint_ptr<IConnBase>();

	auto session = make_lptr<connImpl>(move(clientName), res, move(onFinish));
	session->spawn(move(be));
	return static_lptr_cast<IConnBase>(session);
}

}
