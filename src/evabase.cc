#include "evabase.h"
#include "meta.h"
#include "debug.h"
#include "acfg.h"
#include "fileio.h"

#include <deque>

#include <event2/event.h>
#include <event2/util.h>

#ifdef HAVE_SD_NOTIFY
#include <systemd/sd-daemon.h>
#endif

#include <ares.h>

using namespace std;

namespace dlbr
{

event_base* evabase::base = nullptr;

Cstat::tID cachedDnsFingerprint { { 0, 1 }, 0, 0, 0 };

struct event *handover_wakeup;
const struct timeval timeout_asap{0,0};
deque<tAction> temp_simple_q, local_simple_q;
void RejectPendingDnsRequests();
std::atomic_bool g_shutdownHint(false);

CDnsBase::~CDnsBase()
{
	shutdown();
}

void cb_sync_ares(evutil_socket_t, short, void* arg)
{
	// who knows what it has done with its FDs, simply recreating them all to be safe
	auto p=(CDnsBase*) arg;
	p->dropEvents();
	p->setupEvents();
}

void cb_ares_action(evutil_socket_t fd, short what, void* arg)
{
	auto p=(CDnsBase*) arg;
	if (what&EV_TIMEOUT)
		ares_process_fd(p->get(), ARES_SOCKET_BAD, ARES_SOCKET_BAD);
	else
	{
		auto toread = (what&EV_READ) ? fd : ARES_SOCKET_BAD;
		auto towrite = (what&EV_WRITE) ? fd : ARES_SOCKET_BAD;
		ares_process_fd(p->get(), toread, towrite);
	}
	// need to run another cycle asap
	p->sync();
}

void CDnsBase::sync()
{
	if (!m_aresSyncEvent)
		m_aresSyncEvent = evtimer_new(evabase::base, cb_sync_ares, this);
	if (m_aresSyncEvent)
		event_add(m_aresSyncEvent, &timeout_asap);
}

void CDnsBase::dropEvents()
{
	for (auto& el: m_aresEvents)
	{
		if (el)
			event_free(el);
	}
	m_aresEvents.clear();
}

void CDnsBase::setupEvents()
{
	if (!m_channel)
		return;
	ares_socket_t socks[ARES_GETSOCK_MAXNUM];
	auto bitfield = ares_getsock(m_channel, socks, ARES_GETSOCK_MAXNUM);
	struct timeval tvbuf;
	auto tmout = ares_timeout(m_channel, nullptr, &tvbuf);
	for(unsigned i = 0; i < ARES_GETSOCK_MAXNUM; ++i)
	{
		short what(0);
		if (ARES_GETSOCK_READABLE(bitfield, i))
			what |= EV_READ;
		if (ARES_GETSOCK_WRITABLE(bitfield, i))
			what |= EV_WRITE;
		if (!what)
			continue;
		auto ev = event_new(evabase::base, socks[i], what, cb_ares_action, this);
		if (!ev)
			continue;
		m_aresEvents.emplace_back(ev);
		event_add(ev, tmout);
	}
}

void CDnsBase::shutdown()
{
	if (m_channel)
	{
		// forceful DNS resolver shutdown, pending requests are reported as cancelled
		ares_destroy(m_channel);
	}
	dropEvents();
	if (m_aresSyncEvent)
		event_free(m_aresSyncEvent), m_aresSyncEvent = nullptr;

	m_channel = nullptr;
}

CDnsBase* evabase::GetDnsBase()
{
	InitDnsOrCheckCfgChange();
	return m_cachedDnsBase;
}

void evabase::InitDnsOrCheckCfgChange()
{
	Cstat info(cfg::dnsresconf);
	// still the same? A missing file is fine when a resolver exists already
	if (m_cachedDnsBase && (!info || cachedDnsFingerprint == info.fpr()))
		return;

	ares_channel newDnsBase;
	switch(ares_init(&newDnsBase))
	{
	case ARES_SUCCESS:
		break;
	case ARES_EFILE:
		log::err("DNS system error, cannot read config file"sv);
		return;
	case ARES_ENOMEM:
		log::err("DNS system error, out of memory"sv);
		return;
	case ARES_ENOTINITIALIZED:
		log::err("DNS system error, faulty initialization sequence"sv);
		return;
	default:
		log::err("DNS system error, internal error"sv);
		return;
	}
	// ok, found new configuration and it can be applied
	delete m_cachedDnsBase;
	m_cachedDnsBase = new CDnsBase(newDnsBase);
	if (info)
		cachedDnsFingerprint = info.fpr();
}

evabase* g_eventBase;

evabase &evabase::GetGlobal()
{
	return *g_eventBase;
}

std::thread::id g_main_thread;

thread::id evabase::GetMainThreadId()
{
	return g_main_thread;
}

int evabase::MainLoop()
{
	LOGSTARTFUNCs;

	InitDnsOrCheckCfgChange(); // init DNS base

#ifdef HAVE_SD_NOTIFY
	sd_notify(0, "READY=1");
#endif

	int r = event_base_loop(evabase::base, EVLOOP_NO_EXIT_ON_EMPTY);

	// users shall release their resources now
	notify();

	// make sure that there are no actions from abandoned DNS bases waiting forever
	RejectPendingDnsRequests();
	PushLoop();

#ifdef HAVE_SD_NOTIFY
	sd_notify(0, "STOPPING=1");
#endif

	return r;
}

void evabase::SignalStop()
{
	g_shutdownHint = true;

	Post([]()
	{
		if(evabase::base)
			event_base_loopbreak(evabase::base);
	});
}

void cb_handover(evutil_socket_t, short, void*)
{
	temp_simple_q.swap(local_simple_q);

	if (temp_simple_q.empty())
		return;

	// actions may post more actions, those land in the other queue
	for (const auto& ac: temp_simple_q)
		ac();
	temp_simple_q.clear();
}

void evabase::Post(tAction&& act)
{
	if (!act)
		return;

	ASSERT(IsMainThread());

	local_simple_q.emplace_back(move(act));
	ASSERT(handover_wakeup);
	event_add(handover_wakeup, &timeout_asap);
}

evabase::evabase()
{
	g_main_thread = std::this_thread::get_id();
	evabase::base = event_base_new();
	if (!evabase::base)
		throw std::bad_alloc();
	handover_wakeup = evtimer_new(base, cb_handover, nullptr);
	if (!handover_wakeup)
		throw std::bad_alloc();
	g_eventBase = this;
	g_shutdownHint = false;
}

evabase::~evabase()
{
	delete m_cachedDnsBase;
	m_cachedDnsBase = nullptr;

	if (handover_wakeup)
	{
		event_free(handover_wakeup);
		handover_wakeup = nullptr;
	}
	local_simple_q.clear();
	temp_simple_q.clear();

	if(evabase::base)
	{
		event_base_free(evabase::base);
		evabase::base = nullptr;
	}
	if (g_eventBase == this)
		g_eventBase = nullptr;
}

void evabase::PushLoop()
{
	// push the loop a few times to make sure that the state change
	// is propagated to the consumers
	for (int i = 10; i >= 0; --i)
	{
		// if error or nothing more to do...
		if (0 != event_base_loop(base, EVLOOP_NONBLOCK))
			break;
	}
}

}
