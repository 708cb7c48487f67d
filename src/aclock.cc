#include "aclock.h"
#include "aevutil.h"
#include "evabase.h"

#include <cstring>

namespace dlbr
{

class tBeatNotifierImpl : public tBeatNotifier, public tClock
{
	lint_ptr<aobservable> m_notifier;
public:

	aobservable::subscription AddListener(const tAction& act) override
	{
		Resume();
		return m_notifier->subscribe(act);
	}
	// constructed in suspended state
	tBeatNotifierImpl(const struct timeval& interval) : tClock(interval), m_notifier(make_lptr<aobservable>())
	{
	}

	void OnClockTimeout() override
	{
		// nobody listens anymore, sleep until the next subscription
		if (!m_notifier->hasObservers())
			return Suspend();
		m_notifier->notify();
	}
};

std::unique_ptr<tBeatNotifier> tBeatNotifier::Create(const timeval &val)
{
	return std::unique_ptr<tBeatNotifier>(new tBeatNotifierImpl(val));
}

struct tClock::XD
{
	struct timeval m_interval;
	bool m_bEnabled = false;
	unique_event m_event;
};

void cbClock(evutil_socket_t, short, void *arg)
{
	auto me = ((tClock*)arg);
	me->OnClockTimeout();
	if (me->m_data->m_bEnabled)
		event_add(me->m_data->m_event.get(), & me->m_data->m_interval);
}

tClock::tClock(const timeval &interval)
{
	m_data = new XD;
	memcpy(& m_data->m_interval, &interval, sizeof(interval));
	m_data->m_event.reset(event_new(evabase::base, -1, EV_TIMEOUT, cbClock, this));
	if (!m_data->m_event.valid())
	{
		delete m_data;
		throw std::bad_alloc();
	}
}

tClock::~tClock()
{
	delete m_data;
}

void tClock::Suspend()
{
	if (!m_data->m_bEnabled)
		return;
	m_data->m_bEnabled = false;
	event_del(m_data->m_event.get());
}

void tClock::Resume()
{
	if (m_data->m_bEnabled)
		return;
	m_data->m_bEnabled = true;
	event_add(m_data->m_event.get(), & m_data->m_interval);
}

}
