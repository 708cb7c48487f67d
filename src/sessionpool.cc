#include "sessionpool.h"
#include "evabase.h"
#include "debug.h"

using namespace std;

namespace dlbr
{

tPermit::tPermit(tSessionPool *pool) : m_pool(pool)
{
}

void tPermit::reset()
{
	if (!m_pool)
		return;
	auto pool = move(m_pool);
	pool->Release();
}

tSessionPool::tSessionPool(unsigned capacity) :
		m_capacity(capacity ? capacity : 1), m_inUse(0), m_acquired(0), m_released(0)
{
}

TFinalAction tSessionPool::Acquire(tGrantHandler handler)
{
	ASSERT_HAVE_MAIN_THREAD;
	auto waiter = make_shared<tWaiter>(tWaiter { move(handler) });
	m_waiters.emplace_back(waiter);
	ScheduleDispatch();
	return TFinalAction([waiter]()
	{
		// the list entry is dropped by the next dispatch
		waiter->canceled = true;
		waiter->handler = tGrantHandler();
	});
}

void tSessionPool::Release()
{
	ASSERT(m_inUse > 0);
	--m_inUse;
	++m_released;
	LOG("permit released, in use: " << m_inUse.load());
	if (!m_waiters.empty())
		ScheduleDispatch();
}

void tSessionPool::ScheduleDispatch()
{
	if (m_bDispatchPending)
		return;
	m_bDispatchPending = true;
	evabase::Post([pin = as_lptr(this)]()
	{
		pin->Dispatch();
	});
}

void tSessionPool::Dispatch()
{
	m_bDispatchPending = false;
	while (!m_waiters.empty())
	{
		auto w = m_waiters.front();
		if (w->canceled)
		{
			m_waiters.pop_front();
			continue;
		}
		if (m_inUse >= m_capacity)
			return;
		m_waiters.pop_front();
		++m_inUse;
		++m_acquired;
		auto handler = move(w->handler);
		w->canceled = true;
		handler(tPermit(this));
	}
}

}
