#include "aobservable.h"
#include "evabase.h"
#include "debug.h"

#include <algorithm>

using namespace std;

namespace dlbr
{

aobservable::subscription aobservable::subscribe(const tAction &newSubscriber)
{
	ASSERT_HAVE_MAIN_THREAD;

	if (!newSubscriber)
		return subscription();
	auto slot = make_shared<tSlot>();
	slot->act = newSubscriber;
	m_slots.emplace_back(slot);
	return TFinalAction([pin = as_lptr(this), which = slot.get()]()
	{
		pin->drop(which);
	});
}

void aobservable::drop(tSlot* which)
{
	ASSERT_HAVE_MAIN_THREAD;
	auto it = find_if(m_slots.begin(), m_slots.end(),
			[which](const shared_ptr<tSlot>& p) { return p.get() == which; });
	if (it == m_slots.end())
		return;
	// a running delivery round might still hold it
	(**it).live = false;
	m_slots.erase(it);
}

bool aobservable::notify()
{
	ASSERT_HAVE_MAIN_THREAD;
	if (m_slots.empty() || m_bNotifyPending)
		return false;
	m_bNotifyPending = true;
	evabase::Post([me = as_lptr(this)] ()
	{
		me->doNotify();
	});
	return true;
}

void aobservable::doNotify()
{
	ASSERT_HAVE_MAIN_THREAD;

	m_bNotifyPending = false;
	// subscribers may come and go from the callbacks
	auto round = m_slots;
	for (auto& slot: round)
	{
		if (slot->live && slot->act)
			slot->act();
	}
}

}
