#ifndef AOBSERVABLE_H
#define AOBSERVABLE_H

#include "actypes.h"
#include "acsmartptr.h"
#include "actemplates.h"

#include <memory>
#include <vector>

namespace dlbr
{

/**
 * Notification hub for loop wide events (shutdown, clock beats).
 *
 * Subscribers are called in the order of subscription, asynchronously from the event loop.
 * Several notify() calls before the delivery are merged into one.
 * A subscriber which is dropped while a delivery round runs is not called anymore in that round.
 */
class aobservable : public tLintRefcounted
{
public:
	// move-only, unsubscribes when destroyed
	using subscription = TFinalAction;

	aobservable() =default;
	virtual ~aobservable() =default;

	subscription subscribe(const tAction& newSubscriber) WARN_UNUSED;
	/**
	 * @return false if nobody listens or a delivery is already scheduled
	 */
	bool notify();
	bool hasObservers() const { return !m_slots.empty(); }

private:
	struct tSlot
	{
		tAction act;
		bool live = true;
	};
	std::vector<std::shared_ptr<tSlot>> m_slots;
	bool m_bNotifyPending = false;

	void drop(tSlot* which);
	void doNotify();
};

}

#endif // AOBSERVABLE_H
