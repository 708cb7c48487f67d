#ifndef SESSIONPOOL_H
#define SESSIONPOOL_H

#include "actemplates.h"
#include "acsmartptr.h"

#include <atomic>
#include <functional>
#include <list>
#include <memory>

namespace dlbr
{

class tSessionPool;

/**
 * Permission to run a remote session. Returned to the pool when destroyed.
 */
class DLBR_API tPermit
{
	friend class tSessionPool;
	lint_ptr<tSessionPool> m_pool;
	explicit tPermit(tSessionPool* pool);

public:
	tPermit() =default;
	~tPermit() { reset(); }
	tPermit(tPermit&&) =default;
	tPermit& operator=(tPermit&& other)
	{
		if (this != &other)
		{
			reset();
			m_pool = std::move(other.m_pool);
		}
		return *this;
	}
	tPermit(const tPermit&) = delete;
	tPermit& operator=(const tPermit&) = delete;

	void reset();
	bool valid() const { return m_pool.get(); }
};

/**
 * Bounded pool of remote session permits. Waiters are served in FIFO order,
 * asynchronously from the event loop.
 */
class DLBR_API tSessionPool : public tLintRefcounted
{
public:
	using tGrantHandler = std::function<void(tPermit&&)>;

	explicit tSessionPool(unsigned capacity);

	/**
	 * @brief Request a permit, the handler is called later with it.
	 * @return Subscription, destroying it withdraws a waiter which was not served yet
	 */
	TFinalAction Acquire(tGrantHandler handler) WARN_UNUSED;

	unsigned GetCapacity() const { return m_capacity; }
	unsigned GetInUse() const { return m_inUse; }
	unsigned long GetAcquiredCount() const { return m_acquired; }
	unsigned long GetReleasedCount() const { return m_released; }
	size_t GetWaiterCount() const { return m_waiters.size(); }

private:
	friend class tPermit;
	struct tWaiter
	{
		tGrantHandler handler;
		bool canceled = false;
	};
	unsigned m_capacity;
	std::atomic<unsigned> m_inUse;
	std::atomic<unsigned long> m_acquired, m_released;
	std::list<std::shared_ptr<tWaiter>> m_waiters;
	bool m_bDispatchPending = false;

	void Release();
	void ScheduleDispatch();
	void Dispatch();
};

}

#endif // SESSIONPOOL_H
