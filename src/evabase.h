#ifndef __EVABASE_H__
#define __EVABASE_H__

#include "actemplates.h"
#include "aobservable.h"

#include <atomic>
#include <thread>
#include <vector>

#define ASSERT_HAVE_MAIN_THREAD ASSERT(std::this_thread::get_id() == evabase::GetMainThreadId())

extern "C"
{
struct event_base;
struct event;
struct ares_channeldata;
}

namespace dlbr
{
extern std::atomic_bool g_shutdownHint;

/**
 * Resolver channel of c-ares, glued into the libevent loop.
 */
struct CDnsBase
{
	ares_channeldata* get() const { return m_channel; }
	void shutdown();
	~CDnsBase();

	// ares helpers
	void sync();
	void dropEvents();
	void setupEvents();

private:
	friend class evabase;
	ares_channeldata* m_channel = nullptr;
	CDnsBase(ares_channeldata* pBase) : m_channel(pBase) {}

	// activated when we want something from ares or ares from us
	event *m_aresSyncEvent = nullptr;
	std::vector<event*> m_aresEvents;
};

/**
 * This class is an adapter for general libevent handling. Partly static and
 * partly dynamic, for pure convenience! Expected to be a singleton anyway.
 *
 * Observers are notified once when the main loop has finished.
 */
class DLBR_API evabase : public aobservable
{
	CDnsBase* m_cachedDnsBase = nullptr;
	void InitDnsOrCheckCfgChange();
public:
	static event_base *base;

	static evabase& GetGlobal();
	CDnsBase* GetDnsBase();

	static std::thread::id GetMainThreadId();

	/**
	 * Runs the main loop for a program around the event_base loop.
	 * When finished, clean up some resources left behind (fire off specific events
	 * which have actions that would cause blocking otherwise).
	 */
	int MainLoop();

	static void SignalStop();

	/**
	 * @brief Post an action which will be run later (provided that the event loop is run), but the actions might be discarded in shutdown scenario.
	 */
	static void Post(tAction&&);

	static inline bool IsMainThread() { return GetMainThreadId() == std::this_thread::get_id(); }

	/**
	 * @brief IsShuttingDown is non-binding information about ongoing shutdown phase.
	 * @return True if shutdown was requested.
	 */
	bool IsShuttingDown() { return g_shutdownHint; }

	~evabase();
	void PushLoop();

	static lint_ptr<evabase> Create() { return lint_ptr<evabase>(new evabase); }

private:
	evabase();
};

}

#endif
