#ifndef ACLOCK_H
#define ACLOCK_H

#include "aobservable.h"

#include <memory>

extern "C"
{
struct timeval;
}

namespace dlbr
{

/**
 * @brief Periodic timer on the main event loop.
 */
class tClock
{
public:
	tClock(const struct timeval& interval);
	virtual ~tClock();
	virtual void OnClockTimeout() = 0;
	struct XD;
	XD *m_data;
protected:
	void Suspend();
	void Resume();
};

/**
 * @brief Little helper which runs callbacks periodically, as long as anyone is listening.
 */
class tBeatNotifier
{
public:
	virtual ~tBeatNotifier() =default;
	virtual aobservable::subscription AddListener(const tAction&) =0;
	static std::unique_ptr<tBeatNotifier> Create(const struct timeval&);
};

}

#endif // ACLOCK_H
