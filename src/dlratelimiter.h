#ifndef DLRATELIMITER_H
#define DLRATELIMITER_H

#include "acsmartptr.h"

extern "C"
{
struct bufferevent;
}

namespace dlbr
{

/**
 * Shared bandwidth limit for all client streams, according to MaxDlSpeed (KiB/s).
 */
class dlratelimiter : public tLintRefcounted
{
public:
	//! @return The limiter, or an empty pointer if no limit is configured
	static lint_ptr<dlratelimiter> GetSharedLimiter();
	virtual void AddStream(bufferevent* bev) =0;
	virtual void DetachStream(bufferevent* bev) =0;
};

using tRateLimiterPtr = lint_ptr<dlratelimiter>;

}

#endif // DLRATELIMITER_H
