#include "dlratelimiter.h"
#include "aevutil.h"
#include "evabase.h"
#include "acfg.h"

#include <event2/bufferevent.h>

namespace dlbr
{

#define PRECISSION 8

const struct timeval tickInterval
{
	0,
	1000000/PRECISSION
};

class limiterImpl : public dlratelimiter
{
public:
	struct ev_token_bucket_cfg *m_cfg;
	struct bufferevent_rate_limit_group *m_group = nullptr;

	limiterImpl()
	{
		auto spd = size_t(cfg::maxdlspeed) * 1024 / PRECISSION;
		m_cfg = ev_token_bucket_cfg_new(spd,
				spd,
				EV_RATE_LIMIT_MAX,
				EV_RATE_LIMIT_MAX,
				&tickInterval
				);
		if (m_cfg)
			m_group = bufferevent_rate_limit_group_new(evabase::base, m_cfg);
	}
	~limiterImpl()
	{
		if (m_group)
			bufferevent_rate_limit_group_free(m_group);
		if (m_cfg)
			ev_token_bucket_cfg_free(m_cfg);
	}

	void AddStream(bufferevent *bev) override
	{
		bufferevent_add_to_rate_limit_group(bev, m_group);
	}
	void DetachStream(bufferevent *bev) override
	{
		bufferevent_remove_from_rate_limit_group(bev);
	}
};

// the group lives as long as any stream uses it, or until the loop ends
static lint_ptr<dlratelimiter> g_cachedLimiter;
static TFinalAction g_limiterCleanup;

lint_ptr<dlratelimiter> dlratelimiter::GetSharedLimiter()
{
	if (cfg::maxdlspeed <= 0)
		return tRateLimiterPtr();
	if (g_cachedLimiter)
		return g_cachedLimiter;

	auto limiter = make_lptr<limiterImpl>();
	if (!limiter->m_cfg || !limiter->m_group)
		return tRateLimiterPtr();

	g_cachedLimiter = static_lptr_cast<dlratelimiter>(limiter);
	g_limiterCleanup = evabase::GetGlobal().subscribe([]()
	{
		g_cachedLimiter.reset();
		g_limiterCleanup.reset();
	});
	return g_cachedLimiter;
}

}
