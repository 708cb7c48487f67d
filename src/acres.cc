#include "acres.h"
#include "aclock.h"
#include "ac3rdparty.h"
#include "evabase.h"
#include "acfg.h"
#include "linkreg.h"
#include "httpchunksrc.h"
#include "sessionpool.h"
#include "debug.h"

#include <ctime>

using namespace std;

namespace dlbr
{

const struct timeval idleTimeout { 30, 1};

class DLBR_API acresImpl : public acres
{
	std::unique_ptr<tBeatNotifier> idleClock;
	tSslConfig m_ssl_setup;
	unique_ptr<ILinkRegistry> m_links;
	unique_ptr<tHttpChunkSource> m_source;
	lint_ptr<tSessionPool> m_pool;
	aobservable::subscription m_shutdownSub, m_maintSub;

public:
	acresImpl()
	{
		idleClock = tBeatNotifier::Create(idleTimeout);

		if (cfg::linktable.empty())
		{
			log::err("No LinkTable configured, serving from an empty in-memory registry"sv);
			m_links = make_unique<tLinkTable>();
		}
		else
			m_links = make_unique<tLinkTableFile>(cfg::linktable);

		tHttpUrl upstream;
		if (!upstream.SetHttpUrl(cfg::upstreamurl))
			log::err(mstring("Invalid UpstreamUrl: ") + cfg::upstreamurl);
		m_source = make_unique<tHttpChunkSource>(*this, upstream, cfg::chunksize);
		m_pool = make_lptr<tSessionPool>(unsigned(cfg::maxsessions));

		m_maintSub = idleClock->AddListener([this]()
		{
			m_links->Maintain(time(nullptr));
		});
		m_shutdownSub = evabase::GetGlobal().subscribe([&]()
		{
			m_maintSub.reset();
			idleClock.reset();
			m_shutdownSub.reset();
		});
	}

	tBeatNotifier &GetIdleCheckBeat() override
	{
		return *idleClock;
	}
	tSslConfig &GetSslConfig() override
	{
		return m_ssl_setup;
	}
	ILinkRegistry& GetLinkRegistry() override
	{
		return *m_links;
	}
	IChunkSource& GetChunkSource() override
	{
		return *m_source;
	}
	tSessionPool& GetSessionPool() override
	{
		return *m_pool;
	}
};

acres *acres::Create()
{
	return new acresImpl;
}

}
