#ifndef ACRES_H
#define ACRES_H

#include "actypes.h"

namespace dlbr
{
class tBeatNotifier;
class tSslConfig;
class ILinkRegistry;
class IChunkSource;
class tSessionPool;

/**
 * @brief The acres class provides access to certain shared resources
 * - predefined notification clocks
 * - TLS client setup
 * - link registry, remote chunk source and the remote session pool
 */
class DLBR_API acres
{
public:
	virtual ~acres() =default;
	//! Production setup according to the configuration
	static acres* Create();
	virtual tBeatNotifier& GetIdleCheckBeat() =0;
	virtual tSslConfig &GetSslConfig() =0;
	virtual ILinkRegistry& GetLinkRegistry() =0;
	virtual IChunkSource& GetChunkSource() =0;
	virtual tSessionPool& GetSessionPool() =0;
};

}

#endif // ACRES_H
