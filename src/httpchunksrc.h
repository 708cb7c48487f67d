#ifndef HTTPCHUNKSRC_H
#define HTTPCHUNKSRC_H

#include "chunksrc.h"
#include "ahttpurl.h"

namespace dlbr
{
class acres;

/**
 * Chunk source backed by a remote HTTP(S) service which serves the files
 * as {base}/{handle} and supports byte range requests.
 *
 * Each chunk is fetched with its own range request; connections are kept
 * alive for the following chunks and shared through the transport cache.
 */
class DLBR_API tHttpChunkSource : public IChunkSource
{
	acres& m_res;
	tHttpUrl m_base;
	off_t m_granularity;
	mstring m_authHeader;

public:
	tHttpChunkSource(acres& res, const tHttpUrl& baseUrl, off_t granularity);
	off_t GetGranularity() const override { return m_granularity; }
	lint_ptr<IChunkCursor> Fetch(cmstring& handle, off_t offset, off_t maxLength) override;

	//! URL path of the remote resource
	mstring MakeRemotePath(cmstring& handle) const;
	const tHttpUrl& GetBaseUrl() const { return m_base; }
	cmstring& GetAuthHeader() const { return m_authHeader; }
	acres& GetResources() { return m_res; }
};

}

#endif // HTTPCHUNKSRC_H
