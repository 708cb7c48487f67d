#ifndef LINKREG_H
#define LINKREG_H

#include "actypes.h"
#include "fileio.h"

#include <atomic>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dlbr
{

//! Published file, immutable after publication
struct tFileDesc
{
	mstring handle;
	off_t totalSize = 0;
	mstring mimeType;
	mstring fileName;
	time_t createdAt = 0;
	// 0 means never
	time_t expiresAt = 0;

	bool IsExpired(time_t now) const { return expiresAt != 0 && expiresAt <= now; }
};
using tFileDescPtr = std::shared_ptr<const tFileDesc>;

enum class ELinkState
{
	FOUND,
	NOT_FOUND,
	EXPIRED
};

struct tLinkLookup
{
	ELinkState state = ELinkState::NOT_FOUND;
	tFileDescPtr desc;
};

/**
 * Read side of the token to file mapping. Lookups may run concurrently from any thread.
 */
class DLBR_API ILinkRegistry
{
public:
	virtual ~ILinkRegistry() =default;
	virtual tLinkLookup Resolve(string_view token, time_t now) =0;
	/**
	 * Periodic housekeeping, called from the idle beat.
	 * Expired entries stay resolvable as EXPIRED, only an explicit revoke or purge removes them.
	 */
	virtual void Maintain(time_t now) =0;
};

//! Tokens are non-empty and use only [A-Za-z0-9_-]
DLBR_API bool IsValidToken(string_view token);

/**
 * In-memory registry.
 */
class DLBR_API tLinkTable : public ILinkRegistry
{
	mutable std::shared_mutex m_mx;
	std::unordered_map<mstring, tFileDescPtr> m_index;

public:
	using tRecords = std::unordered_map<mstring, tFileDescPtr>;

	tLinkLookup Resolve(string_view token, time_t now) override;
	void Maintain(time_t) override {}

	//! @return False if the token is invalid or taken already
	bool Insert(cmstring& token, tFileDesc desc);
	bool Revoke(string_view token);
	//! Remove expired entries, return their count
	unsigned Purge(time_t now);
	//! Exchange the contents at once
	void Replace(tRecords&& records);
	size_t size() const;
};

/**
 * Registry fed by a link table file. The file is checked for modifications at
 * most once per LinkRescanInterval and reloaded if its fingerprint changed.
 */
class DLBR_API tLinkTableFile : public ILinkRegistry
{
	mstring m_path;
	tLinkTable m_table;
	std::mutex m_reloadMx;
	std::atomic<time_t> m_nextCheck;
	Cstat::tID m_fpr;
	bool m_bHaveFpr = false;
	bool m_bReportedMissing = false;

	void CheckReload(time_t now);

public:
	explicit tLinkTableFile(cmstring& path);
	tLinkLookup Resolve(string_view token, time_t now) override;
	void Maintain(time_t now) override;
	//! Read the file now, unconditionally. @return Empty string on success, error description otherwise
	mstring Reload(time_t now);
};

// link table file format helpers

mstring FormatLinkRecord(string_view token, const tFileDesc& desc);
//! @return False if the line is not a valid record
bool ParseLinkRecord(string_view line, mstring& token, tFileDesc& desc);

using tLinkRecordSink = std::function<void(mstring&& token, tFileDesc&& desc)>;
/**
 * @brief Read all records, invalid lines are reported to the error log and skipped.
 * @return Empty string on success, error description otherwise
 */
mstring LoadLinkRecords(cmstring& path, const tLinkRecordSink& sink);
mstring AppendLinkRecord(cmstring& path, string_view token, const tFileDesc& desc);

//! 24 lowercase hex characters from a cryptographically secure source, empty if the RNG failed
DLBR_API mstring GenerateToken();
//! Public download link, {base}/dl/{token}/{escaped name}, or {base}/{token} without a name
DLBR_API mstring BuildLinkUrl(string_view baseUrl, string_view token, string_view fileName);

}

#endif // LINKREG_H
