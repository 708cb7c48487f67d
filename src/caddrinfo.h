#ifndef CADDRINFO_H_
#define CADDRINFO_H_

#include "actypes.h"

#include <deque>
#include <functional>
#include <memory>

#include <sys/socket.h>
#include <netinet/in.h>

extern "C"
{
struct ares_addrinfo;
struct ares_addrinfo_node;
}

namespace dlbr
{

//! One resolved TCP target address
struct tAddrEntry
{
	sockaddr_storage ai_addr;
	int ai_family;
	socklen_t ai_addrlen;

	tAddrEntry(const ares_addrinfo_node*);
	bool operator==(const tAddrEntry& other) const;
	operator mstring() const;
	static mstring formatIpPort(const sockaddr *pAddr, socklen_t addrLen, int ipFamily);
};

class CAddrInfo;
using CAddrInfoPtr = std::shared_ptr<CAddrInfo>;

/**
 * Resolution result, either a list of addresses in connection order or an error message.
 */
class DLBR_API CAddrInfo
{
public:
	using tDnsResultReporter = std::function<void(CAddrInfoPtr)>;

	/**
	 * @brief Resolve asynchronously, the reporter is called from the main event loop later.
	 * Results are cached for DnsCacheSeconds, parallel lookups of the same target are joined.
	 */
	static void Resolve(cmstring& sHostname, uint16_t nPort, tDnsResultReporter);

	const std::deque<tAddrEntry>& getTargets() const { return m_orderedInfos; }
	cmstring& getError() const { return m_sError; }

	CAddrInfo() =default;
	explicit CAddrInfo(string_view errorMessage) : m_sError(errorMessage) {}

private:
	// resolution results (or error hint for caching)
	time_t m_expTime = 0;
	mstring m_sError;
	std::deque<tAddrEntry> m_orderedInfos;

	static void clean_dns_cache();
	static void cb_dns(void *arg, int status, int timeouts, struct ares_addrinfo *results);
};

//! Called on shutdown, reports an error to everyone still waiting for a result
void RejectPendingDnsRequests();

}

#endif /*CADDRINFO_H_*/
