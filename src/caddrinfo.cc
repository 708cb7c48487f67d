#include "caddrinfo.h"
#include "meta.h"
#include "acfg.h"
#include "debug.h"
#include "evabase.h"
#include "sockio.h"

#include <algorithm>
#include <list>
#include <map>
#include <unordered_map>

#include <ares.h>

using namespace std;

/**
 * The CAddrInfo has multiple jobs:
 * - cache the resolution results for a specific time span
 * - in case of parallel ongoing resolution requests, coordinate the wishes so that the result is reused (and all callers are notified)
 */

namespace dlbr
{
static const unsigned DNS_CACHE_MAX = 255;
static const unsigned DNS_ERROR_KEEP_MAX_TIME = 10;
static const unsigned MAX_ADDR = 10;
static const string dns_error_status_prefix("DNS error, ");

mstring tAddrEntry::formatIpPort(const sockaddr *pAddr, socklen_t addrLen, int ipFamily)
{
	char buf[300], pbuf[30];
	if (getnameinfo(pAddr, addrLen, buf, sizeof(buf), pbuf, sizeof(pbuf), NI_NUMERICHOST | NI_NUMERICSERV))
		return "<unknown>";
	return string(ipFamily == PF_INET6 ? "[" : "") +
			buf +
			(ipFamily == PF_INET6 ? "]" : "") +
			":" + pbuf;
}

bool tAddrEntry::operator==(const tAddrEntry &other) const
{
	return this == &other ||
			(other.ai_addrlen == ai_addrlen &&
			 other.ai_family == ai_family &&
			 memcmp(&ai_addr, &other.ai_addr, ai_addrlen) == 0);
}

tAddrEntry::operator mstring() const
{
	return formatIpPort((const sockaddr *) &ai_addr, ai_addrlen, ai_family);
}

tAddrEntry::tAddrEntry(const ares_addrinfo_node *src)
	: ai_family(src->ai_family), ai_addrlen(src->ai_addrlen)
{
	memset(&ai_addr, 0, sizeof(ai_addr));
	memcpy(&ai_addr, src->ai_addr, min(size_t(ai_addrlen), sizeof(ai_addr)));
}

// using ordered map because of iterator stability, needed for expiration queue
map<string,CAddrInfoPtr> dns_cache;
deque<decltype(dns_cache)::iterator> dns_exp_q;

// descriptor of a running DNS lookup, passed around with libevent callbacks
struct tDnsResContext
{
	string sHost, sPort;
	list<CAddrInfo::tDnsResultReporter> cbs;
};
unordered_map<string,tDnsResContext*> g_active_resolver_index;

/**
 * Trash old entries and keep purging until there is enough space for at least one new entry.
 */
void CAddrInfo::clean_dns_cache()
{
	auto now = GetTime();
	while(!dns_exp_q.empty() && (dns_cache.size() >= DNS_CACHE_MAX-1
			|| dns_exp_q.front()->second->m_expTime <= now))
	{
		dns_cache.erase(dns_exp_q.front());
		dns_exp_q.pop_front();
	}
}

void CAddrInfo::cb_dns(void *arg,
		int status,
		int /* timeouts */,
		struct ares_addrinfo *results)
{
	// take ownership
	unique_ptr<tDnsResContext> args((tDnsResContext*)arg);
	auto key = args->sHost + ":" + args->sPort;
	g_active_resolver_index.erase(key);
	auto ret = make_shared<CAddrInfo>();
	TFinalAction invoke_cbs([&args, &ret, results]()
	{
		if (results)
			ares_freeaddrinfo(results);
		for(auto& it: args->cbs)
			it(ret);
	});

	auto keepError = GetTime() + std::min(cfg::dnscachetime, (int) DNS_ERROR_KEEP_MAX_TIME);

	switch (status)
	{
	case ARES_SUCCESS:
		break;
	case ARES_ENOTFOUND:
		ret->m_sError = dns_error_status_prefix + "host not found";
		return;
	case ARES_ECANCELLED:
	case ARES_EDESTRUCTION:
		ret->m_sError = dns_error_status_prefix + "temporary resolution error";
		return;
	default:
		ret->m_sError = dns_error_status_prefix + ares_strerror(status);
		return;
	}

	// something (localhost) can be resolved twice for each family
	std::deque<tAddrEntry> q4, q6;
	for (auto pCur = results ? results->nodes : nullptr; pCur; pCur = pCur->ai_next)
	{
		if (pCur->ai_socktype != SOCK_STREAM || pCur->ai_protocol != IPPROTO_TCP)
			continue;
		if (pCur->ai_family != PF_INET && pCur->ai_family != PF_INET6)
			continue;
		tAddrEntry svAddr(pCur);
		auto& q = pCur->ai_family == PF_INET6 ? q6 : q4;
		if (find(q.begin(), q.end(), svAddr) != q.end())
			continue;
		q.emplace_back(svAddr);
	}

	// alternate the families, starting with the preferred one from the resolver
	bool sel6 = results && results->nodes && results->nodes->ai_family == PF_INET6;
	while (!q4.empty() || !q6.empty())
	{
		auto& q = sel6 ? q6 : q4;
		if (!q.empty())
		{
			if (ret->m_orderedInfos.size() < MAX_ADDR)
				ret->m_orderedInfos.emplace_back(q.front());
			q.pop_front();
		}
		sel6 = !sel6;
	}
#ifdef DEBUG
	for (auto& it: ret->m_orderedInfos)
		DBGQLOG("Resolved: " << mstring(it));
#endif

	if (!ret->m_orderedInfos.empty())
		ret->m_expTime = GetTime() + cfg::dnscachetime;
	else
	{
		// nothing found? Report a common error then.
		ret->m_expTime = keepError;
		ret->m_sError = dns_error_status_prefix + "no usable address";
	}

	if (cfg::dnscachetime > 0) // keep a copy for other users
	{
		clean_dns_cache();
		auto newIt = dns_cache.emplace(key, ret);
		if (newIt.second)
			dns_exp_q.push_back(newIt.first);
	}
}

void CAddrInfo::Resolve(cmstring & sHostname, uint16_t nPort, tDnsResultReporter rep)
{
	auto sPort = to_string(nPort);
	auto ctx = make_shared<tDnsResContext>(tDnsResContext {
		sHostname, sPort, list<CAddrInfo::tDnsResultReporter> {move(rep)}
	});
	evabase::Post([ctx]()
	{
		LOGSTARTFUNCxs(ctx->sHost);

		if (AC_UNLIKELY(evabase::GetGlobal().IsShuttingDown()))
			return ctx->cbs.front()(make_shared<CAddrInfo>("System shutting down"sv));

		auto key = ctx->sHost + ":" + ctx->sPort;
		if(cfg::dnscachetime > 0)
		{
			clean_dns_cache();
			auto caIt = dns_cache.find(key);
			if(caIt != dns_cache.end())
				return ctx->cbs.front()(caIt->second);
		}
		auto resIt = g_active_resolver_index.find(key);
		// join the waiting crowd, move all callbacks to there...
		if(resIt != g_active_resolver_index.end())
		{
			resIt->second->cbs.splice(resIt->second->cbs.end(), ctx->cbs);
			return;
		}

		// ok, this is fresh, invoke a completely new DNS lookup operation
		auto resolver = evabase::GetGlobal().GetDnsBase();
		if (AC_UNLIKELY(!resolver || !resolver->get()))
			return ctx->cbs.front()(make_shared<CAddrInfo>("Bad DNS configuration"sv));

		static const ares_addrinfo_hints default_connect_hints =
		{
			// we provide plain port numbers, no resolution needed
			// also return only probably working addresses
			AI_NUMERICSERV | AI_ADDRCONFIG,
			PF_UNSPEC,
			SOCK_STREAM, IPPROTO_TCP
		};
		// to be owned by the operation
		auto pRaw = new tDnsResContext(move(*ctx));
		g_active_resolver_index[key] = pRaw;
		ares_getaddrinfo(resolver->get(),
				pRaw->sHost.c_str(),
				pRaw->sPort.c_str(),
				&default_connect_hints, CAddrInfo::cb_dns, pRaw);
		resolver->sync();
	});
}

void RejectPendingDnsRequests()
{
	for (auto& el: g_active_resolver_index)
	{
		if (!el.second)
			continue;

		for (const auto& action: el.second->cbs)
			action(make_shared<CAddrInfo>("System shutting down"sv));
		el.second->cbs.clear();
	}
	dns_cache.clear();
	dns_exp_q.clear();
}

}
