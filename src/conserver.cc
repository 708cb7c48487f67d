#include "conserver.h"
#include "meta.h"
#include "acfg.h"
#include "caddrinfo.h"
#include "ahttpurl.h"
#include "astrop.h"
#include "sockio.h"
#include "fileio.h"
#include "evabase.h"
#include "aclock.h"
#include "conn.h"

#include <event2/event.h>

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>

#include <iostream>
#include <list>
#include <unordered_map>
#include <unordered_set>

#include "debug.h"

using namespace std;

namespace dlbr
{

int yes(1);

class conserverImpl : public conserver
{
	std::list<unique_fdevent> m_listeners;
	std::unordered_map<IConnBase*, lint_ptr<IConnBase>> m_conns;
	acres& m_res;
	aobservable::subscription m_resumeSub;

public:
	void ReleaseConnection(IConnBase *p) override
	{
		m_conns.erase(p);
	}

	size_t GetConnectionCount() override
	{
		return m_conns.size();
	}

	void SetupConAndGo(unique_fd&& man_fd, string clientName, LPCSTR clientPort)
	{
		USRDBG("Client name: " << clientName << ":" << clientPort);
		auto xp = StartServing(move(man_fd), move(clientName), m_res,
				[this](IConnBase* p) { ReleaseConnection(p); });
		if (xp)
			m_conns.emplace(xp.get(), xp);
	}

	static void do_accept(evutil_socket_t server_fd, short, void* arg)
	{
		LOGSTARTFUNCxs(server_fd);

		// lazy trigger of DNS configuration change check
		evabase::GetGlobal().GetDnsBase();
		auto& srv(*(conserverImpl*)arg);

		// pick all incoming connections in one run
		while(true)
		{
			struct sockaddr_storage addr;
			socklen_t addrlen = sizeof(addr);
			auto fd = accept(server_fd, (struct sockaddr*) &addr, &addrlen);

			if (fd == -1)
			{
				switch (errno)
				{
				case EMFILE:
				case ENFILE:
				case ENOBUFS:
				case ENOMEM:
					// OOM condition? Suspend all accepting for a while and hope that it will recover then
					log::err(tErrnoFmter("Cannot accept connections: "));
					for(auto& el: srv.m_listeners)
						event_del(el.get());
					srv.m_resumeSub = srv.m_res.GetIdleCheckBeat().AddListener([&srv]()
					{
						bool failed = false;
						for(auto& el: srv.m_listeners)
							failed |= (0 != event_add(el.get(), nullptr));
						if (!failed)
							srv.m_resumeSub.reset();
					});
					return;
				case EAGAIN:
				case EINTR:
				default:
					// listener will notify
					return;
				}
			}
			unique_fd man_fd(fd);

			char hbuf[NI_MAXHOST];
			char pbuf[11];
			if (getnameinfo((struct sockaddr*) &addr, addrlen, hbuf, sizeof(hbuf),
							pbuf, sizeof(pbuf), NI_NUMERICHOST|NI_NUMERICSERV))
			{
				USRERR("ERROR: could not resolve hostname for incoming TCP host");
				continue;
			}
			srv.SetupConAndGo(move(man_fd), hbuf, pbuf);
		}
	}

	void bind_and_listen(evutil_socket_t mSock, const addrinfo *pAddrInfo, uint16_t port)
	{
		LOGSTARTFUNCs;
		USRDBG("Binding " << tAddrEntry::formatIpPort(pAddrInfo->ai_addr, pAddrInfo->ai_addrlen, pAddrInfo->ai_family));
		if ( ::bind(mSock, pAddrInfo->ai_addr, pAddrInfo->ai_addrlen))
		{
			log::flush();
			perror("Couldn't bind socket");
			cerr.flush();
			if(EADDRINUSE == errno)
			{
				cerr << "Port " << port << " is busy, check for another running instance." <<endl;
				cerr.flush();
			}
			close(mSock);
			return;
		}

		if (listen(mSock, SO_MAXCONN))
		{
			perror("Couldn't listen on socket");
			close(mSock);
			return;
		}

		evutil_make_socket_nonblocking(mSock);
		evutil_make_socket_closeonexec(mSock);
		auto ev = event_new(evabase::base, mSock, EV_READ|EV_PERSIST, do_accept, this);
		if(!ev)
		{
			cerr << "Socket creation error" << endl;
			close(mSock);
			return;
		}
		event_add(ev, nullptr);
		m_listeners.emplace_back(ev);
	};

	void setup_tcp_listeners(LPCSTR addi, uint16_t port)
	{
		LOGSTARTFUNCxs(addi, port);
		USRDBG("Binding on host: " << addi << ", port: " << port);

		auto hints = addrinfo();
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		hints.ai_family = PF_UNSPEC;

		addrinfo* dnsret;
		int r = getaddrinfo(addi, ltos(port).c_str(), &hints, &dnsret);
		if(r)
		{
			log::flush();
			cerr << "Error resolving address for binding: " << gai_strerror(r) << endl;
			return;
		}
		TFinalAction dnsclean([dnsret]()
		{
			if(dnsret)
				freeaddrinfo(dnsret);
		});
		std::unordered_set<std::string> dedup;
		for(auto p = dnsret; p; p = p->ai_next)
		{
			// no fit or or seen before?
			if(!dedup.emplace((const char*) p->ai_addr, p->ai_addrlen).second)
				continue;
			int nSockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
			if (nSockFd == -1)
			{
				// STFU on lack of IPv6?
				switch(errno)
				{
				case EAFNOSUPPORT:
				case EPFNOSUPPORT:
				case ESOCKTNOSUPPORT:
				case EPROTONOSUPPORT:
					continue;
				default:
					perror("Error creating socket");
					continue;
				}
			}
			// if we have a dual-stack IP implementation (like on Linux) then
			// explicitly disable the shadow v4 listener, its behavior would depend on system settings
#if defined(IPV6_V6ONLY) && defined(SOL_IPV6)
			if(p->ai_family==AF_INET6)
				setsockopt(nSockFd, SOL_IPV6, IPV6_V6ONLY, &yes, sizeof(yes));
#endif
			setsockopt(nSockFd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
			bind_and_listen(nSockFd, p, port);
		}
	};

	bool Setup() override
	{
		LOGSTARTFUNCs;
		if (!cfg::port && cfg::bindaddr.empty())
		{
			cerr << "No TCP interface configured, cannot proceed." << endl;
			return false;
		}

		bool custom_listen_ip = false;
		tHttpUrl url;
		for(const auto& sp: tSplitWalk(cfg::bindaddr))
		{
			mstring token(sp);
			auto isUrl = url.SetHttpUrl(token, false);
			if(!isUrl && !cfg::port)
			{
				USRDBG("Not creating TCP listening socket for " <<  sp
					   << ", no custom nor default port specified!");
				continue;
			}
			setup_tcp_listeners(isUrl ? url.sHost.c_str() : token.c_str(),
								isUrl ? url.GetPort(cfg::port) : cfg::port);
			custom_listen_ip = true;
		}
		// just TCP_ANY if none was specified
		if(!custom_listen_ip)
			setup_tcp_listeners(nullptr, cfg::port);

		return ! m_listeners.empty();
	}

	void Abandon() override
	{
		m_listeners.clear();
		m_resumeSub.reset();
		// connections remove themselves while being torn down
		auto conns = move(m_conns);
		m_conns.clear();
		conns.clear();
	}

	conserverImpl(acres& res) : m_res(res) {}
};

lint_ptr<conserver> conserver::Create(acres &res)
{
	return static_lptr_cast<conserver>(make_lptr<conserverImpl>(res));
}

}
