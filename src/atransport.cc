#include "atransport.h"
#include "acfg.h"
#include "evabase.h"
#include "aconnect.h"
#include "fileio.h"
#include "meta.h"
#include "acres.h"
#include "debug.h"
#include "ac3rdparty.h"

#include <map>

#include <event2/event.h>
#include <event2/bufferevent.h>
#include <event2/bufferevent_ssl.h>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

using namespace std;

namespace dlbr
{

const mstring pfxSslError("Fatal TLS error: "sv);

using unique_ssl = auto_raii<SSL*,SSL_free,nullptr>;

#define CACHE_SIZE_MAX 42
#define REUSE_TIMEOUT_LIMIT 31

using tConnCache = multimap<string, lint_ptr<atransport>>;

/**
 * @brief Basic container with on-demand initialization and controlled shutdown.
 */
class ConnCacher
{
	unique_ptr<tConnCache> m_cache;
	TFinalAction sub;
public:
	tConnCache& get()
	{
		if (!m_cache)
		{
			m_cache = make_unique<tConnCache>();
			sub = evabase::GetGlobal().subscribe([&](){ m_cache.reset(); sub.reset(); });
		}
		return *m_cache;
	}
	bool Full() {return get().size() > CACHE_SIZE_MAX; }
} g_con_cache;

static const timeval* GetKeepTimeout()
{
	static timeval expirationTimeout { 0, 1 };
	expirationTimeout.tv_sec = std::min(cfg::nettimeout, REUSE_TIMEOUT_LIMIT);
	return &expirationTimeout;
}

class atransportEx : public atransport
{
public:
	tConnCache::iterator m_cleanIt;

	// stop operations for storing in the cache, respond to timeout or remote close only
	void Moothball()
	{
		if (!m_buf.valid() || g_con_cache.Full())
			return;
		// leftovers from a previous exchange would confuse the next user
		if (evbuffer_get_length(bereceiver(*m_buf)))
			return;
		bufferevent_setcb(*m_buf, cbCachedKill, nullptr, cbCachedKillEv, this);
		bufferevent_set_timeouts(*m_buf, GetKeepTimeout(), nullptr);
		bufferevent_enable(*m_buf, EV_READ);
		m_cleanIt = g_con_cache.get().emplace(m_url.GetHostPortProtoKey(), lint_ptr<atransport>(this));
	}
	// restore operation after hibernation
	void GotReused()
	{
		bufferevent_disable(*m_buf, EV_READ | EV_WRITE);
		bufferevent_setcb(*m_buf, nullptr, nullptr, nullptr, this);
		m_cleanIt = g_con_cache.get().end();
	}
	/**
	 * @brief cbCachedKill can only be triggered by unexpected data, a timeout or other error
	 */
	static void cbCachedKill(struct bufferevent *, void *ctx)
	{
		auto delIfLast = as_lptr((atransportEx*) ctx);
		g_con_cache.get().erase(delIfLast->m_cleanIt);
	}
	static void cbCachedKillEv(struct bufferevent *bev, short, void *ctx)
	{
		cbCachedKill(bev, ctx);
	}
	~atransportEx()
	{
		if (GetBufferEvent() && m_bIsSslStream)
		{
			auto ssl = bufferevent_openssl_get_ssl(GetBufferEvent());
			if (ssl)
			{
				SSL_set_shutdown(ssl, SSL_RECEIVED_SHUTDOWN);
				SSL_shutdown(ssl);
			}
		}
	}
};

struct tConnContext : public tLintRefcounted
{
	atransport::TConnectParms m_hints;
	atransport::tCallBack m_reporter;
	lint_ptr<atransportEx> m_result;
#define ABORT_IF_CANCELED if (!m_result || !m_reporter) return;
	TFinalAction m_connBuilder;
	acres& m_res;

	tConnContext(tHttpUrl &&url, const atransport::tCallBack &cback,
			atransport::TConnectParms&& extHints, acres& res)
		: m_hints(extHints), m_reporter(cback), m_res(res)
	{
		m_result = make_lptr<atransportEx>();
		m_result->m_url = move(url);
	}

	// extra self-reference while the handshake callback is armed
	bool m_bSslPending = false;

	void Abort()
	{
		if (m_bSslPending)
		{
			m_bSslPending = false;
			if (m_result && m_result->GetBufferEvent())
				bufferevent_setcb(m_result->GetBufferEvent(), nullptr, nullptr, nullptr, nullptr);
			// caller holds another reference
			__dec_ref();
		}
		m_connBuilder.reset();
		m_reporter = atransport::tCallBack();
		m_result.reset();
	}

	void Report(atransport::tResult&& res)
	{
		// report only once
		auto rep = move(m_reporter);
		m_reporter = atransport::tCallBack();
		if (rep)
			rep(move(res));
	}

	void Start()
	{
		m_connBuilder = aconnector::Connect(m_result->m_url.sHost, m_result->m_url.GetPort(),
				[pin = as_lptr(this)](auto res)
		{
			pin->OnConnect(move(res));
		}, m_hints.timeoutSeconds);
	}

	void OnConnect(aconnector::tConnResult &&res)
	{
		ABORT_IF_CANCELED;

		if (!res.sError.empty())
			return Report({res.flags, res.sError});

		if (m_result->m_url.m_schema == tHttpUrl::EProtoType::HTTPS)
			return DoTlsSwitch(move(res.fd));

		m_result->m_buf.reset(bufferevent_socket_new(evabase::base, res.fd.get(), BEV_OPT_CLOSE_ON_FREE));
		if (!m_result->m_buf.valid())
			return Report({TRANS_INTERNAL_ERROR, "Out of memory"sv});

		// freed by BEV_OPT_CLOSE_ON_FREE, not by us
		res.fd.release();
		return Report({0, static_lptr_cast<atransport>(m_result)});
	}

	static void cbStatusSslCheck(struct bufferevent *bev, short what, void *ctx)
	{
		auto pin = as_lptr((tConnContext*)ctx);
		bufferevent_setcb(bev, nullptr, nullptr, nullptr, nullptr);
		// the extra reference from DoTlsSwitch is returned now
		pin->m_bSslPending = false;
		pin->__dec_ref();
		pin->onStatusSslCheck(bev, what);
	}

	void DoTlsSwitch(unique_fd ufd)
	{
		auto withLastSslError = [&]() ->mstring
		{
			auto nErr = ERR_get_error();
			auto serr = ERR_reason_error_string(nErr);
			if (!serr)
				serr = "Internal error";
			return pfxSslError + serr;
		};
		auto ctx = m_res.GetSslConfig().GetContext();
		if (!ctx)
			return Report({ TRANS_INTERNAL_ERROR, pfxSslError + m_res.GetSslConfig().GetContextError()});
		unique_ssl ssl(SSL_new(ctx));
		if (! *ssl)
			return Report({ TRANS_INTERNAL_ERROR, withLastSslError() });

		auto& host = m_result->m_url.sHost;
		// for SNI
		SSL_set_tlsext_host_name(*ssl, host.c_str());

		auto param = SSL_get0_param(*ssl);
		// Enable automatic hostname checks
		X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
		X509_VERIFY_PARAM_set1_host(param, host.c_str(), 0);
		SSL_set_verify(*ssl, SSL_VERIFY_PEER, 0);

		m_result->m_buf.reset(bufferevent_openssl_socket_new(evabase::base,
				ufd.get(),
				*ssl,
				BUFFEREVENT_SSL_CONNECTING,
				BEV_OPT_CLOSE_ON_FREE));

		if (AC_UNLIKELY(!m_result->m_buf.valid()))
			return Report({TRANS_INTERNAL_ERROR, withLastSslError()});

		// those will eventually freed by BEV_OPT_CLOSE_ON_FREE
		m_result->m_bIsSslStream = true;
		ssl.release();
		ufd.release();

		// okay, let's verify the SSL state in the status callback
		auto tmout = cfg::GetNetworkTimeout();
		bufferevent_set_timeouts(m_result->GetBufferEvent(), tmout, tmout);
		bufferevent_setcb(m_result->GetBufferEvent(), nullptr, nullptr, cbStatusSslCheck, this);
		bufferevent_enable(m_result->GetBufferEvent(), EV_READ | EV_WRITE);
		__inc_ref();
		m_bSslPending = true;
	}

	void onStatusSslCheck(struct bufferevent *bev, short what)
	{
		ABORT_IF_CANCELED;

		if (what & (BEV_EVENT_EOF | BEV_EVENT_ERROR | BEV_EVENT_TIMEOUT))
			return Report({TRANS_FAULTY_SSL_PEER, pfxSslError + "Handshake aborted"});

		if (!(what & BEV_EVENT_CONNECTED))
			return Report({TRANS_FAULTY_SSL_PEER, pfxSslError + "Unexpected handshake state"});

		auto hret = SSL_get_verify_result(bufferevent_openssl_get_ssl(bev));
		if( hret != X509_V_OK)
		{
			auto err = X509_verify_cert_error_string(hret);
			if (!err) err = "Handshake failed";
			return Report({TRANS_FAULTY_SSL_PEER, pfxSslError + err});
		}
		auto remote_cert = SSL_get_peer_certificate(bufferevent_openssl_get_ssl(bev));
		if(!remote_cert)
			return Report({TRANS_FAULTY_SSL_PEER, pfxSslError + "Incompatible remote certificate"});
		X509_free(remote_cert);

		bufferevent_disable(bev, EV_READ | EV_WRITE);
		return Report({ 0, static_lptr_cast<atransport>(m_result)});
	}
};

TFinalAction atransport::Create(tHttpUrl url, const tCallBack &cback, acres& res, TConnectParms extHints)
{
	ASSERT(cback);

	if (!extHints.noCache)
	{
		auto anyIt = g_con_cache.get().find(url.GetHostPortProtoKey());
		if (anyIt != g_con_cache.get().end())
		{
			auto ret = move(anyIt->second);
			g_con_cache.get().erase(anyIt);
			if (AC_LIKELY(ret->m_buf.valid()))
			{
				static_lptr_cast<atransportEx>(ret)->GotReused();
				auto canceled = make_shared<bool>(false);
				evabase::Post([ret, cback, canceled]()
				{
					if (!*canceled)
						cback({TRANS_WAS_USED, move(ret)});
				});
				return TFinalAction([canceled](){ *canceled = true; });
			}
		}
	}

	auto tr = make_lptr<tConnContext>(move(url), cback, move(extHints), res);
	tr->Start();
	return TFinalAction([tr](){ tr->Abort(); });
}

void atransport::Return(lint_ptr<atransport> &stream)
{
	if (stream && !evabase::GetGlobal().IsShuttingDown())
		static_lptr_cast<atransportEx>(stream)->Moothball();
	stream.reset();
}

atransport::tResult::tResult(tComError flags, string_view errMsg)
{
	this->flags = flags;
	this->err = mstring(errMsg);
}

atransport::tResult::tResult(tComError flags, lint_ptr<atransport> result)
{
	this->strm = move(result);
	this->flags = flags;
}

}
