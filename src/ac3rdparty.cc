#include "ac3rdparty.h"
#include "acfg.h"
#include "debug.h"

#include <event2/thread.h>
#include <event2/event.h>

#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

#include <ares.h>

namespace dlbr {

tSslConfig::tSslConfig()
{
}

tSslConfig::~tSslConfig()
{
	if (m_ctx)
		SSL_CTX_free(m_ctx);
}

SSL_CTX *tSslConfig::GetContext()
{
	if (!m_ctx_init_error.empty())
		return nullptr;

	if (m_ctx)
		return m_ctx;

	m_ctx = SSL_CTX_new(TLS_client_method());
	if (!m_ctx)
	{
		auto msg = ERR_reason_error_string(ERR_get_error());
		m_ctx_init_error = msg ? msg : "SSL context initialization failed";
		return nullptr;
	}

	bool custom = !cfg::cafile.empty() || !cfg::capath.empty();
	auto ok = custom
			? SSL_CTX_load_verify_locations(m_ctx,
					cfg::cafile.empty() ? nullptr : cfg::cafile.c_str(),
					cfg::capath.empty() ? nullptr : cfg::capath.c_str())
			: SSL_CTX_set_default_verify_paths(m_ctx);
	if (!ok)
	{
		auto msg = ERR_reason_error_string(ERR_get_error());
		m_ctx_init_error = msg ? msg : "Error loading local root certificates";
		log::err(tSS() << "TLS setup failed: " << m_ctx_init_error);
		SSL_CTX_free(m_ctx);
		m_ctx = nullptr;
	}
	return m_ctx;
}

void ac3rdparty_init()
{
	evthread_use_pthreads();
#ifdef DEBUG
	evthread_enable_lock_debugging();
#endif
	ares_library_init(ARES_LIB_INIT_ALL);
	OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

void ac3rdparty_deinit()
{
	ares_library_cleanup();
	libevent_global_shutdown();
}

}
