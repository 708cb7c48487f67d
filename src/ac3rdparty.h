#ifndef AC3RDPARTY_H
#define AC3RDPARTY_H

#include "actypes.h"

#include <openssl/ossl_typ.h>

namespace dlbr
{

//! Process-wide setup of libevent threading, c-ares and OpenSSL
void DLBR_API ac3rdparty_init();
void DLBR_API ac3rdparty_deinit();

/**
 * Client TLS context, created on first use with the configured trust store.
 */
class DLBR_API tSslConfig
{
public:
	tSslConfig();
	~tSslConfig();
	SSL_CTX* GetContext();
	cmstring& GetContextError() { return m_ctx_init_error; }

private:
	mstring m_ctx_init_error;
	SSL_CTX* m_ctx = nullptr;
};

}

#endif // AC3RDPARTY_H
