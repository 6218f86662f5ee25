#ifndef SG3RDPARTY_H
#define SG3RDPARTY_H

#include "config.h"
#include "sgtypes.h"

#include <openssl/ossl_typ.h>

namespace sgate
{

/**
 * Process wide setup of libevent threading, c-ares and OpenSSL. Called once before
 * anything else uses the libraries, the counterpart once at exit.
 */
void SGATE_API sg3rdparty_init();
void SGATE_API sg3rdparty_deinit();

/**
 * TLS client settings for the gateway connections. The context is made on first
 * use, with peer verification against the configured or the system CA store.
 */
class SGATE_API tSslConfig
{
public:
	tSslConfig() =default;
	~tSslConfig();
	tSslConfig(const tSslConfig&) = delete;

	// nullptr if the context could not be made, see GetContextError
	SSL_CTX* GetContext();
	cmstring& GetContextError() { return m_error; }

private:
	SSL_CTX* m_ctx = nullptr;
	mstring m_error;
};

}

#endif // SG3RDPARTY_H
