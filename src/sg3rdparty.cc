#include "sg3rdparty.h"
#include "sgcfg.h"
#include "sglogger.h"
#include "debug.h"

#include <event2/event.h>
#include <event2/thread.h>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <ares.h>

using namespace std;

namespace sgate
{

static mstring PopSslError(LPCSTR fallback)
{
	auto code = ERR_get_error();
	auto reason = code ? ERR_reason_error_string(code) : nullptr;
	ERR_clear_error();
	return reason ? reason : fallback;
}

tSslConfig::~tSslConfig()
{
	if (m_ctx)
		SSL_CTX_free(m_ctx);
}

SSL_CTX* tSslConfig::GetContext()
{
	if (m_ctx || !m_error.empty())
		return m_ctx;

	auto ctx = SSL_CTX_new(TLS_client_method());
	if (!ctx)
	{
		m_error = PopSslError("cannot create TLS context");
		return nullptr;
	}
	SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
	SSL_CTX_set_mode(ctx, SSL_MODE_AUTO_RETRY);
	SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);

	int ok;
	if (cfg::cafile.empty() && cfg::capath.empty())
		ok = SSL_CTX_set_default_verify_paths(ctx);
	else
	{
		ok = SSL_CTX_load_verify_locations(ctx, cfg::cafile.empty() ? nullptr : cfg::cafile.c_str(),
										   cfg::capath.empty() ? nullptr : cfg::capath.c_str());
	}
	if (!ok)
	{
		m_error = PopSslError("cannot load the CA certificates");
		SSL_CTX_free(ctx);
		log::err("TLS setup failed: "s + m_error);
		return nullptr;
	}
	m_ctx = ctx;
	return m_ctx;
}

void SGATE_API sg3rdparty_init()
{
	evthread_use_pthreads();
#ifdef DEBUG
	evthread_enable_lock_debugging();
#endif
	OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
	auto rc = ares_library_init(ARES_LIB_INIT_ALL);
	if (rc != ARES_SUCCESS)
		log::err("c-ares initialization failed: "s + ares_strerror(rc));
}

void SGATE_API sg3rdparty_deinit()
{
	ares_library_cleanup();
	libevent_global_shutdown();
}

}
