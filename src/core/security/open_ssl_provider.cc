#include <core/security/open_ssl_provider.h>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ssl = boost::asio::ssl;

namespace upbeam::core {

OpenSSLProvider& OpenSSLProvider::instance() {
    static OpenSSLProvider instance;
    return instance;
}

void OpenSSLProvider::InitOpenSSL() {
    auto& provider = instance();
    if (provider.initialized_) {
        return;
    }

    // Library teardown is automatic since OpenSSL 1.1.0
    if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr)
        != 1) {
        std::string reason = LastError();
        spdlog::error("OPENSSL_init_ssl failed: {}", reason);
        throw std::runtime_error("OpenSSL initialization failed: " + reason);
    }

    provider.initialized_ = true;
    spdlog::debug("OpenSSL initialized: {}", OpenSSL_version(OPENSSL_VERSION));
}

ssl::context OpenSSLProvider::BuildClientContext(bool verify_peer) {
    ssl::context ctx(ssl::context::tls_client);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);

    if (verify_peer) {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
    } else {
        spdlog::warn("TLS peer verification is disabled");
        ctx.set_verify_mode(ssl::verify_none);
    }

    return ctx;
}

bool OpenSSLProvider::SetHostname(SSL* ssl, const std::string& hostname) {
    if (!ssl || !SSL_set_tlsext_host_name(ssl, hostname.c_str())) {
        return false;
    }
    return true;
}

std::string OpenSSLProvider::LastError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return {};
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace upbeam::core
