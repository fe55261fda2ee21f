/**
 * @file open_ssl_provider.h
 * @brief OpenSSL library initialization and client TLS context setup
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string>

namespace upbeam::core {

class OpenSSLProvider {
private:
    OpenSSLProvider() = default;
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    ~OpenSSLProvider() = default;

    static OpenSSLProvider& instance();

    bool initialized_ = false;

public:
    /**
     * @brief Initialize OpenSSL library
     * 
     * Loads the SSL and crypto error strings once; later calls are no-ops.
     * @throws std::runtime_error if OpenSSL refuses to initialize
     */
    static void InitOpenSSL();

    /**
     * @brief Build a TLS 1.2+ client context
     * 
     * @param verify_peer Verify the server certificate against the system trust store
     * @return boost::asio::ssl::context SSL context configured for client use
     */
    static boost::asio::ssl::context BuildClientContext(bool verify_peer);

    /**
     * @brief Set the SNI hostname for the SSL connection
     * 
     * @param ssl SSL connection object
     * @param hostname Hostname to set
     * @return bool True if hostname was set successfully, false otherwise
     */
    static bool SetHostname(SSL* ssl, const std::string& hostname);

    // Text of the most recent OpenSSL error on this thread, empty if none
    static std::string LastError();
};

} // namespace upbeam::core
