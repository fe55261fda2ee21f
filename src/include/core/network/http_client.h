#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/io/byte_source.h>
#include <core/network/url.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace upbeam::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct ClientOptions {
    // Overall deadline covering connect, handshake, request and response
    std::chrono::steady_clock::duration timeout = transfer::kDefaultTimeout;
    bool verify_peer = true;
    std::string user_agent = "upbeam";
};

class HttpClient;

/**
 * @brief Body of an in-flight response, read incrementally from the connection
 *
 * The header is already parsed when the stream is handed out. Reads pull at
 * most the caller's buffer size from the socket, so the body is never held
 * in memory here.
 */
class HttpResponseStream : public ByteSource {
    struct PrivateTag {};

public:
    // Only HttpClient can name PrivateTag, so only it creates streams
    HttpResponseStream(PrivateTag, HttpClient& client);

    HttpResponseStream(const HttpResponseStream&) = delete;
    HttpResponseStream& operator=(const HttpResponseStream&) = delete;

    unsigned int status_code() const { return parser_.get().result_int(); }

    std::string_view reason() const {
        auto reason = parser_.get().reason();
        return {reason.data(), reason.size()};
    }

    // Declared Content-Length, empty for chunked or close-delimited bodies
    std::optional<std::uint64_t> content_length() const;

    net::awaitable<std::size_t> Read(std::span<std::uint8_t> buffer) override;

private:
    friend class HttpClient;

    HttpClient& client_;
    http::response_parser<http::buffer_body> parser_;
};

/**
 * @brief One-shot HTTP/1.1 client over plain TCP or TLS
 *
 * Every network failure is reported as NetworkError. The deadline given in
 * ClientOptions starts when Connect is called and is never extended.
 */
class HttpClient {
public:
    HttpClient(net::io_context& ioc, ClientOptions options);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    net::awaitable<void> Connect(const Url& url);

    net::awaitable<void> Disconnect();

    bool IsConnected() const;

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method) const;

    // Writes the request and reads the response header
    template<typename Body>
    net::awaitable<std::unique_ptr<HttpResponseStream>> SendRequest(http::request<Body>& req);

private:
    friend class HttpResponseStream;

    // Runs op on whichever stream is active; op must return net::awaitable<void>
    template<typename Op>
    net::awaitable<void> withStream(Op&& op);

    net::awaitable<std::unique_ptr<HttpResponseStream>> readResponseHeader();

    [[noreturn]] void throwNetworkError(std::string_view what, const beast::error_code& ec) const;

    bool isTimeout(const beast::error_code& ec) const;

    net::io_context& ioc_;
    ClientOptions options_;
    ssl::context ssl_ctx_;
    std::unique_ptr<beast::tcp_stream> plain_stream_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_stream_;
    beast::flat_buffer buffer_;
    Url current_url_;
};

template<typename Op>
net::awaitable<void> HttpClient::withStream(Op&& op) {
    if (tls_stream_) {
        co_await op(*tls_stream_);
    } else if (plain_stream_) {
        co_await op(*plain_stream_);
    } else {
        throw std::logic_error("HttpClient used without an active connection");
    }
}

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method) const {
    http::request<Body> req{method, current_url_.target, 11};

    req.set(http::field::host, current_url_.HostHeader());
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::accept, "*/*");
    req.keep_alive(false);

    return req;
}

template<typename Body>
net::awaitable<std::unique_ptr<HttpResponseStream>> HttpClient::SendRequest(
    http::request<Body>& req) {
    if (!IsConnected()) {
        throw std::logic_error("No active connection");
    }

    beast::error_code ec;
    co_await withStream([&](auto& stream) -> net::awaitable<void> {
        co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    });
    if (ec) {
        throwNetworkError("sending request", ec);
    }

    co_return co_await readResponseHeader();
}

} // namespace upbeam::core
