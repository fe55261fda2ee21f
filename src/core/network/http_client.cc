#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <core/error/transfer_error.h>
#include <core/network/http_client.h>
#include <core/security/open_ssl_provider.h>
#include <limits>
#include <spdlog/spdlog.h>

namespace upbeam::core {

namespace {

constexpr std::chrono::seconds kShutdownTimeout{5};

bool isIpLiteral(const std::string& host) {
    beast::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

} // namespace

HttpResponseStream::HttpResponseStream(PrivateTag, HttpClient& client)
    : client_(client) {
    // The body is streamed to the caller, so no size cap applies here
    parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
}

std::optional<std::uint64_t> HttpResponseStream::content_length() const {
    auto length = parser_.content_length();
    if (!length) {
        return std::nullopt;
    }
    return *length;
}

net::awaitable<std::size_t> HttpResponseStream::Read(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        co_return 0;
    }

    // Chunk framing can complete a read without producing body bytes
    while (!parser_.is_done()) {
        auto& body = parser_.get().body();
        body.data = buffer.data();
        body.size = buffer.size();

        beast::error_code ec;
        co_await client_.withStream([&](auto& stream) -> net::awaitable<void> {
            co_await http::async_read(stream,
                                      client_.buffer_,
                                      parser_,
                                      net::redirect_error(net::use_awaitable, ec));
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            if (client_.isTimeout(ec)) {
                client_.throwNetworkError("reading response body", ec);
            }
            throw ReadError(fmt::format("response body ended unexpectedly: {}", ec.message()));
        }

        std::size_t n = buffer.size() - body.size;
        if (n > 0) {
            co_return n;
        }
    }

    co_return 0;
}

HttpClient::HttpClient(net::io_context& ioc, ClientOptions options)
    : ioc_(ioc)
    , options_(std::move(options))
    , ssl_ctx_(OpenSSLProvider::BuildClientContext(options_.verify_peer)) {}

HttpClient::~HttpClient() = default;

net::awaitable<void> HttpClient::Connect(const Url& url) {
    if (IsConnected()) {
        co_await Disconnect();
    }

    current_url_ = url;
    buffer_.consume(buffer_.size());

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = co_await resolver.async_resolve(url.host,
                                                   std::to_string(url.port),
                                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throwNetworkError(fmt::format("resolving {}", url.host), ec);
    }

    if (url.IsTls()) {
        tls_stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(beast::tcp_stream(ioc_),
                                                                             ssl_ctx_);
        if (!isIpLiteral(url.host)
            && !OpenSSLProvider::SetHostname(tls_stream_->native_handle(), url.host)) {
            tls_stream_.reset();
            throw NetworkError(fmt::format("failed to set SNI hostname {}: {}",
                                           url.host,
                                           OpenSSLProvider::LastError()));
        }
        if (options_.verify_peer) {
            tls_stream_->set_verify_callback(ssl::host_name_verification(url.host));
        }
    } else {
        plain_stream_ = std::make_unique<beast::tcp_stream>(ioc_);
    }

    auto& lowest_layer = tls_stream_ ? beast::get_lowest_layer(*tls_stream_) : *plain_stream_;

    // Set once here and never refreshed: this is the deadline of the whole exchange
    lowest_layer.expires_after(options_.timeout);

    co_await lowest_layer.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        auto what = fmt::format("connecting to {}:{}", url.host, url.port);
        tls_stream_.reset();
        plain_stream_.reset();
        throwNetworkError(what, ec);
    }

    if (tls_stream_) {
        co_await tls_stream_->async_handshake(ssl::stream_base::client,
                                              net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            tls_stream_.reset();
            throwNetworkError(fmt::format("TLS handshake with {}", url.host), ec);
        }
    }

    spdlog::info("Connected to {}:{}{}", url.host, url.port, url.IsTls() ? " (TLS)" : "");
}

net::awaitable<void> HttpClient::Disconnect() {
    if (!IsConnected()) {
        co_return;
    }

    beast::error_code ec;
    if (tls_stream_) {
        beast::get_lowest_layer(*tls_stream_).expires_after(kShutdownTimeout);
        co_await tls_stream_->async_shutdown(net::redirect_error(net::use_awaitable, ec));
        // Most servers drop the connection instead of answering close_notify
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("SSL shutdown notice: {}", ec.message());
        }
        tls_stream_.reset();
    } else {
        plain_stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != net::error::not_connected) {
            spdlog::debug("TCP shutdown notice: {}", ec.message());
        }
        plain_stream_.reset();
    }

    spdlog::debug("Disconnected from {}", current_url_.host);
}

bool HttpClient::IsConnected() const {
    return tls_stream_ != nullptr || plain_stream_ != nullptr;
}

net::awaitable<std::unique_ptr<HttpResponseStream>> HttpClient::readResponseHeader() {
    auto response = std::make_unique<HttpResponseStream>(HttpResponseStream::PrivateTag{}, *this);

    beast::error_code ec;
    co_await withStream([&](auto& stream) -> net::awaitable<void> {
        co_await http::async_read_header(stream,
                                         buffer_,
                                         response->parser_,
                                         net::redirect_error(net::use_awaitable, ec));
    });
    if (ec) {
        throwNetworkError("reading response header", ec);
    }

    spdlog::debug("Response header: {} {}", response->status_code(), response->reason());
    co_return response;
}

void HttpClient::throwNetworkError(std::string_view what, const beast::error_code& ec) const {
    if (isTimeout(ec)) {
        throw NetworkError(fmt::format("{} timed out, deadline of {}s exceeded",
                                       what,
                                       std::chrono::duration_cast<std::chrono::seconds>(
                                           options_.timeout)
                                           .count()));
    }
    throw NetworkError(fmt::format("{} failed: {}", what, ec.message()));
}

bool HttpClient::isTimeout(const beast::error_code& ec) const {
    return ec == beast::error::timeout || ec == net::error::timed_out;
}

} // namespace upbeam::core
