#include "reference_server.h"

#include <algorithm>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <cctype>
#include <spdlog/fmt/fmt.h>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace upbeam::test {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string toString(beast::string_view text) {
    return std::string(text.data(), text.size());
}

} // namespace

ReferenceServer::ReferenceServer(CannedResponse response)
    : response_(std::move(response))
    , acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
}

ReferenceServer::~ReferenceServer() {
    stopping_ = true;
    // Wake the blocking accept
    beast::error_code ec;
    net::io_context wake_ctx;
    tcp::socket wake(wake_ctx);
    wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    if (thread_.joinable()) {
        thread_.join();
    }
    for (auto& socket : stalled_) {
        socket.close(ec);
    }
}

std::string ReferenceServer::Url(const std::string& target) const {
    return fmt::format("http://127.0.0.1:{}{}", port_, target);
}

std::optional<ReceivedRequest> ReferenceServer::last_request() const {
    std::lock_guard lock(mutex_);
    return last_request_;
}

std::size_t ReferenceServer::request_count() const {
    std::lock_guard lock(mutex_);
    return request_count_;
}

void ReferenceServer::serve() {
    while (!stopping_) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec || stopping_) {
            break;
        }
        handle(socket);
        if (response_.stall && socket.is_open()) {
            stalled_.push_back(std::move(socket));
        }
    }
}

void ReferenceServer::handle(tcp::socket& socket) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(256 * 1024 * 1024);

    http::read(socket, buffer, parser, ec);
    if (ec) {
        return;
    }

    const auto& req = parser.get();
    ReceivedRequest received;
    received.method = toString(req.method_string());
    received.target = toString(req.target());
    for (const auto& field : req) {
        received.headers[lower(toString(field.name_string()))] = toString(field.value());
    }
    received.body = req.body();
    {
        std::lock_guard lock(mutex_);
        last_request_ = std::move(received);
        ++request_count_;
    }

    if (response_.stall) {
        return;
    }

    net::write(socket, net::buffer(renderResponse()), ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
    socket.close(ec);
}

std::string ReferenceServer::renderResponse() const {
    std::string head = fmt::format("HTTP/1.1 {} {}\r\nContent-Type: {}\r\nConnection: close\r\n",
                                   response_.status,
                                   toString(http::obsolete_reason(
                                       static_cast<http::status>(response_.status))),
                                   response_.content_type);

    switch (response_.framing) {
    case BodyFraming::kContentLength:
        return head + fmt::format("Content-Length: {}\r\n\r\n", response_.body.size())
               + response_.body;
    case BodyFraming::kChunked: {
        std::string out = head + "Transfer-Encoding: chunked\r\n\r\n";
        for (std::size_t offset = 0; offset < response_.body.size(); offset += kChunkSize) {
            std::size_t n = std::min(kChunkSize, response_.body.size() - offset);
            out += fmt::format("{:x}\r\n", n);
            out.append(response_.body, offset, n);
            out += "\r\n";
        }
        return out + "0\r\n\r\n";
    }
    case BodyFraming::kCloseDelimited:
        return head + "\r\n" + response_.body;
    case BodyFraming::kTruncated:
        return head + fmt::format("Content-Length: {}\r\n\r\n", response_.body.size())
               + response_.body.substr(0, response_.body.size() / 2);
    }
    return head + "\r\n";
}

unsigned short UnusedPort() {
    // Bind an ephemeral port and release it again
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    unsigned short port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace upbeam::test
