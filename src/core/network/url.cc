#include <boost/url.hpp>
#include <cstdint>
#include <core/error/transfer_error.h>
#include <core/network/url.h>
#include <spdlog/spdlog.h>

namespace upbeam::core {

namespace urls = boost::urls;

namespace {

unsigned short defaultPort(std::string_view scheme) {
    return scheme == "https" ? 443 : 80;
}

[[noreturn]] void malformed(std::string_view text, std::string_view reason) {
    throw NetworkError(fmt::format("invalid url \"{}\": {}", text, reason));
}

} // namespace

std::string Url::HostHeader() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == defaultPort(scheme)) {
        return host_part;
    }
    return host_part + ":" + std::to_string(port);
}

std::string Url::ToString() const {
    return scheme + "://" + HostHeader() + target;
}

Url ParseUrl(std::string_view text) {
    auto parsed = urls::parse_uri(text);
    if (!parsed) {
        malformed(text, parsed.error().message());
    }
    urls::url_view view = parsed.value();

    Url url;
    switch (view.scheme_id()) {
    case urls::scheme::http:
        url.scheme = "http";
        break;
    case urls::scheme::https:
        url.scheme = "https";
        break;
    default:
        malformed(text, "only http and https are supported");
    }

    if (view.has_userinfo()) {
        malformed(text, "credentials in the url are not supported");
    }

    if (view.host_type() == urls::host_type::ipv6) {
        url.host = view.host_ipv6_address().to_string();
    } else {
        url.host = std::string(view.encoded_host());
    }
    if (url.host.empty()) {
        malformed(text, "missing host");
    }

    if (!view.has_port() || view.port().empty()) {
        url.port = defaultPort(url.scheme);
    } else {
        // port_number() is 0 when the digits do not fit in 16 bits
        std::uint16_t port = view.port_number();
        if (port == 0) {
            malformed(text, "invalid port");
        }
        url.port = port;
    }

    // encoded_target() is path plus query, the fragment is not part of it
    std::string target(view.encoded_target());
    if (target.empty() || target.front() != '/') {
        target.insert(0, "/");
    }
    url.target = std::move(target);

    return url;
}

} // namespace upbeam::core
