#pragma once

#include <string>
#include <string_view>

namespace upbeam::core {

struct Url {
    std::string scheme; // "http" or "https", lower case
    std::string host;   // without brackets for IPv6 literals
    unsigned short port = 0;
    std::string target; // origin-form: path plus query, never empty

    bool IsTls() const { return scheme == "https"; }

    // Value for the Host header, default ports omitted
    std::string HostHeader() const;

    std::string ToString() const;
};

/**
 * @brief Parse an absolute http:// or https:// URL
 *
 * Fragments are dropped. Credentials embedded in the URL are rejected.
 *
 * @throws NetworkError if the URL is malformed or uses another scheme
 */
Url ParseUrl(std::string_view text);

} // namespace upbeam::core
