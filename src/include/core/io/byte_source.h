#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <span>

namespace upbeam::core {

/**
 * @brief A pull-based stream of bytes
 *
 * Read fills at most buffer.size() bytes and returns how many were written.
 * A return value of 0 means the stream is exhausted. Failures are thrown
 * (ReadError for I/O faults, NetworkError for an expired deadline).
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual boost::asio::awaitable<std::size_t> Read(std::span<std::uint8_t> buffer) = 0;
};

} // namespace upbeam::core
