#pragma once

#include "byte_source.h"
#include <boost/asio/awaitable.hpp>
#include <core/constant/transfer.h>
#include <core/util/binary_data.h>
#include <cstdint>
#include <functional>
#include <span>

namespace upbeam::core {

using ByteSink = std::function<void(std::span<const std::uint8_t> data)>;

// Drains source into sink and returns the number of bytes moved
boost::asio::awaitable<std::uint64_t> Copy(ByteSource& source,
                                           const ByteSink& sink,
                                           std::size_t buffer_size
                                           = transfer::kDefaultReadBufferSize);

boost::asio::awaitable<BinaryData> ReadAll(ByteSource& source,
                                           std::size_t buffer_size
                                           = transfer::kDefaultReadBufferSize,
                                           std::size_t size_hint = 0);

} // namespace upbeam::core
