#include <core/io/copy.h>

namespace upbeam::core {

boost::asio::awaitable<std::uint64_t> Copy(ByteSource& source,
                                           const ByteSink& sink,
                                           std::size_t buffer_size) {
    BinaryData buffer(buffer_size == 0 ? transfer::kDefaultReadBufferSize : buffer_size);
    std::uint64_t total = 0;

    while (true) {
        std::size_t n = co_await source.Read(buffer);
        if (n == 0) {
            break;
        }
        sink(std::span<const std::uint8_t>(buffer.data(), n));
        total += n;
    }

    co_return total;
}

boost::asio::awaitable<BinaryData> ReadAll(ByteSource& source,
                                           std::size_t buffer_size,
                                           std::size_t size_hint) {
    BinaryData data;
    data.reserve(size_hint);
    co_await Copy(
        source,
        [&data](std::span<const std::uint8_t> chunk) {
            data.insert(data.end(), chunk.begin(), chunk.end());
        },
        buffer_size);
    co_return data;
}

} // namespace upbeam::core
