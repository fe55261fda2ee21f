#include <core/io/progress_reader.h>
#include <utility>

namespace upbeam::core {

ProgressReader::ProgressReader(ByteSource& source, std::int64_t total_size, ProgressSink sink)
    : source_(source)
    , state_{.total_size = total_size, .bytes_so_far = 0}
    , sink_(std::move(sink)) {}

boost::asio::awaitable<std::size_t> ProgressReader::Read(std::span<std::uint8_t> buffer) {
    std::size_t n = co_await source_.Read(buffer);
    state_.bytes_so_far += static_cast<std::int64_t>(n);

    if (sink_ && state_.HasTotal()) {
        sink_(state_);
    }

    co_return n;
}

} // namespace upbeam::core
