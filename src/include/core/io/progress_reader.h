#pragma once

#include "byte_source.h"
#include <core/model/progress_state.h>
#include <cstdint>
#include <functional>

namespace upbeam::core {

using ProgressSink = std::function<void(const ProgressState& state)>;

/**
 * @brief Decorates a ByteSource so that every read advances a progress state
 *
 * Bytes are counted on every successful read. The sink is invoked after each
 * successful read, but only when the total size is known (> 0). End of
 * stream and thrown errors pass through unchanged. Nothing is buffered.
 */
class ProgressReader : public ByteSource {
public:
    ProgressReader(ByteSource& source, std::int64_t total_size, ProgressSink sink = nullptr);

    boost::asio::awaitable<std::size_t> Read(std::span<std::uint8_t> buffer) override;

    const ProgressState& state() const { return state_; }

private:
    ByteSource& source_;
    ProgressState state_;
    ProgressSink sink_;
};

} // namespace upbeam::core
