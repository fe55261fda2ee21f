#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace upbeam::core {

namespace transfer {

constexpr std::string_view kFileFieldName = "file";
constexpr std::string_view kDefaultPartContentType = "application/octet-stream";

constexpr std::size_t kDefaultReadBufferSize = 32 * 1024; // 32 KB
constexpr std::size_t kMaxReadBufferSize = 16 * 1024 * 1024;

// Large payloads over slow links need a generous deadline
constexpr std::chrono::minutes kDefaultTimeout{30};
// Upper bound for configured deadlines, far below steady_clock overflow
constexpr std::chrono::minutes kMaxTimeout{7 * 24 * 60};

constexpr std::chrono::milliseconds kDefaultProgressThrottle{65};
constexpr int kDefaultProgressBarWidth = 30;

} // namespace transfer

} // namespace upbeam::core
