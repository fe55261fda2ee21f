#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace upbeam::core::feedback {

// Shared by upload and download progress events
struct TransferProgress {
    std::string label;
    std::int64_t bytes_so_far = 0;
    std::int64_t total_size = 0;
    double percentage = 0.0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferProgress, label, bytes_so_far, total_size, percentage);
};

} // namespace upbeam::core::feedback
