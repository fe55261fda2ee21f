#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace upbeam::core::feedback {

struct TransferCompleted {
    unsigned int status_code = 0;
    bool success = false;
    std::uint64_t body_size = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferCompleted, status_code, success, body_size);
};

} // namespace upbeam::core::feedback
