#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace upbeam::core::feedback {

struct ResponseReceived {
    unsigned int status_code = 0;
    std::int64_t content_length = -1; // -1 when the server did not declare it
    bool metered = false;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ResponseReceived, status_code, content_length, metered);
};

} // namespace upbeam::core::feedback
