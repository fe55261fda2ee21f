#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace upbeam::core::feedback {

struct TransferStarted {
    std::string file_name;
    std::int64_t file_size = 0;
    std::string destination;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferStarted, file_name, file_size, destination);
};

} // namespace upbeam::core::feedback
