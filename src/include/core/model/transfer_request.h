#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace upbeam::core {

struct TransferRequest {
    std::filesystem::path source_path;
    std::string destination_url;

    void Validate() const {
        if (source_path.empty()) {
            throw std::invalid_argument("source path must not be empty");
        }
        if (destination_url.empty()) {
            throw std::invalid_argument("destination url must not be empty");
        }
    }
};

} // namespace upbeam::core
