#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace upbeam::core::feedback {

struct Connecting {
    std::string destination;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Connecting, destination);
};

} // namespace upbeam::core::feedback
