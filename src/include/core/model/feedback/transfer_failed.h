#pragma once

#include <core/error/transfer_error.h>
#include <nlohmann/json.hpp>
#include <string>

namespace upbeam::core::feedback {

struct TransferFailed {
    ErrorKind error;
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferFailed, error, message);
};

} // namespace upbeam::core::feedback
