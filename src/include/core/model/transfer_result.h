#pragma once

#include <core/util/binary_data.h>
#include <string>

namespace upbeam::core {

struct TransferResult {
    unsigned int status_code = 0;
    BinaryData response_body;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }

    std::string BodyText() const { return ToString(response_body); }
};

} // namespace upbeam::core
