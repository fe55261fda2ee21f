#pragma once

#include <nlohmann/json.hpp>

namespace upbeam::core {

enum class FeedbackType {
    kTransferStarted,   // source opened (file name, size, destination)
    kUploadProgress,    // file bytes streamed into the request body
    kConnecting,        // body encoded, request about to be sent
    kResponseReceived,  // response header read (status, declared length)
    kDownloadProgress,  // response body bytes read, only for declared lengths
    kTransferCompleted, // whole exchange done, carries the HTTP outcome
    kTransferFailed,    // terminal pipeline error
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kTransferStarted, "TransferStarted"},
                                 {FeedbackType::kUploadProgress, "UploadProgress"},
                                 {FeedbackType::kConnecting, "Connecting"},
                                 {FeedbackType::kResponseReceived, "ResponseReceived"},
                                 {FeedbackType::kDownloadProgress, "DownloadProgress"},
                                 {FeedbackType::kTransferCompleted, "TransferCompleted"},
                                 {FeedbackType::kTransferFailed, "TransferFailed"},
                             });

} // namespace upbeam::core
