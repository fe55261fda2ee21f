#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace upbeam::core {

enum class ErrorKind {
    kFileAccess, // source file missing, unreadable or without metadata
    kEncoding,   // multipart body could not be constructed
    kRead,       // a file or response stream ended early or faulted
    kNetwork,    // request could not be sent, or the deadline expired
};

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind,
                             {
                                 {ErrorKind::kFileAccess, "FileAccessError"},
                                 {ErrorKind::kEncoding, "EncodingError"},
                                 {ErrorKind::kRead, "ReadError"},
                                 {ErrorKind::kNetwork, "NetworkError"},
                             });

constexpr std::string_view ErrorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kFileAccess:
        return "FileAccessError";
    case ErrorKind::kEncoding:
        return "EncodingError";
    case ErrorKind::kRead:
        return "ReadError";
    case ErrorKind::kNetwork:
        return "NetworkError";
    }
    return "TransferError";
}

/**
 * @brief Base class of every terminal pipeline failure
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class FileAccessError : public TransferError {
public:
    explicit FileAccessError(const std::string& message)
        : TransferError(ErrorKind::kFileAccess, message) {}
};

class EncodingError : public TransferError {
public:
    explicit EncodingError(const std::string& message)
        : TransferError(ErrorKind::kEncoding, message) {}
};

class ReadError : public TransferError {
public:
    explicit ReadError(const std::string& message)
        : TransferError(ErrorKind::kRead, message) {}
};

class NetworkError : public TransferError {
public:
    explicit NetworkError(const std::string& message)
        : TransferError(ErrorKind::kNetwork, message) {}
};

} // namespace upbeam::core
