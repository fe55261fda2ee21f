#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/constant/transfer.h>
#include <core/error/transfer_error.h>
#include <core/http/multipart_writer.h>
#include <spdlog/spdlog.h>

namespace uuids = boost::uuids;

namespace upbeam::core {

namespace {

constexpr std::size_t kMaxBoundaryLength = 70;

// RFC 2046 bchars
bool isBoundaryChar(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
    case '\'':
    case '(':
    case ')':
    case '+':
    case '_':
    case ',':
    case '-':
    case '.':
    case '/':
    case ':':
    case '=':
    case '?':
    case ' ':
        return true;
    default:
        return false;
    }
}

void validateBoundary(std::string_view boundary) {
    if (boundary.empty() || boundary.size() > kMaxBoundaryLength) {
        throw EncodingError(fmt::format("invalid multipart boundary length {}", boundary.size()));
    }
    if (boundary.back() == ' ') {
        throw EncodingError("multipart boundary must not end with a space");
    }
    for (char c : boundary) {
        if (!isBoundaryChar(c)) {
            throw EncodingError("multipart boundary contains an invalid character");
        }
    }
}

void validateHeaderValue(std::string_view what, std::string_view value) {
    for (char c : value) {
        if (c == '\r' || c == '\n' || c == '\0') {
            throw EncodingError(fmt::format("malformed {}: control characters are not allowed "
                                            "in a part header",
                                            what));
        }
    }
}

std::string escapeQuotes(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

} // namespace

MultipartWriter::MultipartWriter()
    : boundary_(RandomBoundary()) {}

MultipartWriter::MultipartWriter(std::string boundary)
    : boundary_(std::move(boundary)) {
    validateBoundary(boundary_);
}

std::string MultipartWriter::RandomBoundary() {
    uuids::random_generator gen;
    std::string id = uuids::to_string(gen());
    std::erase(id, '-');
    return "upbeam" + id;
}

std::string MultipartWriter::FormDataContentType() const {
    // Boundaries with tspecials must be sent as a quoted-string
    if (boundary_.find_first_of("()<>@,;:\\\"/[]?= ") != std::string::npos) {
        return "multipart/form-data; boundary=\"" + boundary_ + "\"";
    }
    return "multipart/form-data; boundary=" + boundary_;
}

void MultipartWriter::CreateFormFile(std::string_view field_name, std::string_view file_name) {
    if (field_name.empty()) {
        throw EncodingError("form field name must not be empty");
    }
    validateHeaderValue("field name", field_name);
    validateHeaderValue("file name", file_name);

    createPart(fmt::format("Content-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n"
                           "Content-Type: {}\r\n",
                           escapeQuotes(field_name),
                           escapeQuotes(file_name),
                           transfer::kDefaultPartContentType));
}

void MultipartWriter::Write(std::span<const std::uint8_t> data) {
    if (closed_) {
        throw EncodingError("write to a closed multipart body");
    }
    if (!part_open_) {
        throw EncodingError("write outside of a multipart part");
    }
    body_.insert(body_.end(), data.begin(), data.end());
}

BinaryData MultipartWriter::Close() {
    if (closed_) {
        throw EncodingError("multipart body already closed");
    }
    append(has_parts_ ? "\r\n--" : "--");
    append(boundary_);
    append("--\r\n");
    closed_ = true;
    part_open_ = false;
    spdlog::debug("Multipart body closed, {} bytes", body_.size());
    return std::move(body_);
}

void MultipartWriter::createPart(std::string_view headers) {
    if (closed_) {
        throw EncodingError("multipart body already closed");
    }
    // Every part after the first starts on a fresh line
    append(has_parts_ ? "\r\n--" : "--");
    append(boundary_);
    append("\r\n");
    append(headers);
    append("\r\n");
    has_parts_ = true;
    part_open_ = true;
}

void MultipartWriter::append(std::string_view text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

} // namespace upbeam::core
