#pragma once

#include <core/util/binary_data.h>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace upbeam::core {

/**
 * @brief Builds a multipart/form-data body in memory
 *
 * Usage:
 *     MultipartWriter writer;
 *     writer.CreateFormFile("file", "report.pdf");
 *     writer.Write(bytes);            // as many times as needed
 *     BinaryData body = writer.Close();
 *     req.set(http::field::content_type, writer.FormDataContentType());
 *
 * Every method throws EncodingError when the body cannot be constructed.
 */
class MultipartWriter {
public:
    // Uses a random boundary
    MultipartWriter();
    explicit MultipartWriter(std::string boundary);

    MultipartWriter(const MultipartWriter&) = delete;
    MultipartWriter& operator=(const MultipartWriter&) = delete;

    const std::string& boundary() const { return boundary_; }

    // "multipart/form-data; boundary=..."
    std::string FormDataContentType() const;

    /**
     * @brief Start a file part, all following writes go into it
     *
     * @param field_name Form field name, must be non-empty
     * @param file_name Declared file name
     */
    void CreateFormFile(std::string_view field_name, std::string_view file_name);

    void Write(std::span<const std::uint8_t> data);

    // Appends the closing delimiter and hands the finished body over
    BinaryData Close();

    // Pre-allocates room for the expected payload
    void Reserve(std::size_t payload_size) { body_.reserve(payload_size + 512); }

    std::size_t size() const { return body_.size(); }

    static std::string RandomBoundary();

private:
    void createPart(std::string_view headers);
    void append(std::string_view text);

    std::string boundary_;
    BinaryData body_;
    bool has_parts_ = false;
    bool part_open_ = false;
    bool closed_ = false;
};

} // namespace upbeam::core
