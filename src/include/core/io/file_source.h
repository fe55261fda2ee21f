#pragma once

#include "byte_source.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace upbeam::core {

/**
 * @brief Exclusively owned, read-only handle on a local regular file
 *
 * The size is sampled once when the file is opened. The handle is released
 * when the object is destroyed.
 */
class FileSource : public ByteSource {
public:
    /**
     * @brief Open the file at the given path
     *
     * @throws FileAccessError if the path does not exist, is not a regular
     *         file, cannot be opened for reading or its size cannot be read
     */
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override = default;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    boost::asio::awaitable<std::size_t> Read(std::span<std::uint8_t> buffer) override;

    std::int64_t size() const { return size_; }

    // Base name of the path, used as the multipart file name
    const std::string& name() const { return name_; }

    const std::filesystem::path& path() const { return path_; }

    bool IsOpen() const { return file_.is_open(); }

    void Close();

private:
    std::filesystem::path path_;
    std::string name_;
    std::int64_t size_ = 0;
    std::int64_t offset_ = 0;
    std::ifstream file_;
};

} // namespace upbeam::core
