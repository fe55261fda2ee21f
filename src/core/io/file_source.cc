#include <cerrno>
#include <core/error/transfer_error.h>
#include <core/io/file_source.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace upbeam::core {

FileSource::FileSource(const fs::path& path)
    : path_(path)
    , name_(path.filename().string()) {
    std::error_code ec;
    auto status = fs::status(path_, ec);
    if (ec || !fs::exists(status)) {
        throw FileAccessError(fmt::format("cannot access \"{}\": {}",
                                          path_.string(),
                                          ec ? ec.message() : "no such file or directory"));
    }
    if (!fs::is_regular_file(status)) {
        throw FileAccessError(fmt::format("\"{}\" is not a regular file", path_.string()));
    }

    auto size = fs::file_size(path_, ec);
    if (ec) {
        throw FileAccessError(
            fmt::format("cannot read size of \"{}\": {}", path_.string(), ec.message()));
    }
    size_ = static_cast<std::int64_t>(size);

    file_.open(path_, std::ios::binary);
    if (!file_) {
        throw FileAccessError(fmt::format("cannot open \"{}\": {}",
                                          path_.string(),
                                          std::generic_category().message(errno)));
    }

    if (name_.empty()) {
        // "dir/" style paths have no filename component
        name_ = path_.parent_path().filename().string();
    }

    spdlog::debug("Opened {} ({} bytes)", path_.string(), size_);
}

boost::asio::awaitable<std::size_t> FileSource::Read(std::span<std::uint8_t> buffer) {
    if (!file_.is_open()) {
        throw ReadError(fmt::format("read from closed file \"{}\"", path_.string()));
    }
    if (buffer.empty()) {
        co_return 0;
    }

    if (!file_.eof()) {
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            throw ReadError(fmt::format("I/O error while reading \"{}\" at offset {}",
                                        path_.string(),
                                        offset_));
        }

        auto n = static_cast<std::size_t>(file_.gcount());
        offset_ += static_cast<std::int64_t>(n);
        if (n > 0) {
            co_return n;
        }
    }

    // End of file; it must not come before the size sampled at open
    if (offset_ < size_) {
        throw ReadError(fmt::format("\"{}\" ended after {} of {} bytes",
                                    path_.string(),
                                    offset_,
                                    size_));
    }

    co_return 0;
}

void FileSource::Close() {
    if (file_.is_open()) {
        file_.close();
        spdlog::debug("Closed {}", path_.string());
    }
}

} // namespace upbeam::core
