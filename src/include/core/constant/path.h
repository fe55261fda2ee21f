#pragma once

#include <cstdlib>
#include <filesystem>

namespace upbeam::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "upbeam"
                                             / "logs";

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* base = std::getenv("APPDATA");
#else
    const char* base = std::getenv("HOME");
#endif
    if (base == nullptr) {
        return std::filesystem::current_path();
    }
#if defined(_WIN32) || defined(_WIN64)
    return std::filesystem::path(base) / "upbeam";
#else
    return std::filesystem::path(base) / ".config" / "upbeam";
#endif
}();

inline const std::filesystem::path kDefaultConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace upbeam::core
