#include <core/util/format.h>
#include <spdlog/fmt/fmt.h>

namespace upbeam::core {

std::string FormatBytes(std::int64_t bytes) {
    constexpr std::int64_t kUnit = 1024;
    constexpr const char* kPrefixes = "KMGTPE";

    if (bytes < kUnit) {
        return fmt::format("{} B", bytes);
    }

    std::int64_t div = kUnit;
    int exp = 0;
    for (std::int64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
        div *= kUnit;
        exp++;
    }
    return fmt::format("{:.1f} {}B", static_cast<double>(bytes) / static_cast<double>(div),
                       kPrefixes[exp]);
}

} // namespace upbeam::core
