#pragma once

#include <cstdint>
#include <string>

namespace upbeam::core {

// "512 B", "1.5 KB", "10.0 MB" ... in units of 1024
std::string FormatBytes(std::int64_t bytes);

} // namespace upbeam::core
