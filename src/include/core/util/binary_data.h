#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace upbeam {

using BinaryData = std::vector<std::uint8_t>;

inline std::string ToString(const BinaryData& data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

inline BinaryData ToBinary(std::string_view text) {
    return BinaryData(text.begin(), text.end());
}

} // namespace upbeam
