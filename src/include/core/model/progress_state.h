#pragma once

#include <algorithm>
#include <cstdint>

namespace upbeam::core {

struct ProgressState {
    std::int64_t total_size = 0; // <= 0 when the stream length is unknown
    std::int64_t bytes_so_far = 0;

    bool HasTotal() const { return total_size > 0; }

    // Only meaningful when HasTotal(); never exceeds 100
    double Percentage() const {
        if (!HasTotal()) {
            return 0.0;
        }
        double percentage = static_cast<double>(bytes_so_far) / static_cast<double>(total_size)
                            * 100.0;
        return std::min(percentage, 100.0);
    }

    bool IsComplete() const { return HasTotal() && bytes_so_far >= total_size; }
};

} // namespace upbeam::core
