#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace upbeam::cli {

/**
 * @brief Single-line byte progress bar
 *
 * Repaints in place with '\r'. Repaints closer together than the throttle
 * interval are skipped, except the one that reaches the total, after which
 * the line is terminated and further updates are ignored.
 */
class ProgressBar {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        int width = core::transfer::kDefaultProgressBarWidth;
        std::chrono::milliseconds throttle = core::transfer::kDefaultProgressThrottle;
    };

    ProgressBar(std::ostream& out, std::string description, std::int64_t total, Options options);

    // Returns true if the bar was repainted
    bool Update(std::int64_t bytes_so_far);
    bool Update(std::int64_t bytes_so_far, Clock::time_point now);

    // Paints the 0% state before any bytes arrived
    void RenderBlank();

    // Terminates the line if the bar was left unfinished
    void Abandon();

    bool finished() const { return finished_; }

    // The bar text without carriage return, e.g. "Upload  42% [=====>    ] (4.2 KB/10.0 KB)"
    std::string Render(std::int64_t bytes_so_far) const;

private:
    void paint(std::int64_t bytes_so_far);

    std::ostream& out_;
    std::string description_;
    std::int64_t total_;
    Options options_;
    std::optional<Clock::time_point> last_render_;
    std::size_t last_width_ = 0;
    bool painted_ = false;
    bool finished_ = false;
};

} // namespace upbeam::cli
