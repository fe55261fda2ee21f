#include <algorithm>
#include <cli/progress_bar.h>
#include <core/util/format.h>
#include <spdlog/fmt/fmt.h>

namespace upbeam::cli {

ProgressBar::ProgressBar(std::ostream& out,
                         std::string description,
                         std::int64_t total,
                         Options options)
    : out_(out)
    , description_(std::move(description))
    , total_(total)
    , options_(options) {}

bool ProgressBar::Update(std::int64_t bytes_so_far) {
    return Update(bytes_so_far, Clock::now());
}

bool ProgressBar::Update(std::int64_t bytes_so_far, Clock::time_point now) {
    if (finished_) {
        return false;
    }

    bool complete = total_ > 0 && bytes_so_far >= total_;
    if (!complete && last_render_ && now - *last_render_ < options_.throttle) {
        return false;
    }

    last_render_ = now;
    paint(bytes_so_far);

    if (complete) {
        out_ << '\n' << std::flush;
        finished_ = true;
    }
    return true;
}

void ProgressBar::RenderBlank() {
    if (!finished_) {
        paint(0);
    }
}

void ProgressBar::Abandon() {
    if (painted_ && !finished_) {
        out_ << '\n' << std::flush;
        finished_ = true;
    }
}

std::string ProgressBar::Render(std::int64_t bytes_so_far) const {
    double fraction = total_ > 0 ? static_cast<double>(bytes_so_far) / static_cast<double>(total_)
                                 : 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);

    int width = std::max(options_.width, 1);
    int filled = static_cast<int>(fraction * width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(width));
    for (int cell = 0; cell < width; ++cell) {
        if (cell < filled) {
            bar.push_back('=');
        } else if (cell == filled && filled < width) {
            bar.push_back(fraction > 0.0 ? '>' : ' ');
        } else {
            bar.push_back(' ');
        }
    }

    return fmt::format("{} {:3d}% [{}] ({}/{})",
                       description_,
                       static_cast<int>(fraction * 100.0),
                       bar,
                       core::FormatBytes(bytes_so_far),
                       core::FormatBytes(total_));
}

void ProgressBar::paint(std::int64_t bytes_so_far) {
    std::string line = Render(bytes_so_far);
    out_ << '\r' << line;
    // Clear leftovers of a longer previous line
    if (line.size() < last_width_) {
        out_ << std::string(last_width_ - line.size(), ' ');
    }
    out_ << std::flush;
    last_width_ = line.size();
    painted_ = true;
}

} // namespace upbeam::cli
