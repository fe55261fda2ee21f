#include <core/util/config.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace upbeam::core {

std::optional<ProgressStyle> ParseProgressStyle(std::string_view text) {
    if (text == "bar") {
        return ProgressStyle::kBar;
    }
    if (text == "json") {
        return ProgressStyle::kJson;
    }
    if (text == "none") {
        return ProgressStyle::kNone;
    }
    return std::nullopt;
}

std::string_view ProgressStyleToString(ProgressStyle style) {
    switch (style) {
    case ProgressStyle::kBar:
        return "bar";
    case ProgressStyle::kJson:
        return "json";
    case ProgressStyle::kNone:
        return "none";
    }
    return "bar";
}

static void LoadTransferSection(const toml::table& config, Settings& settings) {
    auto section = config["transfer"];

    if (auto minutes = section["timeout-minutes"].value<std::int64_t>()) {
        if (*minutes <= 0) {
            spdlog::warn("Ignoring non-positive transfer.timeout-minutes = {}", *minutes);
        } else if (*minutes > transfer::kMaxTimeout.count()) {
            spdlog::warn("Ignoring transfer.timeout-minutes = {}, the limit is {}",
                         *minutes,
                         transfer::kMaxTimeout.count());
        } else {
            settings.timeout = std::chrono::minutes(*minutes);
        }
    }

    if (auto size = section["read-buffer-size"].value<std::int64_t>()) {
        if (*size > 0 && static_cast<std::size_t>(*size) <= transfer::kMaxReadBufferSize) {
            settings.read_buffer_size = static_cast<std::size_t>(*size);
        } else {
            spdlog::warn("Ignoring out of range transfer.read-buffer-size = {}", *size);
        }
    }

    if (auto agent = section["user-agent"].value<std::string>()) {
        if (!agent->empty()) {
            settings.user_agent = *agent;
        }
    }
}

static void LoadProgressSection(const toml::table& config, Settings& settings) {
    auto section = config["progress"];

    if (auto style = section["style"].value<std::string>()) {
        if (auto parsed = ParseProgressStyle(*style)) {
            settings.progress_style = *parsed;
        } else {
            spdlog::warn("Unknown progress.style \"{}\", using \"{}\"",
                         *style,
                         ProgressStyleToString(settings.progress_style));
        }
    }

    if (auto throttle = section["throttle-ms"].value<std::int64_t>()) {
        if (*throttle >= 0) {
            settings.progress_throttle = std::chrono::milliseconds(*throttle);
        } else {
            spdlog::warn("Ignoring negative progress.throttle-ms = {}", *throttle);
        }
    }

    if (auto width = section["bar-width"].value<std::int64_t>()) {
        if (*width > 0 && *width <= 200) {
            settings.progress_bar_width = static_cast<int>(*width);
        } else {
            spdlog::warn("Ignoring out of range progress.bar-width = {}", *width);
        }
    }
}

Settings LoadSettings(const toml::table& config) {
    Settings settings;

    LoadTransferSection(config, settings);
    LoadProgressSection(config, settings);

    settings.verify_peer = config["tls"]["verify-peer"].value_or(true);

    if (auto level = config["log"]["level"].value<std::string>()) {
        settings.log_level = *level;
    }

    return settings;
}

Settings LoadConfigFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("No config file at \"{}\", using defaults", path.string());
        return Settings{};
    }

    try {
        toml::table config = toml::parse_file(path.string());
        spdlog::debug("Loaded config from \"{}\"", path.string());
        return LoadSettings(config);
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        return Settings{};
    }
}

TransferOptions MakeTransferOptions(const Settings& settings) {
    TransferOptions options;
    options.client.timeout = settings.timeout;
    options.client.verify_peer = settings.verify_peer;
    options.client.user_agent = settings.user_agent;
    options.read_buffer_size = settings.read_buffer_size;
    return options;
}

} // namespace upbeam::core
