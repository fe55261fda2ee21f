/*
    config.h
    Loads upbeam settings from a TOML file. Every key is optional, missing
    or invalid values fall back to the built-in defaults.

    Example file:

        [transfer]
        timeout-minutes = 30
        read-buffer-size = 32768
        user-agent = "upbeam/1.0"

        [tls]
        verify-peer = true

        [progress]
        style = "bar"        # bar | json | none
        throttle-ms = 65
        bar-width = 30

        [log]
        level = "info"       # debug | info | warning | error

    Usage:
        Settings settings = LoadConfigFile(path::kDefaultConfigFile);
        TransferOptions options = MakeTransferOptions(settings);
*/

#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/pipeline/transfer_pipeline.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.h>

#ifndef UPBEAM_VERSION
#define UPBEAM_VERSION "0.0.0"
#endif

namespace upbeam::core {

enum class ProgressStyle {
    kBar,  // throttled console bar
    kJson, // one feedback object per line
    kNone, // status lines only
};

std::optional<ProgressStyle> ParseProgressStyle(std::string_view text);
std::string_view ProgressStyleToString(ProgressStyle style);

struct Settings {
    std::chrono::minutes timeout = std::chrono::duration_cast<std::chrono::minutes>(
        transfer::kDefaultTimeout);
    std::size_t read_buffer_size = transfer::kDefaultReadBufferSize;
    std::string user_agent = "upbeam/" UPBEAM_VERSION;
    bool verify_peer = true;
    ProgressStyle progress_style = ProgressStyle::kBar;
    std::chrono::milliseconds progress_throttle = transfer::kDefaultProgressThrottle;
    int progress_bar_width = transfer::kDefaultProgressBarWidth;
    std::optional<std::string> log_level;
};

Settings LoadSettings(const toml::table& config);

// A missing file yields the defaults; a malformed one is logged and ignored
Settings LoadConfigFile(const std::filesystem::path& path);

TransferOptions MakeTransferOptions(const Settings& settings);

} // namespace upbeam::core
