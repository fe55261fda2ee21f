#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>

namespace upbeam {

/**
 * @brief Installs the process-wide spdlog logger
 *
 * Log records go to a daily file and to a colored stderr sink; stdout is
 * left alone because it carries the response body. Owning scope controls
 * the lifetime, spdlog is shut down on destruction.
 */
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;
    Logger(Level level,
           const std::filesystem::path& filepath,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        std::error_code ec;
        std::filesystem::create_directories(filepath.parent_path(), ec);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };

        stderr_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        std::shared_ptr<spdlog::sinks::daily_file_sink_mt> file_sink;
        if (!ec) {
            try {
                file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(filepath.string(),
                                                                                0,
                                                                                0,
                                                                                false,
                                                                                0,
                                                                                handlers);
            } catch (const spdlog::spdlog_ex& e) {
                std::fprintf(stderr, "upbeam: file logging disabled: %s\n", e.what());
            }
        }

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        if (file_sink) {
            logger_ = std::make_shared<LoggerType>("upbeam",
                                                   spdlog::sinks_init_list{file_sink, stderr_sink_},
                                                   thread_pool_,
                                                   spdlog::async_overflow_policy::block);
        } else {
            logger_ = std::make_shared<LoggerType>("upbeam",
                                                   spdlog::sinks_init_list{stderr_sink_},
                                                   thread_pool_,
                                                   spdlog::async_overflow_policy::block);
        }

#ifdef UPBEAM_RELEASE
        stderr_sink_->set_level(Level::warn);
#endif
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        logger_->set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str());
        });

        /* more about pattern:
         * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
         */
        stderr_sink_->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }
    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    // Console verbosity, independent of what reaches the log file
    void set_console_level(Level level) { stderr_sink_->set_level(level); }

    // Accepts debug|info|warning|error (case sensitive, "warn" also accepted)
    static std::optional<Level> ParseLevel(std::string_view text) {
        if (text == "debug") {
            return Level::debug;
        }
        if (text == "info") {
            return Level::info;
        }
        if (text == "warning" || text == "warn") {
            return Level::warn;
        }
        if (text == "error") {
            return Level::err;
        }
        return std::nullopt;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink_;
};
} // namespace upbeam
