#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <cctype>
#include <cli/argument_parser.h>
#include <cli/console_reporter.h>
#include <core/constant/path.h>
#include <core/error/transfer_error.h>
#include <core/pipeline/transfer_pipeline.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <exception>
#include <iostream>
#include <optional>

namespace net = boost::asio;

using namespace upbeam;

namespace {

std::optional<Logger::Level> resolveLevel(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return Logger::ParseLevel(text);
}

// Command line values win over the config file
void applyOverrides(const cli::CliOptions& options, core::Settings& settings) {
    if (options.timeout_minutes) {
        settings.timeout = std::chrono::minutes(*options.timeout_minutes);
    }
    if (options.progress_style) {
        settings.progress_style = *core::ParseProgressStyle(*options.progress_style);
    }
    if (options.insecure) {
        settings.verify_peer = false;
    }
    if (options.log_level) {
        settings.log_level = options.log_level;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cli::ArgumentParser parser(argc, argv);
    cli::CliOptions options;
    try {
        options = parser.Parse();
    } catch (const cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        parser.ShowHelp(std::cerr);
        return 1;
    }
    if (options.show_help) {
        parser.ShowHelp(std::cout);
        return 0;
    }

#ifdef UPBEAM_DEBUG
    Logger logger(Logger::Level::debug, core::path::kLogDir / "upbeam.log");
#else
    Logger logger(Logger::Level::info, core::path::kLogDir / "upbeam.log");
#endif
    // Keep the console for progress output unless a level was asked for
    logger.set_console_level(Logger::Level::warn);

    core::Settings settings = core::LoadConfigFile(
        options.config_path ? std::filesystem::path(*options.config_path)
                            : core::path::kDefaultConfigFile);
    applyOverrides(options, settings);

    if (settings.log_level) {
        if (auto level = resolveLevel(*settings.log_level)) {
            logger.set_log_level(*level);
            logger.set_console_level(*level);
        } else {
            spdlog::warn("Ignoring unknown log level '{}'", *settings.log_level);
        }
    }

    spdlog::info("upbeam {} starting", UPBEAM_VERSION);

    try {
        core::OpenSSLProvider::InitOpenSSL();
    } catch (const std::exception& e) {
        spdlog::error("TLS initialization failed: {}", e.what());
        return 1;
    }

    net::io_context ioc;
    cli::ConsoleReporter reporter(std::cerr,
                                  settings.progress_style,
                                  cli::ProgressBar::Options{
                                      .width = settings.progress_bar_width,
                                      .throttle = settings.progress_throttle,
                                  });

    core::TransferPipeline pipeline(ioc,
                                    core::TransferRequest{
                                        .source_path = options.file,
                                        .destination_url = options.url,
                                    },
                                    core::MakeTransferOptions(settings),
                                    reporter.Callback());

    std::exception_ptr failure;
    std::optional<core::TransferResult> result;
    net::co_spawn(ioc,
                  pipeline.Run(),
                  [&](std::exception_ptr e, core::TransferResult r) {
                      if (e) {
                          failure = e;
                      } else {
                          result = std::move(r);
                      }
                  });
    ioc.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const core::TransferError& e) {
            spdlog::error("{} error: {}", core::ErrorKindToString(e.kind()), e.what());
        } catch (const std::exception& e) {
            spdlog::error("Upload aborted: {}", e.what());
        }
        return 1;
    }

    std::cout << result->BodyText() << std::flush;
    return 0;
}
