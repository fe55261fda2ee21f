#include <algorithm>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cctype>
#include <cli/argument_parser.h>
#include <core/util/config.h>
#include <core/util/logger.h>

namespace po = boost::program_options;

namespace upbeam::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , desc_("Options") {
    // clang-format off
    desc_.add_options()
        ("file,f", po::value<std::string>()->value_name("PATH"), "File to upload (required)")
        ("url,u", po::value<std::string>()->value_name("URL"),
         "Destination http:// or https:// URL (required)")
        ("config,c", po::value<std::string>()->value_name("PATH"),
         "Config file (default: ~/.config/upbeam/config.toml)")
        ("timeout,t", po::value<int>()->value_name("MINUTES"),
         "Overall request deadline (default: 30)")
        ("progress,p", po::value<std::string>()->value_name("STYLE"),
         "Progress output: bar|json|none (default: bar)")
        ("insecure,k", po::bool_switch(), "Do not verify the server TLS certificate")
        ("log-level,l", po::value<std::string>()->value_name("LEVEL"),
         "Set log level (debug|info|warning|error)")
        ("help,h", "Show this help message");
    // clang-format on
}

CliOptions ArgumentParser::Parse() {
    CliOptions options;
    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc_, argv_).options(desc_).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    if (vm.count("help")) {
        options.show_help = true;
        return options;
    }

    if (vm.count("file")) {
        options.file = vm["file"].as<std::string>();
    }
    if (vm.count("url")) {
        options.url = vm["url"].as<std::string>();
    }
    if (vm.count("config")) {
        options.config_path = vm["config"].as<std::string>();
    }
    if (vm.count("timeout")) {
        options.timeout_minutes = vm["timeout"].as<int>();
    }
    if (vm.count("progress")) {
        options.progress_style = vm["progress"].as<std::string>();
    }
    if (vm.count("log-level")) {
        options.log_level = vm["log-level"].as<std::string>();
    }
    options.insecure = vm["insecure"].as<bool>();

    validateOptions(options);
    return options;
}

void ArgumentParser::validateOptions(const CliOptions& options) const {
    if (options.file.empty() || options.url.empty()) {
        throw UsageError("Missing required arguments --file and --url");
    }

    if (options.timeout_minutes && *options.timeout_minutes <= 0) {
        throw UsageError("Timeout must be a positive number of minutes");
    }
    if (options.timeout_minutes
        && *options.timeout_minutes > core::transfer::kMaxTimeout.count()) {
        throw UsageError(fmt::format("Timeout must not exceed {} minutes",
                                     core::transfer::kMaxTimeout.count()));
    }

    if (options.progress_style && !core::ParseProgressStyle(*options.progress_style)) {
        throw UsageError("Invalid progress style: " + *options.progress_style);
    }

    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (!Logger::ParseLevel(level)) {
            throw UsageError("Invalid log level: " + *options.log_level);
        }
    }
}

void ArgumentParser::ShowHelp(std::ostream& out) const {
    out << "Usage: upbeam --file PATH --url URL [options]\n\n"
        << "Upload a file to an HTTP endpoint as multipart/form-data.\n\n"
        << desc_;
}

} // namespace upbeam::cli
