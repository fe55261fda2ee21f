#pragma once

#include <boost/program_options/options_description.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace upbeam::cli {

struct CliOptions {
    std::string file;
    std::string url;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> progress_style;
    std::optional<int> timeout_minutes;
    bool insecure = false;
    bool show_help = false;
};

// Thrown for anything that should be answered with the usage text
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Parses argv into CliOptions, throws UsageError
    CliOptions Parse();

    void ShowHelp(std::ostream& out) const;

private:
    int argc_;
    char** argv_;
    boost::program_options::options_description desc_;

    void validateOptions(const CliOptions& options) const;
};

} // namespace upbeam::cli
