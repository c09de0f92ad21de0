#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <vector>

#include "lstree/config.h"

namespace lstree {

class Cli {
public:
    Cli();
    ~Cli();

    // Exits the process through CLI::App::exit on --help, --version or a parse error.
    Config::Options parse(int argc, char** argv);

    // Throws CLI::ParseError instead of exiting.
    Config::Options parse_or_throw(const std::vector<std::string>& args);

    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    void add_scan_options();
    void add_output_options();
    void add_diagnostic_options();
    void reset();
    void finalize();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::string path_arg_;
    std::string log_level_arg_;
    int verbosity_ = 0;
    std::vector<OptionDoc> docs_;
};

} // namespace lstree

#include "lstree/cli.tpp"
