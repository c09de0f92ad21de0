#include "lstree/cli.h"

#include <cstdlib>
#include <sstream>
#include <string_view>

#include "lstree/config.h"
#include "lstree/logger.h"

namespace lstree {

namespace {
constexpr std::string_view kDescription =
    "lstree - print a directory tree the way git sees it, with ignored folders collapsed";
}

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "lstree")} {
    app_->set_version_flag("--version", "1.0.0");
    app_->footer(R"(Ignore rules are read from .gitignore files at every level of the tree and
resolved relative to the directory that declares them. The .git directory and
the patterns given with --ignore apply from the scan root.

Ignored directories are shown as "(ignored)" and never entered; ignored files
are omitted. With --max-leaf N, a directory holding more than N visible entries
is shown as "(too many files)" and not expanded.

Exit status:
 0  if OK,
 1  if the tree could not be printed.)");

    auto* path = app_->add_option("path", path_arg_, "Directory to display (default: current directory)");
    path->check(CLI::ExistingPath);
    document_option(path);

    add_scan_options();
    add_output_options();
    add_diagnostic_options();

    auto* dump = app_->add_flag("--dump-markdown", options_.dump_markdown,
                                "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Cli::~Cli() = default;

void Cli::add_scan_options() {
    auto scan = app_->add_option_group("Scanning");

    auto* max_leaf = scan->add_option("-m,--max-leaf,--maxLeaf", options_.max_leaf,
                                      "Collapse directories with more than N visible entries");
    max_leaf->type_name("N");
    max_leaf->check(CLI::PositiveNumber);
    document_option(max_leaf);

    auto* ignore = scan->add_option("-I,--ignore", options_.ignore_patterns,
                                    "Extra ignore pattern applied at the scan root (repeatable)");
    ignore->type_name("PATTERN");
    ignore->allow_extra_args(false);
    document_option(ignore);
}

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    document_option(output->add_flag("-s,--summary", options_.show_summary,
                                     "Print folder and file totals after the tree"));

    document_option(output->add_flag_callback("--no-color", [&]() { options_.color_enabled = false; },
                                              "Disable ANSI colors"));

    document_option(output->add_flag_callback("--no-icons", [&]() { options_.icons_enabled = false; },
                                              "Disable icons"));
}

void Cli::add_diagnostic_options() {
    auto diagnostics = app_->add_option_group("Diagnostics");

    document_option(diagnostics->add_flag("-v,--verbose", verbosity_,
                                          "Log progress to stderr (repeat for more detail)"));

    auto* level = diagnostics->add_option("--log-level", log_level_arg_, "Set the log level explicitly");
    level->check(CLI::IsMember({"error", "warn", "info", "debug", "trace"}, CLI::ignore_case));
    document_option(level);
}

void Cli::reset() {
    options_ = Config::Options{};
    path_arg_.clear();
    log_level_arg_.clear();
    verbosity_ = 0;
}

void Cli::finalize() {
    if (!path_arg_.empty()) {
        options_.path = path_arg_;
    }

    if (!log_level_arg_.empty()) {
        if (auto level = Logger::parse_level(log_level_arg_)) {
            options_.log_level = *level;
        }
    } else if (verbosity_ >= 3) {
        options_.log_level = Logger::Level::Trace;
    } else if (verbosity_ == 2) {
        options_.log_level = Logger::Level::Debug;
    } else if (verbosity_ == 1) {
        options_.log_level = Logger::Level::Info;
    }
}

Config::Options Cli::parse(int argc, char** argv) {
    reset();
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        std::exit(app_->exit(ex));
    }
    finalize();
    return options_;
}

Config::Options Cli::parse_or_throw(const std::vector<std::string>& args) {
    reset();
    // CLI11 consumes the vector from the back
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    app_->parse(reversed);
    finalize();
    return options_;
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | "
            << doc.default_value << " |\n";
    }
    out << '\n';
    return out.str();
}

} // namespace lstree
