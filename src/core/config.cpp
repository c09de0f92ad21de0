#include "lstree/config.h"

#include <utility>

namespace lstree {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

BuildOptions Config::build_options() const {
    BuildOptions build;
    build.max_leaf = options_.max_leaf;
    build.ignore_patterns = options_.ignore_patterns;
    return build;
}

void Config::set_program_name(std::string_view name) {
    auto base = std::filesystem::path{std::string{name}}.filename().string();
    if (!base.empty()) {
        program_name_ = std::move(base);
    }
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace lstree
