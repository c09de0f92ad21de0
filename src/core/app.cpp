#include "lstree/app.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "lstree/cli.h"
#include "lstree/config.h"
#include "lstree/logger.h"
#include "lstree/perf.h"
#include "lstree/platform.h"
#include "lstree/renderer.h"
#include "lstree/summary.h"
#include "lstree/tree.h"

namespace lstree {

class App::Impl {
public:
    int run(int argc, char** argv) {
        auto& config = Config::instance();
        config.set_program_name(argc > 0 && argv ? argv[0] : "lstree");

        Cli cli;
        auto options = cli.parse(argc, argv);
        Logger::instance().set_level(options.log_level);
        if (!platform::stdout_supports_color()) {
            options.color_enabled = false;
        }
        config.set_options(std::move(options));

        if (config.options().dump_markdown) {
            std::cout << cli.usage_markdown();
            return 0;
        }

        return print_tree(std::cout);
    }

    int run(const Config::Options& options, std::ostream& out) {
        Config::instance().set_options(options);
        return print_tree(out);
    }

private:
    int print_tree(std::ostream& out) {
        const auto& config = Config::instance();
        const auto& options = config.options();
        TreeBuilder builder{config.build_options()};

        TreeNode tree;
        {
            perf::ScopedTimer timer{std::string{"scan:"} + options.path.string()};
            tree = builder.build(options.path);
        }

        Renderer renderer{options, out};
        renderer.render(tree);

        if (options.show_summary) {
            const auto summary = summarize(tree);
            Logger::instance().info("{} folder(s), {} file(s), {} ignored, {} collapsed", summary.total_folders,
                                    summary.total_files, summary.skipped_by_ignore, summary.skipped_by_size);
            renderer.render_summary(summary);
        }
        out.flush();
        return 0;
    }
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

int App::run(const Config::Options& options, std::ostream& out) {
    return impl_->run(options, out);
}

} // namespace lstree
