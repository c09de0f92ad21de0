#pragma once

#include <iosfwd>
#include <memory>

#include "lstree/config.h"

namespace lstree {

class App {
public:
    App();
    ~App();

    int run(int argc, char** argv);

    // Stores the parsed options in Config, then builds and prints the tree.
    int run(const Config::Options& options, std::ostream& out);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lstree
