#include <exception>
#include <iostream>

#include "lstree/app.h"
#include "lstree/config.h"

int main(int argc, char** argv) {
    try {
        lstree::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << lstree::Config::instance().program_name() << ": error: " << e.what() << "\n";
        return 1;
    }
}
