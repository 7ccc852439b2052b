/**
 * @fileoverview main.cpp
 * @brief Entry point: parses the command line and runs the window host.
 */

#include <cstdlib>

#include "contraption/app/host_options.hpp"
#include "contraption/app/presentation_manager.hpp"

int main(int argc, char** argv) {
    HostOptions options;
    if (!parseHostArgs(argc, argv, options)) {
        return EXIT_FAILURE;
    }

    PresentationManager host(options);
    host.run();

    return EXIT_SUCCESS;
}
