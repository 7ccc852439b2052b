/**
 * @fileoverview host_options.cpp
 * @brief Command line parsing for the window host.
 */

#include "contraption/app/host_options.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <sstream>
#include <vector>

namespace {

std::vector<std::string> splitNames(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

bool parseSize(const std::string& text, unsigned int& w, unsigned int& h) {
    auto const sep = text.find('x');
    if (sep == std::string::npos) {
        return false;
    }
    try {
        unsigned long const pw = std::stoul(text.substr(0, sep));
        unsigned long const ph = std::stoul(text.substr(sep + 1));
        if (pw == 0 || ph == 0) {
            return false;
        }
        w = static_cast<unsigned int>(pw);
        h = static_cast<unsigned int>(ph);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool parseHostArgs(int argc, const char* const* argv, HostOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string const arg = argv[i];
        bool const hasValue = i + 1 < argc;

        if (arg == "--state" && hasValue) {
            options.statePath = argv[++i];
            options.persistState = true;
        } else if (arg == "--seed" && hasValue) {
            try {
                options.simConfig.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid seed: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--chambers" && hasValue) {
            options.simConfig.chamberOrder = splitNames(argv[++i]);
        } else if (arg == "--size" && hasValue) {
            if (!parseSize(argv[++i], options.windowWidth, options.windowHeight)) {
                std::cerr << "Invalid size, expected WxH: " << argv[i] << std::endl;
                return false;
            }
        } else {
            std::cerr << "Usage: " << (argc > 0 ? argv[0] : "contraption")
                      << " [--state FILE] [--seed N] [--chambers a,b,c] [--size WxH]" << std::endl;
            return false;
        }
    }
    return true;
}
