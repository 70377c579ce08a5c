#include <string>
#include <vector>
#include <stdexcept>
#include "SiteConfig.h"

namespace MDS {

std::string normalizeBasePath(const std::string& basePath) {
    if (basePath.empty() || basePath.back() != '/') {
        return basePath + "/";
    }
    return basePath;
}

static unsigned parseJobs(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("--jobs expects a positive number, got '" + text + "'");
    }
    unsigned long jobs = text.size() > 4 ? 0 : std::stoul(text);
    if (jobs == 0 || jobs > 1024) {
        throw std::invalid_argument("--jobs must be between 1 and 1024, got " + text);
    }
    return static_cast<unsigned>(jobs);
}

SiteConfig siteConfigFromArguments(const std::vector<std::string>& arguments) {
    SiteConfig config;
    bool hasBasePath = false;
    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& arg = arguments[i];
        if (arg == "--parallel") {
            config.parallel = true;
        }
        else if (arg == "--keep-going") {
            config.failFast = false;
        }
        else if (arg == "--jobs") {
            if (i + 1 >= arguments.size()) {
                throw std::invalid_argument("--jobs expects a value");
            }
            config.jobs = parseJobs(arguments[++i]);
            config.parallel = true;
        }
        else if (arg.substr(0, 2) == "--") {
            throw std::invalid_argument("unknown option " + arg);
        }
        else if (!hasBasePath) {
            config.basePath = normalizeBasePath(arg);
            hasBasePath = true;
        }
        else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }
    return config;
}

}
