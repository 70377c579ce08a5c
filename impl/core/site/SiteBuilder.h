#pragma once

#ifndef SITE_BUILDER_H
#define SITE_BUILDER_H

#include <string>
#include <vector>
#include <tuple>
#include <ostream>
#include "SiteConfig.h"

namespace MDS {
    struct SiteReport {
        size_t staticFiles = 0;
        // Written output files, in source order.
        std::vector<std::string> pages;
        // (source path, message) per failed document.
        std::vector<std::tuple<std::string, std::string>> errors;

        bool succeeded() const {
            return errors.empty();
        }
    };

    std::string readTextFile(const std::string& path);
    void writeTextFile(const std::string& path, const std::string& content);

    size_t copyStaticFiles(const std::string& src, const std::string& dest, std::ostream& log);
    void generatePageFile(const std::string& from, const std::string& templatePath, const std::string& dest, const std::string& basePath, std::ostream& log);
    // Documents converted at once by a parallel build.
    size_t siteJobCount(const SiteConfig& config);
    SiteReport buildSite(const SiteConfig& config, std::ostream& log);
}

#endif // SITE_BUILDER_H
