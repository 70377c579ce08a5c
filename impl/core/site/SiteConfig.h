#pragma once

#ifndef SITE_CONFIG_H
#define SITE_CONFIG_H

#include <string>
#include <vector>

namespace MDS {
    struct SiteConfig {
        std::string contentDir = "content";
        std::string templatePath = "template.html";
        std::string staticDir = "static";
        std::string outputDir = "docs";
        std::string basePath = "/";
        bool parallel = false;
        bool failFast = true;
        // Upper bound on documents converted at once; 0 picks the hardware concurrency.
        unsigned jobs = 0;
    };

    // Appends a trailing '/' when missing; an empty path becomes "/".
    std::string normalizeBasePath(const std::string& basePath);

    // Fills a config from the arguments following `--site`:
    //   [<base_path>] [--parallel] [--keep-going] [--jobs <n>]
    // Throws std::invalid_argument on anything else.
    SiteConfig siteConfigFromArguments(const std::vector<std::string>& arguments);
}

#endif // SITE_CONFIG_H
