#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <future>
#include <thread>
#include <system_error>
#include <algorithm>
#include <stdexcept>
#include "SiteBuilder.h"
#include "../docgen/HtmlDocGen.h"

namespace MDS {

std::string readTextFile(const std::string& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("unable to open " + path);
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void writeTextFile(const std::string& path, const std::string& content) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("unable to open " + path);
    }
    output << content;
    output.flush();
    if (!output) {
        throw std::runtime_error("unable to write " + path);
    }
}

size_t copyStaticFiles(const std::string& src, const std::string& dest, std::ostream& log) {
    if (!std::filesystem::exists(src)) {
        return 0;
    }
    std::filesystem::remove_all(dest);
    std::filesystem::create_directories(dest);
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(src)) {
        auto target = std::filesystem::path(dest) / std::filesystem::relative(entry.path(), src);
        if (entry.is_directory()) {
            std::filesystem::create_directories(target);
        }
        else if (entry.is_regular_file()) {
            std::filesystem::create_directories(target.parent_path());
            std::filesystem::copy_file(entry.path(), target, std::filesystem::copy_options::overwrite_existing);
            log << "Copied " << entry.path().string() << " -> " << target.string() << "\n";
            ++count;
        }
    }
    return count;
}

void generatePageFile(const std::string& from, const std::string& templatePath, const std::string& dest, const std::string& basePath, std::ostream& log) {
    log << "Generating page from " << from << " to " << dest << " using " << templatePath << "\n";
    auto markdown = readTextFile(from);
    auto pageTemplate = readTextFile(templatePath);
    writeTextFile(dest, generatePage(markdown, pageTemplate, basePath));
}

static std::vector<std::filesystem::path> listMarkdownFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".md") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

size_t siteJobCount(const SiteConfig& config) {
    if (config.jobs) {
        return config.jobs;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

SiteReport buildSite(const SiteConfig& config, std::ostream& log) {
    SiteReport report;
    report.staticFiles = copyStaticFiles(config.staticDir, config.outputDir, log);

    if (!std::filesystem::is_directory(config.contentDir)) {
        throw std::runtime_error("unable to open " + config.contentDir);
    }
    const auto pageTemplate = readTextFile(config.templatePath);
    const auto sources = listMarkdownFiles(config.contentDir);

    auto destinationOf = [&config](const std::filesystem::path& source) {
        auto dest = std::filesystem::path(config.outputDir) / std::filesystem::relative(source, config.contentDir);
        dest.replace_extension(".html");
        return dest.string();
    };
    auto convert = [&pageTemplate, &config](const std::string& source) {
        return generatePage(readTextFile(source), pageTemplate, config.basePath);
    };

    // Pages are converted independently, then written and reported in source order.
    // At most `window` conversions are in flight ahead of the writer.
    const size_t window = config.parallel ? siteJobCount(config) : 0;
    std::vector<std::future<std::string>> pending(sources.size());
    size_t launched = 0;
    auto launchUpTo = [&](size_t limit) {
        for (; launched < limit && launched < sources.size(); ++launched) {
            const auto source = sources[launched].string();
            try {
                pending[launched] = std::async(std::launch::async, convert, source);
            }
            catch (const std::system_error&) {
                // no thread available: convert on this thread when the result is collected
                pending[launched] = std::async(std::launch::deferred, convert, source);
            }
        }
    };
    for (size_t i = 0; i < sources.size(); ++i) {
        if (config.parallel) {
            launchUpTo(i + window);
        }
        const auto source = sources[i].string();
        const auto dest = destinationOf(sources[i]);
        log << "Generating page from " << source << " to " << dest << " using " << config.templatePath << "\n";
        try {
            auto html = config.parallel ? pending[i].get() : convert(source);
            writeTextFile(dest, html);
            report.pages.push_back(dest);
        }
        catch (const std::exception& e) {
            report.errors.emplace_back(source, e.what());
            if (config.failFast) {
                break;
            }
        }
    }
    return report;
}

}
