#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../shared/Components.h"

//#define DEBUG

int main(int argc, char* argv[]) {
    std::vector<std::string> argVector(argv, argv + argc);
    auto printInfo = [](std::ostream& stream) {
        stream << "mds: A Markdown Static Site Generator\n";
        stream << "Built at: " __TIME__ " " __DATE__ << "\n";
        stream.flush();
    };
    auto printHelp = [&argVector](std::ostream& stream) {
        stream << "Usage:\n"
            << argVector[0] << " --render <path_md>\n"
            << "    Print the HTML fragment for the markdown file <path_md>.\n"
            << argVector[0] << " --page <path_md> <path_template> <path_out> [<base_path>]\n"
            << "    Fill <path_template> with the page generated from <path_md> and write it to <path_out>.\n"
            << argVector[0] << " --site [<base_path>] [--parallel] [--jobs <n>] [--keep-going]\n"
            << "    Build 'content' into 'docs' with 'template.html' and 'static' from the current directory.\n"
            << "    --parallel converts documents concurrently, --jobs bounds how many at once,\n"
            << "    --keep-going continues past documents that fail.\n"
            << argVector[0] << " --help\n"
            << argVector[0] << " -h\n"
            << "    Print this help message.\n";
    };
    auto printInvalidArguments = [&argVector, &printInfo, &printHelp]() {
        printInfo(std::cerr);
        std::cerr << "invalid arguments:";
        for (const auto& arg : argVector) {
            std::cerr << " " << arg;
        }
        std::cerr << "\n";
        printHelp(std::cerr);
        return 2;
    };
    if (argc == 3 && argVector[1] == "--render") {
        const auto inputPath = argVector[2];
        if (!std::filesystem::is_regular_file(inputPath)) {
            printInfo(std::cerr);
            std::cerr << "file " << inputPath << " is not valid\n";
            return 1;
        }
#ifndef DEBUG
        try {
#endif // DEBUG
            auto markdown = MDS::readTextFile(inputPath);
            std::cout << MDS::buildDocument(markdown)->render() << "\n";
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << "Error in " << inputPath << ": " << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
    }
    else if ((argc == 5 || argc == 6) && argVector[1] == "--page") {
        const auto inputPath = argVector[2];
        const auto templatePath = argVector[3];
        const auto outputPath = argVector[4];
        const auto basePath = MDS::normalizeBasePath(argc == 6 ? argVector[5] : "/");
        printInfo(std::cout);
        if (!std::filesystem::is_regular_file(inputPath)) {
            std::cerr << "file " << inputPath << " is not valid\n";
            return 1;
        }
#ifndef DEBUG
        try {
#endif // DEBUG
            MDS::generatePageFile(inputPath, templatePath, outputPath, basePath, std::cout);
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << "Error in " << inputPath << ": " << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
    }
    else if (argc >= 2 && argVector[1] == "--site") {
        MDS::SiteConfig config;
        try {
            config = MDS::siteConfigFromArguments(std::vector<std::string>(argVector.begin() + 2, argVector.end()));
        }
        catch (const std::invalid_argument& e) {
            std::cerr << e.what() << '\n';
            return printInvalidArguments();
        }
        printInfo(std::cout);
        MDS::SiteReport report;
#ifndef DEBUG
        try {
#endif // DEBUG
            report = MDS::buildSite(config, std::cout);
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
        if (!report.succeeded()) {
            std::cerr << "\nErrors:\n";
            for (const auto& [path, message] : report.errors) {
                std::cerr << "Error in " << path << ": " << message << "\n";
            }
        }
        std::cout << "generated " << report.pages.size() << " page(s) and copied "
            << report.staticFiles << " static file(s) in " << config.outputDir << "\n";
        return report.succeeded() ? 0 : 1;
    }
    else if (argc == 2 && (argVector[1] == "--help" || argVector[1] == "-h")) {
        printInfo(std::cout);
        printHelp(std::cout);
    }
    else {
        return printInvalidArguments();
    }
    return 0;
}
