#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <functional>
#include <memory>
#include <chrono>
#include <thread>
#include <future>
#include <optional>
#include <vector>
#include <algorithm>
#include "../shared/Components.h"
#include "../shared/TimedTask.h"

//#define DEBUG

int main(int argc, char* argv[]) {
    std::vector<std::string> argVector(argv, argv + argc);
    auto printInfo = [](std::ostream& stream) {
        stream << "mds-test: A Markdown Static Site Generator Test Runner\n";
        stream << "Built at: " __TIME__ " " __DATE__ << "\n";
        stream.flush();
    };
    auto printHelp = [&argVector](std::ostream& stream) {
        stream << "Usage:\n"
            << argVector[0] << " --test <path>\n"
            << "    <path> must contain 'valid' and 'invalid' subdirectories, each\n"
            << "    with one or more '.md' test files.\n"
            << "    - Valid tests must render to the contents of the sibling '.html' file.\n"
            << "    - Invalid tests are expected to fail with a markdown error.\n"
            << argVector[0] << " --help\n"
            << argVector[0] << " -h\n"
            << "    Print this help message.\n";
    };
    if (argc >= 3 && argVector[1] == "--test") {
        int retVal = 0;
        for (size_t i = 3; i < argVector.size(); ++i) {
            const std::string& arg = argv[i];
            printInfo(std::cerr);
            std::cerr << "invalid arguments:" << arg;
            for (const auto& a : argVector) {
                std::cerr << " " << a;
            }
            std::cerr << "\n";
            printHelp(std::cerr);
            return 2;
        }
        const auto inputPath = argVector[2];
        printInfo(std::cout);
        if (!std::filesystem::exists(inputPath) || !std::filesystem::is_directory(inputPath)) {
            std::cerr << "provided path is not a directory: " << inputPath << "\n";
            printHelp(std::cerr);
            return 2;
        }

        auto validDir = std::filesystem::path(inputPath) / "valid";
        auto invalidDir = std::filesystem::path(inputPath) / "invalid";
        if (!std::filesystem::exists(validDir) || !std::filesystem::is_directory(validDir) ||
            !std::filesystem::exists(invalidDir) || !std::filesystem::is_directory(invalidDir)) {
            std::cerr << "test directory must contain 'valid' and 'invalid' subdirectories\n";
            printHelp(std::cerr);
            return 2;
        }

        struct SingleRunResult {
            std::string html;
            std::optional<std::string> error;
        };

        // Only markdown errors count as an expected failure; anything else propagates.
        auto runSingle = [](const std::string& path) -> SingleRunResult {
            auto markdown = MDS::readTextFile(path);
            SingleRunResult r;
            try {
                r.html = MDS::buildDocument(markdown)->render();
            }
            catch (const MDS::MdsError& e) {
                r.error = e.what();
            }
            return r;
        };

        struct TestOutcome {
            std::string name;
            std::string path;
            size_t timeMs;
            bool success;
            std::string reason;
            std::vector<std::string> details;
        };

        auto listTests = [](const std::filesystem::path& dir) -> std::vector<std::filesystem::path> {
            std::vector<std::filesystem::path> files;
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_regular_file() && entry.path().extension() == ".md") {
                    files.push_back(entry.path());
                }
            }
            std::sort(files.begin(), files.end());
            return files;
        };

        auto validTests = listTests(validDir);
        auto invalidTests = listTests(invalidDir);

        const size_t timeoutMs = 5000;
        std::vector<TestOutcome> outcomes;
        auto runCase = [&](const std::filesystem::path& p, bool expectInvalid) -> TestOutcome {
            auto start = std::chrono::steady_clock::now();
            TestOutcome out;
            out.name = p.filename().string();
            out.path = p.string();
            try {
                auto result = MDS::runWithTimeout<SingleRunResult>(
                    [runSingle, path = p.string()]() { return runSingle(path); },
                    std::chrono::milliseconds(timeoutMs));
                auto end = std::chrono::steady_clock::now();
                out.timeMs = (size_t)std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
                if (!result) {
                    out.success = false;
                    out.reason = "timeout";
                    out.details.push_back(std::string("path: ") + out.path);
                    out.details.push_back(std::string("timeout after ") + std::to_string(timeoutMs) + " ms");
                    return out;
                }
                auto& r = *result;
                if (expectInvalid) {
                    out.success = r.error.has_value();
                    if (!out.success) {
                        out.reason = "expectation not met";
                        out.details.push_back(std::string("path: ") + out.path);
                        out.details.push_back("expected a markdown error");
                        out.details.push_back("rendered: " + r.html);
                    }
                }
                else if (r.error) {
                    out.success = false;
                    out.reason = "expectation not met";
                    out.details.push_back(std::string("path: ") + out.path);
                    out.details.push_back("expected no error");
                    out.details.push_back("error: " + *r.error);
                }
                else {
                    auto expectedPath = p;
                    expectedPath.replace_extension(".html");
                    auto expected = MDS::readTextFile(expectedPath.string());
                    out.success = r.html == expected;
                    if (!out.success) {
                        out.reason = "output mismatch";
                        out.details.push_back(std::string("path: ") + out.path);
                        out.details.push_back("expected: " + expected);
                        out.details.push_back("actual:   " + r.html);
                    }
                }
            }
            catch (const std::exception& e) {
                auto end = std::chrono::steady_clock::now();
                out.timeMs = (size_t)std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
                out.success = false;
                out.reason = "exception thrown";
                out.details.push_back(std::string("path: ") + out.path);
                out.details.push_back(e.what());
            }
            return out;
        };

        auto allStart = std::chrono::steady_clock::now();
        for (const auto& p : validTests) {
            outcomes.push_back(runCase(p, false));
        }
        for (const auto& p : invalidTests) {
            outcomes.push_back(runCase(p, true));
        }
        auto allEnd = std::chrono::steady_clock::now();
        auto totalMs = (size_t)std::chrono::duration_cast<std::chrono::milliseconds>(allEnd - allStart).count();

        size_t total = outcomes.size();
        size_t successCount = 0;
        for (const auto& o : outcomes) {
            if (o.success) ++successCount;
        }

        std::cout << "Ran " << total << " test(s) in " << totalMs << " ms\n";
        std::cout << "Success: " << successCount << " / " << total << "\n";
        if (successCount != total) {
            std::cout << "Failed tests:\n";
            for (const auto& o : outcomes) {
                if (o.success) continue;
                std::cout << "- " << o.name << " (" << o.timeMs << " ms) - " << o.reason << "\n";
                for (const auto& d : o.details) {
                    std::cout << "    " << d << "\n";
                }
            }
        }

        retVal = successCount == total ? 0 : 1;
        return retVal;
    }
    else if (argc == 2 && (argVector[1] == "--help" || argVector[1] == "-h")) {
        printInfo(std::cout);
        printHelp(std::cout);
    }
    else {
        printInfo(std::cerr);
        std::cerr << "invalid arguments:";
        for (const auto& arg : argVector) {
            std::cerr << " " << arg;
        }
        std::cerr << "\n";
        printHelp(std::cerr);
        return 2;
    }
    return 0;
}
