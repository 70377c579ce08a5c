#include <string>
#include "HtmlDocGen.h"
#include "HtmlTreeBuilder.h"
#include "../shared/MdsError.h"
#include "../shared/MdsStringUtils.h"

namespace MDS {

static const char* const titlePlaceholder = "{{ Title }}";
static const char* const contentPlaceholder = "{{ Content }}";

std::string extractTitle(const std::string& markdown) {
    for (const auto& line : split(markdown, "\n")) {
        if (startsWith(line, "# ")) {
            return trim(line.substr(2));
        }
    }
    throw NoHeadingFoundError();
}

std::string fillTemplate(const std::string& pageTemplate, const std::string& title, const std::string& content) {
    auto html = replaceAll(pageTemplate, titlePlaceholder, title);
    return replaceAll(html, contentPlaceholder, content);
}

// Root-relative references ("/...") are re-rooted under basePath.
std::string rewriteBasePath(const std::string& html, const std::string& basePath) {
    auto out = replaceAll(html, "href=\"/", "href=\"" + basePath);
    return replaceAll(out, "src=\"/", "src=\"" + basePath);
}

std::string generatePage(const std::string& markdown, const std::string& pageTemplate, const std::string& basePath) {
    auto content = buildDocument(markdown)->render();
    auto title = extractTitle(markdown);
    return rewriteBasePath(fillTemplate(pageTemplate, title, content), basePath);
}

}
