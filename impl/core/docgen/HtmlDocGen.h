#pragma once

#ifndef HTML_DOC_GEN_H
#define HTML_DOC_GEN_H

#include <string>

namespace MDS {
std::string extractTitle(const std::string& markdown);
std::string fillTemplate(const std::string& pageTemplate, const std::string& title, const std::string& content);
std::string rewriteBasePath(const std::string& html, const std::string& basePath);
std::string generatePage(const std::string& markdown, const std::string& pageTemplate, const std::string& basePath = "/");
}

#endif // HTML_DOC_GEN_H
