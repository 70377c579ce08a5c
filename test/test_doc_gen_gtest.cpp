#include <gtest/gtest.h>
#include <string>
#include "../impl/core/docgen/HtmlDocGen.h"
#include "../impl/core/shared/MdsError.h"

using namespace MDS;

// Test suite for title extraction and page assembly using GTest

TEST(DocGenTest, ExtractTitle) {
    EXPECT_EQ(extractTitle("# Hello"), "Hello");
    EXPECT_EQ(extractTitle("#  My Title  "), "My Title");
}

TEST(DocGenTest, ExtractTitleUsesFirstH1) {
    EXPECT_EQ(extractTitle("# First\n\n## Second\n\n# Another"), "First");
    EXPECT_EQ(extractTitle("Intro text\n\n## Sub\n# Real title\n"), "Real title");
}

TEST(DocGenTest, ExtractTitleWithoutH1Throws) {
    EXPECT_THROW(extractTitle("## Not an h1"), NoHeadingFoundError);
    EXPECT_THROW(extractTitle("#NoSpace"), NoHeadingFoundError);
    EXPECT_THROW(extractTitle(""), NoHeadingFoundError);
}

TEST(DocGenTest, FillTemplateReplacesEveryPlaceholder) {
    const std::string tpl = "<title>{{ Title }}</title><h1>{{ Title }}</h1><main>{{ Content }}</main>";
    EXPECT_EQ(fillTemplate(tpl, "Home", "<p>x</p>"),
        "<title>Home</title><h1>Home</h1><main><p>x</p></main>");
}

TEST(DocGenTest, FillTemplateReplacesTitleBeforeContent) {
    // A content placeholder inside the title is still substituted.
    EXPECT_EQ(fillTemplate("{{ Title }}", "{{ Content }}", "body"), "body");
    EXPECT_EQ(fillTemplate("{{ Content }}", "T", "{{ Title }}"), "{{ Title }}");
}

TEST(DocGenTest, RewriteBasePath) {
    EXPECT_EQ(rewriteBasePath("<a href=\"/blog\">b</a><img src=\"/img.png\">", "/site/"),
        "<a href=\"/site/blog\">b</a><img src=\"/site/img.png\">");
}

TEST(DocGenTest, RewriteBasePathLeavesAbsoluteUrls) {
    const std::string html = "<a href=\"https://example.com/\">x</a><img src=\"img.png\">";
    EXPECT_EQ(rewriteBasePath(html, "/site/"), html);
}

TEST(DocGenTest, RewriteBasePathRootIsIdentity) {
    const std::string html = "<a href=\"/index.html\">x</a>";
    EXPECT_EQ(rewriteBasePath(html, "/"), html);
}

TEST(DocGenTest, GeneratePage) {
    const std::string tpl = "<html><head><title>{{ Title }}</title></head><body>{{ Content }}</body></html>";
    const std::string md = "# Tolkien Fan Club\n\nSee [the blog](/blog/index.html).";
    EXPECT_EQ(generatePage(md, tpl, "/repo/"),
        "<html><head><title>Tolkien Fan Club</title></head><body>"
        "<div><h1>Tolkien Fan Club</h1><p>See <a href=\"/repo/blog/index.html\">the blog</a>.</p></div>"
        "</body></html>");
}

TEST(DocGenTest, GeneratePageDefaultsToRootBasePath) {
    EXPECT_EQ(generatePage("# T", "{{ Content }}"), "<div><h1>T</h1></div>");
}

TEST(DocGenTest, GeneratePageWithoutTitleThrows) {
    EXPECT_THROW(generatePage("just text", "{{ Content }}"), NoHeadingFoundError);
}
