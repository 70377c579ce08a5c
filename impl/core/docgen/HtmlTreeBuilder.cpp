#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include "HtmlTreeBuilder.h"
#include "../lexer/MdsLexer.h"
#include "../parser/MdsParser.h"
#include "../shared/MdsError.h"
#include "../shared/MdsStringUtils.h"

namespace MDS {

std::shared_ptr<LeafNode> spanToHtmlNode(const TextSpan& span) {
    switch (span.type) {
    case SpanType::Plain:
        return std::make_shared<LeafNode>(std::nullopt, span.text);
    case SpanType::Bold:
        return std::make_shared<LeafNode>("b", span.text);
    case SpanType::Italic:
        return std::make_shared<LeafNode>("i", span.text);
    case SpanType::Code:
        return std::make_shared<LeafNode>("code", span.text);
    case SpanType::Link:
        return std::make_shared<LeafNode>("a", span.text,
            Attributes{ { "href", span.url.value_or("") } });
    case SpanType::Image:
        return std::make_shared<LeafNode>("img", "",
            Attributes{ { "src", span.url.value_or("") }, { "alt", span.text } });
    }
    throw UnknownSpanVariantError(static_cast<int>(span.type));
}

ParentNode::Children textToChildren(const std::string& text) {
    ParentNode::Children children;
    for (const auto& span : MdsLexerMain(text)) {
        children.push_back(spanToHtmlNode(span));
    }
    return children;
}

// -------------------- Blocks --------------------

static std::shared_ptr<ParentNode> buildParagraph(const std::string& block) {
    return std::make_shared<ParentNode>("p", textToChildren(replaceAll(block, "\n", " ")));
}

static std::shared_ptr<ParentNode> buildHeading(const std::string& block) {
    int level = headingLevel(block);
    if (!level) {
        throw std::invalid_argument("block is not a heading: " + block);
    }
    auto text = block.substr(static_cast<size_t>(level) + 1);
    return std::make_shared<ParentNode>("h" + std::to_string(level), textToChildren(text));
}

static std::shared_ptr<ParentNode> buildCode(const std::string& block) {
    // "```\n" + content + "```"
    if (block.size() < 7) {
        throw std::invalid_argument("block is not a fenced code block: " + block);
    }
    auto content = block.substr(4, block.size() - 7);
    ParentNode::Children children{ std::make_shared<LeafNode>("code", content) };
    return std::make_shared<ParentNode>("pre", std::move(children));
}

static std::shared_ptr<ParentNode> buildQuote(const std::string& block) {
    std::vector<std::string> lines;
    for (auto& line : split(block, "\n")) {
        if (startsWith(line, ">")) {
            line.erase(0, 1);
        }
        lines.push_back(trim(line));
    }
    return std::make_shared<ParentNode>("blockquote", textToChildren(join(lines, " ")));
}

static std::shared_ptr<ParentNode> buildUnorderedList(const std::string& block) {
    ParentNode::Children items;
    for (const auto& line : split(block, "\n")) {
        auto text = line.size() > 2 ? line.substr(2) : std::string();
        items.push_back(std::make_shared<ParentNode>("li", textToChildren(text)));
    }
    return std::make_shared<ParentNode>("ul", std::move(items));
}

static std::shared_ptr<ParentNode> buildOrderedList(const std::string& block) {
    ParentNode::Children items;
    for (const auto& line : split(block, "\n")) {
        auto marker = line.find(". ");
        if (marker == std::string::npos) {
            throw std::invalid_argument("ordered list item has no marker: " + line);
        }
        items.push_back(std::make_shared<ParentNode>("li", textToChildren(line.substr(marker + 2))));
    }
    return std::make_shared<ParentNode>("ol", std::move(items));
}

std::shared_ptr<ParentNode> buildBlock(const std::string& block, BlockType type) {
    switch (type) {
    case BlockType::Heading: return buildHeading(block);
    case BlockType::Code: return buildCode(block);
    case BlockType::Quote: return buildQuote(block);
    case BlockType::UnorderedList: return buildUnorderedList(block);
    case BlockType::OrderedList: return buildOrderedList(block);
    case BlockType::Paragraph: return buildParagraph(block);
    }
    return buildParagraph(block);
}

std::shared_ptr<ParentNode> buildDocument(const std::string& markdown) {
    ParentNode::Children blockNodes;
    for (const auto& [block, type] : MdsParserMain(markdown)) {
        blockNodes.push_back(buildBlock(block, type));
    }
    return std::make_shared<ParentNode>("div", std::move(blockNodes));
}

}
