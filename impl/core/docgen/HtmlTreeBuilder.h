#pragma once

#ifndef HTML_TREE_BUILDER_H
#define HTML_TREE_BUILDER_H

#include <string>
#include <memory>
#include "../shared/TextSpan.h"
#include "../shared/BlockType.h"
#include "../shared/HtmlNode.h"

namespace MDS {
std::shared_ptr<LeafNode> spanToHtmlNode(const TextSpan& span);
ParentNode::Children textToChildren(const std::string& text);
std::shared_ptr<ParentNode> buildBlock(const std::string& block, BlockType type);
std::shared_ptr<ParentNode> buildDocument(const std::string& markdown);
}

#endif // HTML_TREE_BUILDER_H
