#pragma once

#ifndef PARSER_H
#define PARSER_H

#include <tuple>
#include <string>
#include <vector>
#include "../shared/BlockType.h"

namespace MDS {
    std::vector<std::string> segmentBlocks(const std::string& markdown);
    BlockType classifyBlock(const std::string& block);
    // Number of leading '#' of a heading block, 0 when the block is not a heading.
    int headingLevel(const std::string& block);
}

std::vector<std::tuple<std::string, MDS::BlockType>> MdsParserMain(const std::string& markdown);

#endif // PARSER_H
