#include <string>
#include <vector>
#include <tuple>
#include <algorithm>
#include "MdsParser.h"
#include "../shared/MdsStringUtils.h"

namespace MDSParser {

    using MDS::BlockType;

    class BlockParser {
    protected:
        const std::string& input;

    public:
        explicit BlockParser(const std::string& input) : input(input) {}

        // Entry point: split the document and classify every block in order
        std::vector<std::tuple<std::string, BlockType>> parseBlocks() const {
            std::vector<std::tuple<std::string, BlockType>> blocks;
            for (auto& block : segment(input)) {
                auto type = classify(block);
                blocks.emplace_back(std::move(block), type);
            }
            return blocks;
        }

        static std::vector<std::string> segment(const std::string& document) {
            std::vector<std::string> blocks;
            for (const auto& piece : MDS::split(document, "\n\n")) {
                auto block = MDS::trim(piece);
                if (!block.empty()) {
                    blocks.push_back(std::move(block));
                }
            }
            return blocks;
        }

        static int headingLevel(const std::string& block) {
            size_t hashes = 0;
            while (hashes < block.size() && block[hashes] == '#') ++hashes;
            if (hashes < 1 || hashes > 6) return 0;
            if (hashes >= block.size() || block[hashes] != ' ') return 0;
            return static_cast<int>(hashes);
        }

        static BlockType classify(const std::string& block) {
            if (block.empty()) {
                return BlockType::Paragraph;
            }
            if (headingLevel(block)) {
                return BlockType::Heading;
            }
            if (MDS::startsWith(block, "```\n") && MDS::endsWith(block, "```")) {
                return BlockType::Code;
            }
            auto lines = MDS::split(block, "\n");
            auto allLinesStartWith = [&lines](const std::string& prefix) {
                return std::all_of(lines.begin(), lines.end(), [&prefix](const std::string& line) {
                    return MDS::startsWith(line, prefix);
                });
            };
            if (allLinesStartWith(">")) {
                return BlockType::Quote;
            }
            if (allLinesStartWith("- ")) {
                return BlockType::UnorderedList;
            }
            if (isOrderedList(lines)) {
                return BlockType::OrderedList;
            }
            return BlockType::Paragraph;
        }

    protected:
        // Numbering must start at 1 and grow by exactly 1 per line.
        static bool isOrderedList(const std::vector<std::string>& lines) {
            for (size_t i = 0; i < lines.size(); ++i) {
                if (!MDS::startsWith(lines[i], std::to_string(i + 1) + ". ")) {
                    return false;
                }
            }
            return !lines.empty();
        }
    };
}

namespace MDS {
    std::vector<std::string> segmentBlocks(const std::string& markdown) {
        return MDSParser::BlockParser::segment(markdown);
    }

    BlockType classifyBlock(const std::string& block) {
        return MDSParser::BlockParser::classify(block);
    }

    int headingLevel(const std::string& block) {
        return MDSParser::BlockParser::headingLevel(block);
    }
}

std::vector<std::tuple<std::string, MDS::BlockType>> MdsParserMain(const std::string& markdown) {
    MDSParser::BlockParser parser(markdown);
    return parser.parseBlocks();
}
