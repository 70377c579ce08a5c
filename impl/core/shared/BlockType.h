#pragma once

#ifndef BLOCK_TYPE_H
#define BLOCK_TYPE_H

#include <string>
#include <ostream>

namespace MDS {
    enum class BlockType {
        Heading,
        Code,
        Quote,
        UnorderedList,
        OrderedList,
        Paragraph
    };

    inline std::string blockTypeName(BlockType type) {
        switch (type) {
        case BlockType::Heading: return "Heading";
        case BlockType::Code: return "Code";
        case BlockType::Quote: return "Quote";
        case BlockType::UnorderedList: return "UnorderedList";
        case BlockType::OrderedList: return "OrderedList";
        case BlockType::Paragraph: return "Paragraph";
        }
        return "Unknown";
    }

    inline std::ostream& operator<<(std::ostream& os, BlockType type) {
        return os << blockTypeName(type);
    }
}

#endif // BLOCK_TYPE_H
