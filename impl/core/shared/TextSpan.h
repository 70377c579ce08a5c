#pragma once

#ifndef TEXT_SPAN_H
#define TEXT_SPAN_H

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace MDS {
    enum class SpanType {
        Plain,
        Bold,
        Italic,
        Code,
        Link,
        Image
    };

    inline std::string spanTypeName(SpanType type) {
        switch (type) {
        case SpanType::Plain: return "Plain";
        case SpanType::Bold: return "Bold";
        case SpanType::Italic: return "Italic";
        case SpanType::Code: return "Code";
        case SpanType::Link: return "Link";
        case SpanType::Image: return "Image";
        }
        return "Unknown";
    }

    // One classified unit of inline text. For images `text` holds the alt text.
    struct TextSpan {
        std::string text;
        SpanType type = SpanType::Plain;
        std::optional<std::string> url;

        TextSpan() = default;
        TextSpan(std::string text, SpanType type, std::optional<std::string> url = std::nullopt)
            : text(std::move(text)), type(type), url(std::move(url)) {}

        bool operator==(const TextSpan& other) const {
            return text == other.text && type == other.type && url == other.url;
        }

        bool operator!=(const TextSpan& other) const {
            return !(*this == other);
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const TextSpan& span) {
        os << spanTypeName(span.type) << "(\"" << span.text << "\"";
        if (span.url) {
            os << ", \"" << *span.url << "\"";
        }
        return os << ")";
    }
}

#endif // TEXT_SPAN_H
