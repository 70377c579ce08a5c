#pragma once

#ifndef HTML_NODE_H
#define HTML_NODE_H

#include <string>
#include <sstream>
#include <memory>
#include <vector>
#include <optional>
#include <utility>
#include <unordered_set>
#include "MdsError.h"

namespace MDS {
    // Ordered key/value pairs, rendered in insertion order.
    using Attributes = std::vector<std::pair<std::string, std::string>>;

    inline bool isVoidTag(const std::string& tag) {
        static const std::unordered_set<std::string> voidTags = {
            "area", "base", "br", "col", "embed", "hr", "img",
            "input", "link", "meta", "source", "track", "wbr"
        };
        return voidTags.count(tag) != 0;
    }

    class LeafNode;
    class ParentNode;

    // Closed node hierarchy: LeafNode and ParentNode are the only implementers.
    class HtmlNode {
    public:
        enum class Kind {
            Leaf,
            Parent
        };

        virtual ~HtmlNode() {}

        virtual std::string render() const = 0;

        Kind getKind() const {
            return kind;
        }

        const std::optional<std::string>& getTag() const {
            return tag;
        }

        const std::optional<Attributes>& getAttributes() const {
            return attributes;
        }

        std::string attributesToString() const {
            if (!attributes || attributes->empty()) return "";
            std::ostringstream os;
            for (const auto& [key, value] : *attributes) {
                os << ' ' << key << "=\"" << value << '"';
            }
            return os.str();
        }

    protected:
        Kind kind;
        std::optional<std::string> tag;
        std::optional<Attributes> attributes;

    private:
        friend class LeafNode;
        friend class ParentNode;

        HtmlNode(Kind kind, std::optional<std::string> tag, std::optional<Attributes> attributes)
            : kind(kind), tag(std::move(tag)), attributes(std::move(attributes)) {}
    };

    class LeafNode final : public HtmlNode {
    public:
        LeafNode(std::optional<std::string> tag, std::optional<std::string> value,
            std::optional<Attributes> attributes = std::nullopt)
            : HtmlNode(Kind::Leaf, std::move(tag), std::move(attributes)), value(std::move(value)) {}

        const std::optional<std::string>& getValue() const {
            return value;
        }

        std::string render() const override {
            if (!value) {
                throw MissingValueError();
            }
            if (!tag) {
                return *value;
            }
            if (isVoidTag(*tag)) {
                return "<" + *tag + attributesToString() + ">";
            }
            return "<" + *tag + attributesToString() + ">" + *value + "</" + *tag + ">";
        }

    protected:
        std::optional<std::string> value;
    };

    class ParentNode final : public HtmlNode {
    public:
        using Children = std::vector<std::shared_ptr<HtmlNode>>;

        ParentNode(std::optional<std::string> tag, std::optional<Children> children,
            std::optional<Attributes> attributes = std::nullopt)
            : HtmlNode(Kind::Parent, std::move(tag), std::move(attributes)), children(std::move(children)) {}

        const std::optional<Children>& getChildren() const {
            return children;
        }

        std::string render() const override {
            if (!tag) {
                throw MissingTagError();
            }
            if (!children) {
                throw MissingChildrenError();
            }
            std::string inner;
            for (const auto& child : *children) {
                if (!child) {
                    throw MissingChildrenError();
                }
                inner += child->render();
            }
            return "<" + *tag + attributesToString() + ">" + inner + "</" + *tag + ">";
        }

    protected:
        std::optional<Children> children;
    };
}

#endif // HTML_NODE_H
