#pragma once

#ifndef MDS_ERROR_H
#define MDS_ERROR_H

#include <string>
#include <stdexcept>

namespace MDS {
    class MdsError : public std::runtime_error {
    public:
        explicit MdsError(const std::string& message) : std::runtime_error(message) {}
    };

    // Odd number of a styling delimiter inside a plain span.
    class UnclosedDelimiterError : public MdsError {
    public:
        explicit UnclosedDelimiterError(const std::string& delimiter)
            : MdsError("invalid markdown: unclosed delimiter '" + delimiter + "'"), delimiterText(delimiter) {}

        const std::string& delimiter() const {
            return delimiterText;
        }

    protected:
        std::string delimiterText;
    };

    class MissingValueError : public MdsError {
    public:
        MissingValueError() : MdsError("leaf node must have a value") {}
    };

    class MissingTagError : public MdsError {
    public:
        MissingTagError() : MdsError("parent node must have a tag") {}
    };

    class MissingChildrenError : public MdsError {
    public:
        MissingChildrenError() : MdsError("parent node must have children") {}
    };

    class UnknownSpanVariantError : public MdsError {
    public:
        explicit UnknownSpanVariantError(int variant)
            : MdsError("unknown text span variant: " + std::to_string(variant)) {}
    };

    class NoHeadingFoundError : public MdsError {
    public:
        NoHeadingFoundError() : MdsError("no h1 heading found in markdown") {}
    };
}

#endif // MDS_ERROR_H
