#pragma once

#ifndef LEXER_H
#define LEXER_H

#include <string>
#include <vector>
#include <tuple>
#include "../shared/TextSpan.h"

namespace MDSLexer {
    // Splits inline markdown into text spans. Images are extracted first, then
    // links, then the `**`, `_` and `` ` `` delimiters, each pass only touching
    // spans that are still plain.
    class InlineLexer {
    public:
        explicit InlineLexer(const std::string& inputText) : inputText(inputText) {}

        std::vector<MDS::TextSpan> Lex() const;

        static std::vector<MDS::TextSpan> SplitImages(const std::vector<MDS::TextSpan>& spans);
        static std::vector<MDS::TextSpan> SplitLinks(const std::vector<MDS::TextSpan>& spans);
        static std::vector<MDS::TextSpan> SplitDelimiter(const std::vector<MDS::TextSpan>& spans,
            const std::string& delimiter, MDS::SpanType spanType);

        // (text, url) pairs for `![alt](url)` and `[text](url)` respectively.
        static std::vector<std::tuple<std::string, std::string>> ExtractImages(const std::string& text);
        static std::vector<std::tuple<std::string, std::string>> ExtractLinks(const std::string& text);

    protected:
        struct Match {
            size_t start;
            size_t end;
            std::string text;
            std::string url;
        };

        static std::vector<Match> findImages(const std::string& text);
        static std::vector<Match> findLinks(const std::string& text);
        static bool matchBracketed(const std::string& text, size_t openBracket, Match& match);
        static std::vector<MDS::TextSpan> splitByMatches(const std::vector<MDS::TextSpan>& spans,
            std::vector<Match> (*finder)(const std::string&), MDS::SpanType spanType);

        const std::string& inputText;
    };
}

std::vector<MDS::TextSpan> MdsLexerMain(const std::string& text);

#endif // LEXER_H
