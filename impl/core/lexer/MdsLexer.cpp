#include <string>
#include <vector>
#include <tuple>
#include "MdsLexer.h"
#include "../shared/MdsError.h"
#include "../shared/MdsStringUtils.h"

namespace MDSLexer {
    using MDS::TextSpan;
    using MDS::SpanType;

    std::vector<TextSpan> InlineLexer::Lex() const {
        std::vector<TextSpan> spans{ TextSpan(inputText, SpanType::Plain) };
        spans = SplitImages(spans);
        spans = SplitLinks(spans);
        spans = SplitDelimiter(spans, "**", SpanType::Bold);
        spans = SplitDelimiter(spans, "_", SpanType::Italic);
        spans = SplitDelimiter(spans, "`", SpanType::Code);
        return spans;
    }

    std::vector<TextSpan> InlineLexer::SplitImages(const std::vector<TextSpan>& spans) {
        return splitByMatches(spans, &InlineLexer::findImages, SpanType::Image);
    }

    std::vector<TextSpan> InlineLexer::SplitLinks(const std::vector<TextSpan>& spans) {
        return splitByMatches(spans, &InlineLexer::findLinks, SpanType::Link);
    }

    std::vector<TextSpan> InlineLexer::SplitDelimiter(const std::vector<TextSpan>& spans,
        const std::string& delimiter, SpanType spanType) {
        std::vector<TextSpan> result;
        for (const auto& span : spans) {
            if (span.type != SpanType::Plain) {
                result.push_back(span);
                continue;
            }
            auto parts = MDS::split(span.text, delimiter);
            if (parts.size() == 1) {
                result.push_back(span);
                continue;
            }
            // n delimiters give n + 1 parts, so an even part count means one is unmatched
            if (parts.size() % 2 == 0) {
                throw MDS::UnclosedDelimiterError(delimiter);
            }
            for (size_t i = 0; i < parts.size(); ++i) {
                result.emplace_back(std::move(parts[i]), i % 2 == 0 ? SpanType::Plain : spanType);
            }
        }
        return result;
    }

    std::vector<std::tuple<std::string, std::string>> InlineLexer::ExtractImages(const std::string& text) {
        std::vector<std::tuple<std::string, std::string>> result;
        for (auto& match : findImages(text)) {
            result.emplace_back(std::move(match.text), std::move(match.url));
        }
        return result;
    }

    std::vector<std::tuple<std::string, std::string>> InlineLexer::ExtractLinks(const std::string& text) {
        std::vector<std::tuple<std::string, std::string>> result;
        for (auto& match : findLinks(text)) {
            result.emplace_back(std::move(match.text), std::move(match.url));
        }
        return result;
    }

    // Matches `[text](url)` with `openBracket` at the '['. The text may not
    // contain brackets and the url may not contain parentheses.
    bool InlineLexer::matchBracketed(const std::string& text, size_t openBracket, Match& match) {
        if (openBracket >= text.size() || text[openBracket] != '[') return false;
        size_t i = openBracket + 1;
        while (i < text.size() && text[i] != '[' && text[i] != ']') ++i;
        if (i >= text.size() || text[i] != ']') return false;
        size_t closeBracket = i++;
        if (i >= text.size() || text[i] != '(') return false;
        size_t urlStart = ++i;
        while (i < text.size() && text[i] != '(' && text[i] != ')') ++i;
        if (i >= text.size() || text[i] != ')') return false;
        match.start = openBracket;
        match.end = i + 1;
        match.text = text.substr(openBracket + 1, closeBracket - openBracket - 1);
        match.url = text.substr(urlStart, i - urlStart);
        return true;
    }

    std::vector<InlineLexer::Match> InlineLexer::findImages(const std::string& text) {
        std::vector<Match> matches;
        size_t pos = 0;
        while (pos < text.size()) {
            Match match;
            if (text[pos] == '!' && matchBracketed(text, pos + 1, match)) {
                match.start = pos;
                pos = match.end;
                matches.push_back(std::move(match));
                continue;
            }
            ++pos;
        }
        return matches;
    }

    std::vector<InlineLexer::Match> InlineLexer::findLinks(const std::string& text) {
        std::vector<Match> matches;
        size_t pos = 0;
        while (pos < text.size()) {
            Match match;
            // a '[' right after '!' belongs to an image, never to a link
            if (text[pos] == '[' && (pos == 0 || text[pos - 1] != '!') && matchBracketed(text, pos, match)) {
                pos = match.end;
                matches.push_back(std::move(match));
                continue;
            }
            ++pos;
        }
        return matches;
    }

    std::vector<TextSpan> InlineLexer::splitByMatches(const std::vector<TextSpan>& spans,
        std::vector<Match> (*finder)(const std::string&), SpanType spanType) {
        std::vector<TextSpan> result;
        for (const auto& span : spans) {
            if (span.type != SpanType::Plain) {
                result.push_back(span);
                continue;
            }
            auto matches = finder(span.text);
            if (matches.empty()) {
                result.push_back(span);
                continue;
            }
            size_t lastEnd = 0;
            for (auto& match : matches) {
                if (match.start > lastEnd) {
                    result.emplace_back(span.text.substr(lastEnd, match.start - lastEnd), SpanType::Plain);
                }
                result.emplace_back(std::move(match.text), spanType, std::move(match.url));
                lastEnd = match.end;
            }
            if (lastEnd < span.text.size()) {
                result.emplace_back(span.text.substr(lastEnd), SpanType::Plain);
            }
        }
        return result;
    }
}

std::vector<MDS::TextSpan> MdsLexerMain(const std::string& text) {
    MDSLexer::InlineLexer lexer(text);
    return lexer.Lex();
}
