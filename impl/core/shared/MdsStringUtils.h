#pragma once

#ifndef MDS_STRING_UTILS_H
#define MDS_STRING_UTILS_H

#include <string>
#include <vector>

namespace MDS {
    inline bool isAsciiSpace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    inline std::string trim(const std::string& s) {
        size_t start = 0;
        size_t end = s.size();
        while (start < end && isAsciiSpace(s[start])) ++start;
        while (end > start && isAsciiSpace(s[end - 1])) --end;
        return s.substr(start, end - start);
    }

    inline bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    inline bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Splits on every non-overlapping occurrence of `separator`, scanning left to right.
    // Always yields at least one part; adjacent separators yield empty parts.
    inline std::vector<std::string> split(const std::string& s, const std::string& separator) {
        std::vector<std::string> parts;
        if (separator.empty()) {
            parts.push_back(s);
            return parts;
        }
        size_t start = 0, end;
        while ((end = s.find(separator, start)) != std::string::npos) {
            parts.push_back(s.substr(start, end - start));
            start = end + separator.size();
        }
        parts.push_back(s.substr(start));
        return parts;
    }

    inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += separator;
            out += parts[i];
        }
        return out;
    }

    inline std::string replaceAll(const std::string& s, const std::string& from, const std::string& to) {
        if (from.empty()) return s;
        std::string out;
        size_t start = 0, end;
        while ((end = s.find(from, start)) != std::string::npos) {
            out.append(s, start, end - start);
            out += to;
            start = end + from.size();
        }
        out.append(s, start, std::string::npos);
        return out;
    }
}

#endif // MDS_STRING_UTILS_H
