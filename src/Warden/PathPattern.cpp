// =================================================================
// src/Warden/PathPattern.cpp
// =================================================================
// Implementation for case-insensitive path matching.

#include "Warden/PathPattern.hpp"
#include <algorithm>
#include <stdexcept>

namespace Warden {

namespace {

const std::string GLOB_PREFIX = "glob:";
const std::string REGEX_PREFIX = "regex:";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

PathPattern::PathPattern(const std::string& pattern)
: m_original_pattern(pattern), m_syntax(PatternSyntax::REGEX) {
    std::string body = pattern;
    if (startsWith(body, GLOB_PREFIX)) {
        m_syntax = PatternSyntax::GLOB;
        body = body.substr(GLOB_PREFIX.size());
    } else if (startsWith(body, REGEX_PREFIX)) {
        body = body.substr(REGEX_PREFIX.size());
    }

    if (body.empty()) {
        throw std::invalid_argument("Empty path pattern: '" + pattern + "'");
    }

    std::string regex_text = m_syntax == PatternSyntax::GLOB ? globToRegex(body) : body;

    try {
        m_regex = std::regex(regex_text,
                             std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& error) {
        throw std::invalid_argument("Invalid path pattern '" + pattern + "': " + error.what());
    }
}

bool PathPattern::matches(const std::string& path) const {
    if (m_syntax == PatternSyntax::GLOB) {
        std::string normalized = path;
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        return std::regex_match(normalized, m_regex);
    }
    return std::regex_search(path, m_regex);
}

std::string PathPattern::globToRegex(const std::string& glob_pattern) {
    static const std::string REGEX_SPECIAL = ".^$+{}|()";

    std::string regex_text;
    size_t pos = 0;

    while (pos < glob_pattern.size()) {
        if (glob_pattern.compare(pos, 3, "**/") == 0) {
            regex_text += "(?:.*/)?";
            pos += 3;
            continue;
        }
        if (glob_pattern.compare(pos, 2, "**") == 0) {
            regex_text += ".*";
            pos += 2;
            continue;
        }

        char c = glob_pattern[pos++];
        if (c == '*') {
            regex_text += "[^/]*";
        } else if (c == '?') {
            regex_text += "[^/]";
        } else if (c == '[') {
            size_t close = glob_pattern.find(']', pos);
            if (close == std::string::npos) {
                throw std::invalid_argument("Unterminated character class in glob '" + glob_pattern + "'");
            }
            std::string members = glob_pattern.substr(pos, close - pos);
            if (!members.empty() && members[0] == '!') {
                members[0] = '^';
            }
            regex_text += "[" + members + "]";
            pos = close + 1;
        } else if (c == '\\') {
            regex_text += '\\';
            regex_text += pos < glob_pattern.size() ? glob_pattern[pos++] : '\\';
        } else {
            if (REGEX_SPECIAL.find(c) != std::string::npos) {
                regex_text += '\\';
            }
            regex_text += c;
        }
    }

    // Leading '/' anchors at the path root, otherwise any directory may precede
    if (glob_pattern.front() == '/') {
        return regex_text + "(/.*)?";
    }
    return "(^|.*/)" + regex_text + "(/.*)?";
}

void PathPatternSet::addPattern(const std::string& pattern) {
    m_patterns.emplace_back(pattern);
}

const PathPattern* PathPatternSet::findMatch(const std::string& path) const {
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path)) {
            return &pattern;
        }
    }
    return nullptr;
}

} // namespace Warden
