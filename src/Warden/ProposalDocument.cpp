// =================================================================
// src/Warden/ProposalDocument.cpp
// =================================================================
// Implementation for proposal document parsing and rendering.

#include "Warden/ProposalDocument.hpp"
#include "Warden/UnifiedPatch.hpp"
#include <regex>
#include <sstream>

namespace Warden {

namespace {

std::string trimRight(const std::string& s) {
    size_t last = s.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        return "";
    }
    return s.substr(0, last + 1);
}

std::string findField(const std::string& content, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(content, match, pattern)) {
        return trimRight(match[1].str());
    }
    return "";
}

} // namespace

std::string ProposalDocument::extractPatch(const std::string& content) {
    static const std::regex DIFF_BLOCK("```diff\\r?\\n([\\s\\S]*?)\\r?\\n```");

    std::string combined;
    bool first = true;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), DIFF_BLOCK);
         it != std::sregex_iterator(); ++it) {
        if (!first) {
            combined += "\n";
        }
        combined += (*it)[1].str();
        first = false;
    }

    if (combined.empty()) {
        return "";
    }
    return UnifiedPatch::normalizePatchText(combined);
}

DocumentParseResult ProposalDocument::parse(const std::string& content) {
    static const std::regex PROPOSER(R"(\*\*Proposer:\*\*[ \t]*(.+))");
    static const std::regex TYPE(R"(\*\*Type:\*\*[ \t]*(.+))");
    static const std::regex SUMMARY(R"(## Summary[ \t]*\r?\n(?:[ \t]*\r?\n)*([^#\r\n].*))");
    static const std::regex CREATED(R"(\*\*Created:\*\*[ \t]*(.+))");

    DocumentParseResult result;
    result.metadata.proposer = findField(content, PROPOSER);
    result.metadata.change_type = findField(content, TYPE);
    result.metadata.summary = findField(content, SUMMARY);
    result.metadata.created_at = findField(content, CREATED);

    std::string patch = extractPatch(content);
    if (patch.empty()) {
        result.error = "document contains no ```diff block";
        return result;
    }

    PatchParseResult parsed = UnifiedPatch::parse(patch);
    if (!parsed.success) {
        result.error = "invalid diff: " + parsed.error;
        return result;
    }

    for (const auto& file : parsed.files) {
        result.diffs.push_back({file.targetPath(), file.raw});
    }

    result.success = true;
    return result;
}

std::string ProposalDocument::render(const Proposal& proposal) {
    std::ostringstream out;

    out << "# Proposal " << proposal.taggedId() << "\n\n";
    out << "**Proposer:** " << proposal.metadata.proposer << "\n";
    out << "**Type:** " << proposal.metadata.change_type << "\n";
    out << "**Tier:** " << getTierLabel(proposal.tier) << "\n";
    out << "**State:** " << getProposalStateName(proposal.state) << "\n";
    out << "**Created:** " << proposal.metadata.created_at << "\n";
    out << "**Repository:** " << proposal.repo_root << "\n";
    if (!proposal.review_id.empty()) {
        out << "**Review:** " << proposal.review_id << "\n";
    }
    out << "\n## Summary\n\n" << proposal.metadata.summary << "\n\n";
    out << "## Changes\n";

    for (const auto& file_diff : proposal.diffs) {
        std::string diff = file_diff.diff;
        while (!diff.empty() && diff.back() == '\n') {
            diff.pop_back();
        }
        out << "\n### " << file_diff.path << "\n\n";
        out << "```diff\n" << diff << "\n```\n";
    }

    return out.str();
}

} // namespace Warden
