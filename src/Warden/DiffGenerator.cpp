#include "Warden/DiffGenerator.hpp"
#include "dtl/dtl.hpp"
#include <algorithm>
#include <sstream>

namespace Warden {

namespace {

const char* NO_NEWLINE_MARKER = "\\ No newline at end of file";

std::string formatRange(size_t start, size_t count) {
    if (count == 1) {
        return std::to_string(start);
    }
    return std::to_string(start) + "," + std::to_string(count);
}

char prefixFor(DiffLineType type) {
    switch (type) {
        case DiffLineType::ADDED: return '+';
        case DiffLineType::REMOVED: return '-';
        default: return ' ';
    }
}

} // namespace

std::string DiffHunk::header() const {
    return "@@ -" + formatRange(old_start, old_count) +
           " +" + formatRange(new_start, new_count) + " @@";
}

DiffGenerator::DiffGenerator(const std::optional<std::string>& original, const std::string& modified,
                             size_t context_lines)
: m_original(original), m_modified(modified), m_context_lines(context_lines) {
}

std::vector<std::string> DiffGenerator::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start + 1));
        start = newline + 1;
    }

    return lines;
}

std::string DiffGenerator::normalizePatchPath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    while (normalized.size() > 2 && normalized.compare(0, 2, "./") == 0) {
        normalized = normalized.substr(2);
    }
    return normalized;
}

std::vector<DiffLine> DiffGenerator::computeDiff() const {
    using elem = std::string;
    using sequence = std::vector<elem>;

    sequence original_lines = splitLines(m_original.value_or(""));
    sequence modified_lines = splitLines(m_modified);

    dtl::Diff<elem, sequence> diff(original_lines, modified_lines);
    diff.compose();

    std::vector<DiffLine> result;
    size_t old_num = 0, new_num = 0;

    for (const auto& ses_item : diff.getSes().getSequence()) {
        switch (ses_item.second.type) {
            case dtl::SES_COMMON:
                ++old_num;
                ++new_num;
                result.push_back({ses_item.first, DiffLineType::UNCHANGED, old_num, new_num});
                break;
            case dtl::SES_DELETE:
                ++old_num;
                result.push_back({ses_item.first, DiffLineType::REMOVED, old_num, 0});
                break;
            case dtl::SES_ADD:
                ++new_num;
                result.push_back({ses_item.first, DiffLineType::ADDED, 0, new_num});
                break;
        }
    }

    return result;
}

std::vector<DiffLine> DiffGenerator::getDiff() const {
    return computeDiff();
}

std::vector<DiffHunk> DiffGenerator::getHunks() const {
    auto lines = computeDiff();

    std::vector<size_t> changes;
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].type != DiffLineType::UNCHANGED) {
            changes.push_back(i);
        }
    }

    std::vector<DiffHunk> hunks;
    if (changes.empty()) {
        return hunks;
    }

    // Lines of each side consumed before position i
    std::vector<size_t> old_before(lines.size() + 1, 0);
    std::vector<size_t> new_before(lines.size() + 1, 0);
    for (size_t i = 0; i < lines.size(); i++) {
        old_before[i + 1] = old_before[i] + (lines[i].type != DiffLineType::ADDED ? 1 : 0);
        new_before[i + 1] = new_before[i] + (lines[i].type != DiffLineType::REMOVED ? 1 : 0);
    }

    size_t i = 0;
    while (i < changes.size()) {
        size_t first_change = changes[i];
        size_t last_change = first_change;
        size_t j = i + 1;

        // Merge changes whose separating context would overlap
        while (j < changes.size() && changes[j] - last_change - 1 <= 2 * m_context_lines) {
            last_change = changes[j];
            j++;
        }

        size_t begin = first_change >= m_context_lines ? first_change - m_context_lines : 0;
        size_t end = std::min(lines.size(), last_change + 1 + m_context_lines);

        DiffHunk hunk;
        hunk.lines.assign(lines.begin() + begin, lines.begin() + end);
        hunk.old_count = old_before[end] - old_before[begin];
        hunk.new_count = new_before[end] - new_before[begin];
        hunk.old_start = hunk.old_count > 0 ? old_before[begin] + 1 : old_before[begin];
        hunk.new_start = hunk.new_count > 0 ? new_before[begin] + 1 : new_before[begin];
        hunks.push_back(std::move(hunk));

        i = j;
    }

    return hunks;
}

bool DiffGenerator::hasChanges() const {
    for (const auto& line : computeDiff()) {
        if (line.type != DiffLineType::UNCHANGED) {
            return true;
        }
    }
    return false;
}

DiffStats DiffGenerator::getStats() const {
    DiffStats stats;
    for (const auto& line : computeDiff()) {
        switch (line.type) {
            case DiffLineType::ADDED: stats.additions++; break;
            case DiffLineType::REMOVED: stats.deletions++; break;
            case DiffLineType::UNCHANGED: stats.unchanged++; break;
        }
    }
    return stats;
}

std::string DiffGenerator::toUnifiedDiff(const std::string& file_path) const {
    auto hunks = getHunks();
    if (hunks.empty()) {
        return "";
    }

    std::string path = normalizePatchPath(file_path);
    std::ostringstream out;

    out << "--- " << (m_original ? "a/" + path : std::string("/dev/null")) << "\n";
    out << "+++ b/" << path << "\n";

    for (const auto& hunk : hunks) {
        out << hunk.header() << "\n";
        for (const auto& line : hunk.lines) {
            out << prefixFor(line.type) << line.text;
            if (line.text.empty() || line.text.back() != '\n') {
                out << "\n" << NO_NEWLINE_MARKER << "\n";
            }
        }
    }

    return out.str();
}

std::string DiffGenerator::makeDiff(const std::optional<std::string>& original,
                                    const std::string& modified,
                                    const std::string& file_path) {
    return DiffGenerator(original, modified).toUnifiedDiff(file_path);
}

void DiffGenerator::printColoredPatch(const std::string& patch, std::ostream& out) {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string CYAN = "\033[36m";
    const std::string BOLD = "\033[1m";
    const std::string GRAY = "\033[90m";

    std::istringstream stream(patch);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("--- ", 0) == 0 || line.rfind("+++ ", 0) == 0) {
            out << BOLD << line << RESET << "\n";
        } else if (line.rfind("@@", 0) == 0) {
            out << CYAN << line << RESET << "\n";
        } else if (!line.empty() && line[0] == '+') {
            out << GREEN << line << RESET << "\n";
        } else if (!line.empty() && line[0] == '-') {
            out << RED << line << RESET << "\n";
        } else if (!line.empty() && line[0] == '\\') {
            out << GRAY << line << RESET << "\n";
        } else {
            out << line << "\n";
        }
    }
}

} // namespace Warden
