// =================================================================
// src/Warden/UnifiedPatch.cpp
// =================================================================
// Implementation for unified diff parsing and application.

#include "Warden/UnifiedPatch.hpp"
#include "Warden/DiffGenerator.hpp"
#include <algorithm>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace Warden {

namespace {

const std::regex HUNK_HEADER(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");

std::string stripTerminator(const std::string& line) {
    std::string result = line;
    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }
    if (!result.empty() && result.back() == '\r') {
        result.pop_back();
    }
    return result;
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string lineError(size_t line_number, const std::string& message) {
    return "line " + std::to_string(line_number) + ": " + message;
}

bool parseCount(const std::ssub_match& field, size_t fallback, size_t& out) {
    if (!field.matched) {
        out = fallback;
        return true;
    }
    try {
        out = std::stoul(field.str());
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

std::string FilePatch::targetPath() const {
    if (new_path) {
        return *new_path;
    }
    return old_path.value_or("");
}

std::optional<std::string> UnifiedPatch::parseHeaderPath(const std::string& line, size_t prefix_len) {
    std::string path = stripTerminator(line.substr(prefix_len));

    size_t tab = path.find('\t');
    if (tab != std::string::npos) {
        path = path.substr(0, tab);
    }

    if (path == "/dev/null") {
        return std::nullopt;
    }
    if (startsWith(path, "a/") || startsWith(path, "b/")) {
        path = path.substr(2);
    }
    return path;
}

PatchParseResult UnifiedPatch::parse(const std::string& text) {
    PatchParseResult result;
    std::vector<std::string> lines = DiffGenerator::splitLines(text);
    size_t i = 0;

    while (i < lines.size()) {
        if (!startsWith(lines[i], "--- ")) {
            // git metadata ("diff --git", "index ...") and prose are skipped
            i++;
            continue;
        }

        if (i + 1 >= lines.size() || !startsWith(lines[i + 1], "+++ ")) {
            result.error = lineError(i + 1, "'---' header not followed by '+++' header");
            return result;
        }

        size_t file_start = i;
        FilePatch file;
        file.old_path = parseHeaderPath(lines[i], 4);
        file.new_path = parseHeaderPath(lines[i + 1], 4);
        if (!file.old_path && !file.new_path) {
            result.error = lineError(i + 1, "both sides of the patch are /dev/null");
            return result;
        }
        i += 2;

        while (i < lines.size() && startsWith(lines[i], "@@")) {
            std::smatch match;
            std::string header = stripTerminator(lines[i]);
            if (!std::regex_search(header, match, HUNK_HEADER)) {
                result.error = lineError(i + 1, "malformed hunk header: " + header);
                return result;
            }

            PatchHunk hunk;
            if (!parseCount(match[1], 0, hunk.old_start) || !parseCount(match[2], 1, hunk.old_count) ||
                !parseCount(match[3], 0, hunk.new_start) || !parseCount(match[4], 1, hunk.new_count)) {
                result.error = lineError(i + 1, "hunk header number out of range: " + header);
                return result;
            }
            if (hunk.old_count == 0 && hunk.new_count == 0) {
                result.error = lineError(i + 1, "empty hunk: " + header);
                return result;
            }
            size_t header_line = i + 1;
            i++;

            size_t old_seen = 0, new_seen = 0;
            while (old_seen < hunk.old_count || new_seen < hunk.new_count) {
                if (i >= lines.size()) {
                    result.error = lineError(header_line, "hunk body ends before its header count");
                    return result;
                }

                const std::string& line = lines[i];
                char op = line.empty() ? '\0' : line[0];

                if (line == "\n" || line == "\r\n") {
                    // Context line whose leading space was stripped in transit
                    hunk.lines.push_back({' ', line});
                    old_seen++;
                    new_seen++;
                } else if (op == ' ' || op == '-' || op == '+') {
                    hunk.lines.push_back({op, line.substr(1)});
                    if (op != '+') old_seen++;
                    if (op != '-') new_seen++;
                } else if (op == '\\') {
                    if (hunk.lines.empty()) {
                        result.error = lineError(i + 1, "no-newline marker without a preceding line");
                        return result;
                    }
                    std::string& previous = hunk.lines.back().text;
                    if (!previous.empty() && previous.back() == '\n') {
                        previous.pop_back();
                    }
                } else {
                    result.error = lineError(i + 1, "unexpected line inside hunk");
                    return result;
                }

                if (old_seen > hunk.old_count || new_seen > hunk.new_count) {
                    result.error = lineError(header_line, "hunk body longer than its header count");
                    return result;
                }
                i++;
            }

            // A marker may follow the final line of the hunk
            if (i < lines.size() && startsWith(lines[i], "\\")) {
                std::string& previous = hunk.lines.back().text;
                if (!previous.empty() && previous.back() == '\n') {
                    previous.pop_back();
                }
                i++;
            }

            file.hunks.push_back(std::move(hunk));
        }

        if (file.hunks.empty()) {
            result.error = "file patch for '" + file.targetPath() + "' has no hunks";
            return result;
        }

        for (size_t k = file_start; k < i; k++) {
            file.raw += lines[k];
        }
        if (!file.raw.empty() && file.raw.back() != '\n') {
            file.raw += '\n';
        }

        result.files.push_back(std::move(file));
    }

    if (result.files.empty()) {
        result.error = "no file patches found";
        return result;
    }

    result.success = true;
    return result;
}

FileApplyResult UnifiedPatch::applyFilePatch(const std::optional<std::string>& original,
                                             const FilePatch& patch) {
    FileApplyResult result;
    const std::string path = patch.targetPath();

    if (patch.isCreation() && original && !original->empty()) {
        result.error = path + ": already exists";
        return result;
    }
    if (!patch.isCreation() && !original) {
        result.error = path + ": does not exist";
        return result;
    }

    std::vector<std::string> source = DiffGenerator::splitLines(original.value_or(""));
    std::vector<std::string> output;
    size_t position = 0;
    long offset = 0;

    for (size_t h = 0; h < patch.hunks.size(); h++) {
        const PatchHunk& hunk = patch.hunks[h];

        std::vector<std::string> old_lines;
        std::vector<std::string> new_lines;
        for (const auto& line : hunk.lines) {
            if (line.op != '+') old_lines.push_back(line.text);
            if (line.op != '-') new_lines.push_back(line.text);
        }

        long expected = static_cast<long>(hunk.old_count == 0 ? hunk.old_start : hunk.old_start - 1) + offset;
        long last_start = static_cast<long>(source.size()) - static_cast<long>(old_lines.size());

        auto matchesAt = [&](long start) {
            if (start < static_cast<long>(position) || start > last_start) {
                return false;
            }
            return std::equal(old_lines.begin(), old_lines.end(), source.begin() + start);
        };

        long found = -1;
        long max_distance = std::max(std::labs(expected), std::max<long>(last_start, 0)) + 1;
        for (long distance = 0; distance <= max_distance && found < 0; distance++) {
            if (matchesAt(expected - distance)) {
                found = expected - distance;
            } else if (distance > 0 && matchesAt(expected + distance)) {
                found = expected + distance;
            }
        }

        if (found < 0) {
            result.error = path + ": hunk " + std::to_string(h + 1) + " does not apply";
            return result;
        }

        output.insert(output.end(), source.begin() + position, source.begin() + found);
        output.insert(output.end(), new_lines.begin(), new_lines.end());
        position = static_cast<size_t>(found) + old_lines.size();
        offset = found - static_cast<long>(hunk.old_count == 0 ? hunk.old_start : hunk.old_start - 1);
    }

    output.insert(output.end(), source.begin() + position, source.end());

    std::string content;
    for (const auto& line : output) {
        content += line;
    }

    if (patch.isDeletion()) {
        if (!content.empty()) {
            result.error = path + ": deletion patch leaves content behind";
            return result;
        }
        result.success = true;
        return result;
    }

    result.success = true;
    result.content = content;
    return result;
}

std::string UnifiedPatch::normalizePatchText(const std::string& text) {
    static const std::regex JOINED_HEADERS(R"((--- a/\S+)\s*(\+\+\+ b/))");
    std::string normalized = std::regex_replace(text, JOINED_HEADERS, "$1\n$2");
    if (!normalized.empty() && normalized.back() != '\n') {
        normalized += '\n';
    }
    return normalized;
}

std::vector<std::string> UnifiedPatch::affectedPaths(const std::vector<FilePatch>& files) {
    std::vector<std::string> paths;
    for (const auto& file : files) {
        std::string path = file.targetPath();
        if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(path);
        }
    }
    return paths;
}

} // namespace Warden
