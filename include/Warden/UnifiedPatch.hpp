// =================================================================
// include/Warden/UnifiedPatch.hpp
// =================================================================
// Parsing, structural checking and in-memory application of
// unified diffs.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief One body line of a hunk
 */
struct PatchLine {
    char op;              ///< ' ', '-' or '+'
    std::string text;     ///< Line content including its terminator, if any
};

struct PatchHunk {
    size_t old_start = 0;
    size_t old_count = 0;
    size_t new_start = 0;
    size_t new_count = 0;
    std::vector<PatchLine> lines;
};

/**
 * @brief All hunks touching one file
 */
struct FilePatch {
    std::optional<std::string> old_path;   ///< std::nullopt for /dev/null
    std::optional<std::string> new_path;   ///< std::nullopt for /dev/null
    std::vector<PatchHunk> hunks;
    std::string raw;                       ///< Patch text of this file, headers included

    /**
     * @brief Path of the file the patch touches, relative to the repository root
     */
    std::string targetPath() const;

    bool isCreation() const { return !old_path.has_value(); }
    bool isDeletion() const { return !new_path.has_value(); }
};

struct PatchParseResult {
    bool success = false;
    std::string error;                 ///< Diagnostic when success is false
    std::vector<FilePatch> files;
};

struct FileApplyResult {
    bool success = false;
    std::string error;
    std::optional<std::string> content;   ///< New content, std::nullopt when the file is deleted
};

/**
 * @brief Unified diff reader and applier
 *
 * Parsing is strict: every hunk body must contain exactly the number of old
 * and new lines its header announces, so a structurally broken patch is
 * rejected before anything touches a working tree.
 */
class UnifiedPatch {
public:
    /**
     * @brief Parse patch text into per-file patches
     * @param text Unified diff, possibly several files concatenated
     * @return Parsed files, or an error naming the offending line
     */
    static PatchParseResult parse(const std::string& text);

    /**
     * @brief Apply one file patch to in-memory content
     *
     * Hunks are located at their announced position first, then at the
     * nearest offset where the context matches exactly.
     *
     * @param original Current file content, std::nullopt if the file does not exist
     * @param patch Parsed file patch
     */
    static FileApplyResult applyFilePatch(const std::optional<std::string>& original,
                                          const FilePatch& patch);

    /**
     * @brief Repair the "--- a/x+++ b/x" single-line header corruption
     *
     * Also guarantees a trailing newline.
     */
    static std::string normalizePatchText(const std::string& text);

    /**
     * @brief Target paths of all file patches, in patch order
     */
    static std::vector<std::string> affectedPaths(const std::vector<FilePatch>& files);

private:
    static std::optional<std::string> parseHeaderPath(const std::string& line, size_t prefix_len);
};

} // namespace Warden
