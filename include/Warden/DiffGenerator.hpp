// =================================================================
// include/Warden/DiffGenerator.hpp
// =================================================================
// Generates applicable unified diffs from old/new file contents.

#ifndef WARDEN_DIFFGENERATOR_HPP
#define WARDEN_DIFFGENERATOR_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Warden {

enum class DiffLineType {
    UNCHANGED,
    ADDED,
    REMOVED
};

/**
 * @brief One line of the edit script
 *
 * text keeps its line terminator ("\n" or "\r\n"); only the last line of a
 * file can lack one.
 */
struct DiffLine {
    std::string text;
    DiffLineType type;
    size_t original_line_num;   ///< 1-based, 0 for added lines
    size_t new_line_num;        ///< 1-based, 0 for removed lines
};

/**
 * @brief A contiguous group of changes with surrounding context
 */
struct DiffHunk {
    size_t old_start = 0;
    size_t old_count = 0;
    size_t new_start = 0;
    size_t new_count = 0;
    std::vector<DiffLine> lines;

    /**
     * @brief "@@ -old_start,old_count +new_start,new_count @@"
     */
    std::string header() const;
};

struct DiffStats {
    size_t additions = 0;
    size_t deletions = 0;
    size_t unchanged = 0;
};

/**
 * @brief Computes a minimal line-level diff and renders it as a patch
 *
 * The edit script is the shortest edit script between the two line
 * sequences, so the rendered patch is minimal. A missing original is
 * treated as empty content and rendered with a "/dev/null" old side.
 */
class DiffGenerator {
public:
    /**
     * @brief Number of context lines around each change
     */
    static constexpr size_t DEFAULT_CONTEXT_LINES = 3;

    /**
     * @brief Construct a generator
     * @param original Original content, std::nullopt if the file does not exist
     * @param modified New content
     * @param context_lines Context lines per hunk
     */
    DiffGenerator(const std::optional<std::string>& original, const std::string& modified,
                  size_t context_lines = DEFAULT_CONTEXT_LINES);

    /**
     * @brief Full edit script, one entry per line of either side
     */
    std::vector<DiffLine> getDiff() const;

    /**
     * @brief Edit script grouped into hunks
     */
    std::vector<DiffHunk> getHunks() const;

    bool hasChanges() const;

    DiffStats getStats() const;

    /**
     * @brief Render a complete single-file patch
     * @param file_path Path relative to the repository root
     * @return Patch text, or an empty string when nothing changed
     */
    std::string toUnifiedDiff(const std::string& file_path) const;

    /**
     * @brief Convenience wrapper around toUnifiedDiff()
     */
    static std::string makeDiff(const std::optional<std::string>& original,
                                const std::string& modified,
                                const std::string& file_path);

    /**
     * @brief Split text into lines, each keeping its terminator
     */
    static std::vector<std::string> splitLines(const std::string& text);

    /**
     * @brief Normalize a path for patch headers (forward slashes, no "./")
     */
    static std::string normalizePatchPath(const std::string& path);

    /**
     * @brief Print a patch with ANSI colors
     * @param patch Unified diff text
     * @param out Output stream
     */
    static void printColoredPatch(const std::string& patch, std::ostream& out);

private:
    std::vector<DiffLine> computeDiff() const;

    std::optional<std::string> m_original;
    std::string m_modified;
    size_t m_context_lines;
};

} // namespace Warden

#endif // WARDEN_DIFFGENERATOR_HPP
