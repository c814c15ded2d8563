// =================================================================
// include/Warden/ProposalDocument.hpp
// =================================================================
// Markdown proposal documents: metadata fields plus fenced diff blocks.

#pragma once

#include "Warden/Proposal.hpp"
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Result of reading a proposal document
 */
struct DocumentParseResult {
    bool success = false;
    std::string error;
    ProposalMetadata metadata;
    std::vector<FileDiff> diffs;    ///< One entry per file patch found in the diff blocks
};

/**
 * @brief Reads and writes the proposal document format
 *
 * @code
 * **Proposer:** agent-7
 * **Type:** fix
 *
 * ## Summary
 *
 * Guard against empty input
 *
 * ```diff
 * --- a/src/parse.cpp
 * +++ b/src/parse.cpp
 * @@ ...
 * ```
 * @endcode
 *
 * Every ```diff block is collected in document order and the blocks are
 * joined into one patch.
 */
class ProposalDocument {
public:
    /**
     * @brief Parse a proposal document
     * @param content Document text
     * @return Metadata and per-file diffs, or an error when no valid patch is present
     */
    static DocumentParseResult parse(const std::string& content);

    /**
     * @brief Extract and join all fenced diff blocks
     * @return Normalized patch text, empty when the document has no diff block
     */
    static std::string extractPatch(const std::string& content);

    /**
     * @brief Render a proposal in document form
     */
    static std::string render(const Proposal& proposal);
};

} // namespace Warden
