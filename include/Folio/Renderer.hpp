// =================================================================
// include/Folio/Renderer.hpp
// =================================================================
// Turns a classified file into its labeled, fenced Markdown block.

#pragma once

#include "Folio/FileClassifier.hpp"
#include "Folio/ProjectScanner.hpp"
#include "Folio/RuleSet.hpp"
#include <optional>
#include <string>

namespace Folio {

/**
 * @brief Output unit for one file
 *
 * Blocks stay structured until the final write so per-file output never
 * has to be recovered by splitting flattened text.
 */
struct RenderedBlock {
    std::string display_path;
    Disposition disposition = Disposition::Rendered;
    OmitReason reason = OmitReason::None;
    std::string header;  ///< Path line, including the notice for referenced-only files
    std::string body;    ///< Fenced content; empty for referenced-only files

    /**
     * @brief Flatten to Markdown
     */
    std::string text() const { return header + "\n" + body; }
};

/**
 * @brief Fence language label for an extension; falls back to the extension itself
 */
std::string languageHint(const std::string& extension);

/**
 * @brief Short notice explaining why a file's content is withheld
 */
std::string referenceNotice(const Classification& classification, const RuleSet& rules);

/**
 * @brief Backtick fence long enough that the content cannot close it early
 */
std::string fenceFor(const std::string& content);

/**
 * @brief Render one classified file
 * @param entry The file
 * @param classification Its disposition and reason
 * @param content Transformed content; used only when the file is Rendered
 * @param rules Rules for the run, for notice details
 * @return The block, or nullopt for Excluded files
 */
std::optional<RenderedBlock> renderBlock(const PathEntry& entry,
                                         const Classification& classification,
                                         const std::string& content,
                                         const RuleSet& rules);

} // namespace Folio
