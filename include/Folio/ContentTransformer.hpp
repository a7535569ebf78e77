// =================================================================
// include/Folio/ContentTransformer.hpp
// =================================================================
// Text transforms applied to rendered file content: comment stripping,
// string truncation, line truncation and blank-line collapsing.
//
// All of these are lexical approximations. A comment marker inside a
// string literal is treated as a comment, and an escaped quote can end
// a string early. This is accepted behavior, not a bug.

#pragma once

#include "Folio/RuleSet.hpp"
#include <string>

namespace Folio {

/// Appended inside a string literal whose interior was cut.
constexpr const char* kStringTruncatedMarker = "... (String truncated)";

/// Appended to a line that was cut.
constexpr const char* kLineTruncatedMarker = " // (Line truncated to save space)";

enum class CommentSyntax {
    None,    ///< No stripping for this extension
    Hash,    ///< '#' to end of line
    CStyle   ///< '/* ... */' spans and '//' to end of line
};

/**
 * @brief Look up the comment syntax for a file extension (without dot)
 */
CommentSyntax commentSyntaxFor(const std::string& extension);

/**
 * @brief Applies the configured transforms to decoded file content
 *
 * The steps always run in the same order: comment stripping, string
 * truncation, line truncation, blank-line collapsing. Output uses LF line
 * endings and ends with exactly one newline unless it is empty.
 */
class ContentTransformer {
public:
    explicit ContentTransformer(const TransformConfig& config);

    /**
     * @brief Transform raw file bytes
     * @param raw File content as read from disk
     * @param extension File extension, used to pick the comment syntax
     * @return Transformed text
     * @throws DecodeError if the content is not valid UTF-8
     */
    std::string transform(const std::string& raw, const std::string& extension) const;

    static bool isValidUtf8(const std::string& text, size_t* error_offset = nullptr);

    static std::string normalizeLineEndings(const std::string& text);

    static std::string stripComments(const std::string& content, CommentSyntax syntax);

    /**
     * @brief Cut the interior of quoted literals longer than max_length code points
     */
    static std::string truncateStrings(const std::string& content, size_t max_length);

    /**
     * @brief Cut lines longer than max_length code points
     */
    static std::string truncateLines(const std::string& content, size_t max_length);

    /**
     * @brief Reduce runs of blank lines longer than max_blank to exactly max_blank
     */
    static std::string collapseBlankLines(const std::string& content, size_t max_blank);

private:
    TransformConfig m_config;
};

} // namespace Folio
