// =================================================================
// include/Folio/PatternMatcher.hpp
// =================================================================
// Name and extension list matching used by the scanner and classifier.
// Gitignore-style patterns live in IgnorePattern.hpp.

#pragma once

#include <string>
#include <vector>

namespace Folio {

/**
 * @brief Extract the extension of a file name, without the dot
 *
 * The extension is the text after the last '.'; a leading dot does not
 * start an extension, so ".bashrc" and "Makefile" both yield "".
 *
 * @param filename Bare file name (no directory part)
 * @return Extension or empty string
 */
std::string getExtension(const std::string& filename);

/**
 * @brief Strip a leading '.' so ".py" and "py" compare equal
 */
std::string normalizeExtension(const std::string& extension);

/**
 * @brief Exact, case-sensitive membership test
 */
bool matchesName(const std::string& name, const std::vector<std::string>& names);

/**
 * @brief Case-sensitive extension membership test
 * @param filename Bare file name
 * @param extensions Extensions, with or without leading dot
 * @return true if the file's extension is listed (files without an extension never match)
 */
bool matchesExtension(const std::string& filename, const std::vector<std::string>& extensions);

/**
 * @brief Split a comma-separated list, trimming blanks and dropping empty items
 */
std::vector<std::string> splitList(const std::string& csv);

} // namespace Folio
