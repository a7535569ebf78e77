// =================================================================
// include/Folio/FileClassifier.hpp
// =================================================================
// Per-file decision: excluded, referenced without content, or rendered.

#pragma once

#include "Folio/ProjectScanner.hpp"
#include "Folio/RuleSet.hpp"
#include <string>

namespace Folio {

enum class Disposition {
    Excluded,        ///< Not shown at all
    ReferencedOnly,  ///< Path noted, content withheld
    Rendered         ///< Path and transformed content shown
};

/**
 * @brief Why a file ended up ReferencedOnly
 */
enum class OmitReason {
    None,
    OmittedName,
    OmittedExtension,
    TooLarge,
    Binary,
    ReadFailed,
    DecodeFailed
};

struct Classification {
    Disposition disposition = Disposition::Excluded;
    OmitReason reason = OmitReason::None;
    std::string detail;  ///< Error text for ReadFailed / DecodeFailed
};

/**
 * @brief Classify one file; the first matching rule wins
 *
 * Order: filename omit-list, extension omit-list, file whitelists,
 * extension allow-list, size limit, binary sample. Omit-lists therefore
 * take precedence over every inclusion rule, and binary files are never
 * rendered even when whitelisted.
 *
 * @param entry File reached by the scanner
 * @param rules Rules for the run
 * @return The classification; never throws for unreadable files
 */
Classification classify(const PathEntry& entry, const RuleSet& rules);

std::string toString(Disposition disposition);
std::string toString(OmitReason reason);

} // namespace Folio
