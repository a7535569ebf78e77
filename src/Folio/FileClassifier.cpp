// =================================================================
// src/Folio/FileClassifier.cpp
// =================================================================
// Implementation for per-file classification.

#include "Folio/FileClassifier.hpp"
#include "Folio/BinaryDetector.hpp"
#include "Folio/Errors.hpp"
#include "Folio/PatternMatcher.hpp"

namespace Folio {

namespace {

Classification referenced(OmitReason reason, const std::string& detail = "") {
    Classification result;
    result.disposition = Disposition::ReferencedOnly;
    result.reason = reason;
    result.detail = detail;
    return result;
}

Classification excluded() {
    return Classification{};
}

} // namespace

Classification classify(const PathEntry& entry, const RuleSet& rules) {
    for (const auto& path : rules.excluded_files) {
        if (entry.absolute_path == std::filesystem::path(path)) {
            return excluded();
        }
    }

    if (matchesName(entry.filename, rules.omit_files)) {
        return referenced(OmitReason::OmittedName);
    }

    if (matchesExtension(entry.filename, rules.omit_extensions)) {
        return referenced(OmitReason::OmittedExtension);
    }

    if (!rules.whitelist_files.empty() && !matchesName(entry.filename, rules.whitelist_files)) {
        return excluded();
    }

    if (!rules.whitelist.empty() &&
        !matchesName(entry.filename, rules.whitelist) &&
        !matchesName(entry.relative_path, rules.whitelist)) {
        return excluded();
    }

    if (rules.extensions && !matchesExtension(entry.filename, *rules.extensions)) {
        return excluded();
    }

    if (entry.size > rules.max_file_size) {
        return referenced(OmitReason::TooLarge);
    }

    try {
        if (isBinaryFile(entry.absolute_path)) {
            return referenced(OmitReason::Binary);
        }
    } catch (const ReadError& e) {
        return referenced(OmitReason::ReadFailed, e.what());
    }

    Classification rendered;
    rendered.disposition = Disposition::Rendered;
    return rendered;
}

std::string toString(Disposition disposition) {
    switch (disposition) {
        case Disposition::Excluded: return "excluded";
        case Disposition::ReferencedOnly: return "referenced";
        case Disposition::Rendered: return "rendered";
        default: return "unknown";
    }
}

std::string toString(OmitReason reason) {
    switch (reason) {
        case OmitReason::None: return "none";
        case OmitReason::OmittedName: return "omitted-name";
        case OmitReason::OmittedExtension: return "omitted-extension";
        case OmitReason::TooLarge: return "too-large";
        case OmitReason::Binary: return "binary";
        case OmitReason::ReadFailed: return "read-failed";
        case OmitReason::DecodeFailed: return "decode-failed";
        default: return "unknown";
    }
}

} // namespace Folio
