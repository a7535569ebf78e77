// =================================================================
// src/Folio/Renderer.cpp
// =================================================================
// Implementation for block rendering.

#include "Folio/Renderer.hpp"
#include "Folio/PatternMatcher.hpp"
#include <algorithm>
#include <unordered_map>

namespace Folio {

std::string languageHint(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> hints = {
        {"py", "python"}, {"pyi", "python"},
        {"js", "javascript"}, {"mjs", "javascript"}, {"cjs", "javascript"},
        {"ts", "typescript"},
        {"yml", "yaml"},
        {"md", "markdown"},
        {"h", "cpp"}, {"hh", "cpp"}, {"hpp", "cpp"}, {"hxx", "cpp"}, {"cc", "cpp"}, {"cxx", "cpp"},
        {"sh", "bash"}, {"zsh", "bash"},
        {"rs", "rust"},
        {"rb", "ruby"},
        {"kt", "kotlin"},
        {"cs", "csharp"}
    };

    auto it = hints.find(extension);
    return it == hints.end() ? extension : it->second;
}

std::string referenceNotice(const Classification& classification, const RuleSet& rules) {
    switch (classification.reason) {
        case OmitReason::OmittedName:
        case OmitReason::OmittedExtension:
            return "Source omitted to save space";
        case OmitReason::TooLarge:
            return "File exceeds size limit of " + std::to_string(rules.max_file_size) + " bytes";
        case OmitReason::Binary:
            return "Binary file";
        case OmitReason::ReadFailed:
            return "Error reading file: " + classification.detail;
        case OmitReason::DecodeFailed:
            return "Could not decode file as UTF-8 text";
        default:
            return "Source omitted";
    }
}

std::string fenceFor(const std::string& content) {
    size_t longest_run = 0;
    size_t run = 0;
    for (char c : content) {
        run = (c == '`') ? run + 1 : 0;
        longest_run = std::max(longest_run, run);
    }
    return std::string(std::max<size_t>(3, longest_run + 1), '`');
}

std::optional<RenderedBlock> renderBlock(const PathEntry& entry,
                                         const Classification& classification,
                                         const std::string& content,
                                         const RuleSet& rules) {
    if (classification.disposition == Disposition::Excluded) {
        return std::nullopt;
    }

    RenderedBlock block;
    block.display_path = entry.display_path;
    block.disposition = classification.disposition;
    block.reason = classification.reason;

    if (classification.disposition == Disposition::ReferencedOnly) {
        block.header = "**" + entry.display_path + "** (" + referenceNotice(classification, rules) + ")";
        return block;
    }

    std::string fence = fenceFor(content);
    block.header = "**" + entry.display_path + "**";
    block.body = fence + languageHint(getExtension(entry.filename)) + "\n" + content + fence + "\n";
    return block;
}

} // namespace Folio
