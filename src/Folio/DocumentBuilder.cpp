// =================================================================
// src/Folio/DocumentBuilder.cpp
// =================================================================
// Implementation for the scan/classify/transform/render pipeline.

#include "Folio/DocumentBuilder.hpp"
#include "Folio/Errors.hpp"
#include "Folio/FileClassifier.hpp"
#include "Folio/Logger.hpp"
#include "Folio/PatternMatcher.hpp"
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace Folio {

namespace {

// Validation runs before the scanner is built so bad values fail first.
const RuleSet& validated(const RuleSet& rules) {
    rules.validate();
    return rules;
}

} // namespace

DocumentBuilder::DocumentBuilder(const RuleSet& rules)
    : m_rules(validated(rules)),
      m_scanner(m_rules),
      m_transformer(m_rules.transform)
{
}

BuildResult DocumentBuilder::buildFromDirectory(const fs::path& root) {
    BuildResult result;
    m_scanner.clearWarnings();

    m_scanner.scan(root, [this, &result](const PathEntry& entry) {
        processEntry(entry, result);
    });

    result.warnings = m_scanner.getWarnings();
    Logger::getInstance().logScanSummary(result.rendered, result.referenced,
                                         result.excluded, result.warnings.size());
    return result;
}

BuildResult DocumentBuilder::buildFromPaths(const std::vector<fs::path>& paths) {
    BuildResult result;
    m_scanner.clearWarnings();

    std::vector<fs::path> existing;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            existing.push_back(fs::absolute(path).lexically_normal());
        } else {
            Logger::getInstance().warning("DocumentBuilder", "Skipping missing input path", path.string());
        }
    }

    fs::path base = commonBase(existing);
    Logger::getInstance().debug("DocumentBuilder", "Display paths are relative to", base.string());

    // Overlapping or repeated inputs reach some files more than once
    std::set<fs::path> seen;
    auto processOnce = [this, &result, &seen](const PathEntry& entry) {
        if (!seen.insert(entry.absolute_path).second) {
            Logger::getInstance().debug("DocumentBuilder", "Already processed", entry.display_path);
            return;
        }
        processEntry(entry, result);
    };

    for (const auto& path : existing) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            try {
                m_scanner.scan(path, processOnce, base);
            } catch (const TraversalError& e) {
                // One unreadable input does not stop the others
                Logger::getInstance().warning("DocumentBuilder", "Skipping unreadable input directory", e.what());
                result.warnings.push_back({path.string(), e.reason()});
            }
        } else if (auto entry = m_scanner.scanFile(path, base)) {
            processOnce(*entry);
        }
    }

    const auto& scan_warnings = m_scanner.getWarnings();
    result.warnings.insert(result.warnings.end(), scan_warnings.begin(), scan_warnings.end());
    Logger::getInstance().logScanSummary(result.rendered, result.referenced,
                                         result.excluded, result.warnings.size());
    return result;
}

std::vector<fs::path> DocumentBuilder::readInputPaths(const fs::path& list_file) {
    std::ifstream file(list_file);
    if (!file.is_open()) {
        throw ConfigError("Cannot read input paths file: " + list_file.string());
    }

    std::vector<fs::path> paths;
    std::string line;
    while (std::getline(file, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = line.find_last_not_of(" \t\r");
        paths.emplace_back(line.substr(first, last - first + 1));
    }

    return paths;
}

fs::path DocumentBuilder::commonBase(const std::vector<fs::path>& paths) {
    if (paths.empty()) {
        return fs::current_path();
    }

    auto directoryOf = [](const fs::path& path) {
        fs::path absolute = fs::absolute(path).lexically_normal();
        std::error_code ec;
        return fs::is_directory(absolute, ec) ? absolute : absolute.parent_path();
    };

    fs::path base = directoryOf(paths.front());
    for (size_t i = 1; i < paths.size(); ++i) {
        fs::path candidate = directoryOf(paths[i]);
        fs::path common;
        auto base_it = base.begin();
        auto candidate_it = candidate.begin();
        while (base_it != base.end() && candidate_it != candidate.end() && *base_it == *candidate_it) {
            common /= *base_it;
            ++base_it;
            ++candidate_it;
        }
        base = common;
    }

    return base;
}

void DocumentBuilder::processEntry(const PathEntry& entry, BuildResult& result) {
    Classification classification = classify(entry, m_rules);
    std::string content;

    if (classification.disposition == Disposition::Rendered) {
        try {
            content = m_transformer.transform(readFile(entry.absolute_path), getExtension(entry.filename));
        } catch (const ReadError& e) {
            Logger::getInstance().warning("DocumentBuilder", "Could not read file", e.what());
            classification = Classification{Disposition::ReferencedOnly, OmitReason::ReadFailed, e.what()};
        } catch (const DecodeError& e) {
            Logger::getInstance().warning("DocumentBuilder", "Could not decode file: " + entry.display_path, e.what());
            classification = Classification{Disposition::ReferencedOnly, OmitReason::DecodeFailed, e.what()};
        }
    }

    Logger::getInstance().debug("DocumentBuilder", entry.display_path,
                                toString(classification.disposition) + ", " + toString(classification.reason));

    switch (classification.disposition) {
        case Disposition::Excluded: result.excluded++; break;
        case Disposition::ReferencedOnly: result.referenced++; break;
        case Disposition::Rendered: result.rendered++; break;
    }

    if (auto block = renderBlock(entry, classification, content, m_rules)) {
        result.blocks.push_back(std::move(*block));
    }
}

std::string DocumentBuilder::readFile(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError("Cannot open file: " + file_path.string());
    }

    std::ostringstream content_stream;
    content_stream << file.rdbuf();
    if (file.bad()) {
        throw ReadError("Cannot read file: " + file_path.string());
    }

    return content_stream.str();
}

} // namespace Folio
