// =================================================================
// include/Folio/DocumentBuilder.hpp
// =================================================================
// Runs the pipeline: scan, classify, transform and render, producing
// the ordered list of blocks for the output assembler.

#pragma once

#include "Folio/ContentTransformer.hpp"
#include "Folio/ProjectScanner.hpp"
#include "Folio/Renderer.hpp"
#include "Folio/RuleSet.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace Folio {

/**
 * @brief Blocks in traversal order plus the run's accounting
 */
struct BuildResult {
    std::vector<RenderedBlock> blocks;
    std::vector<TraversalWarning> warnings;
    size_t rendered = 0;
    size_t referenced = 0;
    size_t excluded = 0;
};

/**
 * @brief Drives one run over a directory or a list of input paths
 *
 * Entries are processed strictly one at a time in traversal order; each
 * file is opened, read and closed while its block is produced.
 */
class DocumentBuilder {
public:
    /**
     * @brief Construct a builder for a rule set
     * @param rules Rules for the run; must outlive the builder
     * @throws ConfigError if the rules are invalid or the global ignore file cannot be loaded
     */
    explicit DocumentBuilder(const RuleSet& rules);

    /**
     * @brief Build blocks for every file under a directory
     * @param root Scan root
     * @throws TraversalError if the root cannot be listed
     */
    BuildResult buildFromDirectory(const std::filesystem::path& root);

    /**
     * @brief Build blocks for a mixed list of directories and files
     *
     * Display paths are relative to the common base directory of all
     * inputs. Paths that do not exist are skipped with a warning.
     *
     * @param paths Directories to scan and files to include
     */
    BuildResult buildFromPaths(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Read an input-paths file: one path per line, blank lines ignored
     * @throws ConfigError if the file cannot be read
     */
    static std::vector<std::filesystem::path> readInputPaths(const std::filesystem::path& list_file);

    /**
     * @brief Deepest directory containing every path (files count as their parent directory)
     */
    static std::filesystem::path commonBase(const std::vector<std::filesystem::path>& paths);

private:
    const RuleSet& m_rules;
    ProjectScanner m_scanner;
    ContentTransformer m_transformer;

    void processEntry(const PathEntry& entry, BuildResult& result);

    /**
     * @brief Read a whole file
     * @throws ReadError if it cannot be opened or read
     */
    static std::string readFile(const std::filesystem::path& file_path);
};

} // namespace Folio
