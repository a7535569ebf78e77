// =================================================================
// include/Folio/ProjectScanner.hpp
// =================================================================
// Header for directory traversal: decides which subtrees are entered
// and which files are handed to the classifier.

#pragma once

#include "Folio/IgnorePattern.hpp"
#include "Folio/RuleSet.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Folio {

/**
 * @brief A file reached by the scanner
 */
struct PathEntry {
    std::filesystem::path absolute_path;
    std::string relative_path;   ///< Relative to the scan root, '/'-separated
    std::string display_path;    ///< Relative to the display base, used in headers
    std::string filename;
    bool is_directory = false;
    std::uintmax_t size = 0;
    size_t depth = 0;            ///< Depth of the containing directory (root = 0)
};

/**
 * @brief A directory that could not be listed and was skipped
 */
struct TraversalWarning {
    std::string path;
    std::string reason;
};

/**
 * @brief Walks directory trees applying the traversal rules of a RuleSet
 *
 * The walk is depth-first and pre-order: a directory's files are emitted
 * before any of its subdirectories is entered. Entries are sorted by name
 * at every level so the output order is reproducible across filesystems.
 * Directory symlinks are not followed.
 */
class ProjectScanner {
public:
    using Visitor = std::function<void(const PathEntry&)>;

    /**
     * @brief Construct a scanner bound to a rule set
     * @param rules Rules for the run; must outlive the scanner
     * @throws ConfigError if the global ignore file cannot be loaded
     */
    explicit ProjectScanner(const RuleSet& rules);

    /**
     * @brief Walk a directory tree, calling the visitor for each candidate file
     * @param root Directory to scan
     * @param visitor Receives files in traversal order
     * @param display_base Base for PathEntry::display_path; defaults to root
     * @throws TraversalError if the root itself cannot be listed
     * @throws ConfigError if a per-directory ignore file cannot be read
     */
    void scan(const std::filesystem::path& root, const Visitor& visitor,
              const std::filesystem::path& display_base = {});

    /**
     * @brief Walk a directory tree and collect the candidate files
     * @param root Directory to scan
     * @return Files in traversal order
     */
    std::vector<PathEntry> scanFiles(const std::filesystem::path& root);

    /**
     * @brief Build the entry for an explicitly listed file
     *
     * Traversal rules (directory omit-list, directory whitelists, depth) do
     * not apply; ignore files do, including those of the directories
     * between the base and the file when per-directory discovery is on.
     *
     * @param file File to include
     * @param base Base directory for relative and display paths
     * @return The entry, or nullopt if the file is ignored
     */
    std::optional<PathEntry> scanFile(const std::filesystem::path& file,
                                      const std::filesystem::path& base);

    /**
     * @brief Directories skipped because they could not be listed
     */
    const std::vector<TraversalWarning>& getWarnings() const { return m_warnings; }

    /**
     * @brief Forget warnings from earlier scans
     *
     * scan() appends to the warning list so several roots can share it;
     * callers starting a new run clear it first.
     */
    void clearWarnings() { m_warnings.clear(); }

private:
    const RuleSet& m_rules;
    std::optional<IgnorePatternSet> m_global_ignore;
    IgnoreStack m_ignore_stack;
    std::vector<TraversalWarning> m_warnings;

    std::filesystem::path m_root;
    std::filesystem::path m_display_base;

    void walkDirectory(const std::filesystem::path& directory, const std::string& relative_dir,
                       size_t depth, const Visitor& visitor);

    /**
     * @brief Apply the directory omit-list, whitelists and ignore patterns
     */
    bool shouldEnterDirectory(const std::string& name, const std::string& relative_path,
                              const std::filesystem::path& absolute_path) const;

    /**
     * @brief Load the per-directory ignore file if discovery is on and one exists
     */
    std::optional<IgnorePatternSet> loadLocalIgnore(const std::filesystem::path& directory) const;
};

} // namespace Folio
