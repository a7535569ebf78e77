// =================================================================
// include/Folio/IgnorePattern.hpp
// =================================================================
// Header for ignore-file patterns and their per-directory stacking.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <filesystem>

namespace Folio {

/**
 * @brief One line of an ignore file, compiled to a whole-path regex
 *
 * Understands the gitignore line syntax: `*`, `?` and bracket classes
 * within one component, `**` across components, a leading `!` to
 * re-include, a trailing `/` for directories, and anchoring by any
 * slash that is not the trailing one. Blank and `#` lines compile to
 * nothing.
 */
class IgnorePattern {
public:
    explicit IgnorePattern(const std::string& line);

    /**
     * @brief Test a path against the pattern, ignoring negation
     * @param path '/'-separated path relative to the ignore file's directory
     * @param is_directory True if the path names a directory
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_negated; }
    bool isDirectoryOnly() const { return m_dir_only; }
    bool isAnchored() const { return m_anchored; }
    const std::string& getPattern() const { return m_line; }

    /// True for blank lines, comments and globs that did not compile.
    bool isEmpty() const { return m_blank; }

private:
    std::string m_line;
    bool m_negated = false;
    bool m_dir_only = false;
    bool m_anchored = false;
    bool m_blank = false;
    std::regex m_compiled;

    void compile(std::string body);
};

/**
 * @brief Ordered collection of patterns sharing one base directory
 *
 * Patterns are applied in order; the last matching pattern decides.
 */
class IgnorePatternSet {
public:
    /**
     * @param base_directory Directory that anchored patterns are relative to
     */
    explicit IgnorePatternSet(const std::filesystem::path& base_directory = {});

    /**
     * @brief Load an ignore file; its directory becomes the base directory
     * @param file_path Path to the ignore file
     * @return The loaded set
     * @throws ConfigError if the file cannot be read
     */
    static IgnorePatternSet fromFile(const std::filesystem::path& file_path);

    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Append patterns from a file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     * @throws ConfigError if the file cannot be read
     */
    size_t loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Verdict of the last matching pattern
     * @param path Path relative to the base directory
     * @param is_directory True if path is a directory
     * @return true (ignore), false (re-included by negation), or nullopt if nothing matched
     */
    std::optional<bool> evaluate(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if a path should be ignored
     * @param path Path relative to the base directory
     * @param is_directory True if path is a directory
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Express an absolute path relative to the base directory
     * @return Relative '/'-separated path, or nullopt if the path is not strictly inside the base
     */
    std::optional<std::string> relativeTo(const std::filesystem::path& absolute_path) const;

    const std::filesystem::path& baseDirectory() const { return m_base_directory; }

    size_t size() const { return m_patterns.size(); }

private:
    std::filesystem::path m_base_directory;
    std::vector<IgnorePattern> m_patterns;
};

/**
 * @brief Global and per-directory pattern sets evaluated together
 *
 * Sets are consulted from the bottom (global) to the top (deepest
 * directory); a set with a matching pattern overrides the sets below it.
 */
class IgnoreStack {
public:
    void push(IgnorePatternSet patterns);
    void pop();

    size_t size() const { return m_sets.size(); }
    bool empty() const { return m_sets.empty(); }

    /**
     * @brief Check a path against every set in the stack
     * @param absolute_path Absolute, normalized path
     * @param is_directory True if the path is a directory
     */
    bool isIgnored(const std::filesystem::path& absolute_path, bool is_directory) const;

    /**
     * @brief Like isIgnored, but also true when any parent directory is ignored
     */
    bool isIgnoredWithParents(const std::filesystem::path& absolute_path, bool is_directory) const;

private:
    std::vector<IgnorePatternSet> m_sets;
};

} // namespace Folio
