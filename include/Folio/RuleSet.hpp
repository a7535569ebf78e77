// =================================================================
// include/Folio/RuleSet.hpp
// =================================================================
// Resolved rules governing one run. Built once from defaults, the
// config file and the command line, then shared read-only.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Folio {

/// Default size limit above which files are referenced but not rendered.
constexpr std::uintmax_t kDefaultMaxFileSize = 100 * 1024;

/**
 * @brief Content transformation settings; unset limits disable the step
 */
struct TransformConfig {
    bool strip_comments = false;
    std::optional<size_t> max_line_length;
    std::optional<size_t> max_string_length;
    std::optional<size_t> max_blank_lines;
};

/**
 * @brief Inclusion, exclusion and transformation rules for a run
 *
 * Empty whitelists mean "not configured". The extension allow-list is
 * optional: unset means every extension is eligible, while a set but empty
 * list admits nothing.
 */
struct RuleSet {
    // Classification
    std::optional<std::vector<std::string>> extensions;
    std::vector<std::string> omit_extensions;
    std::vector<std::string> omit_files;
    std::vector<std::string> whitelist_files;
    std::vector<std::string> whitelist;
    std::uintmax_t max_file_size = kDefaultMaxFileSize;
    std::vector<std::string> excluded_files;   ///< Absolute, normalized paths never emitted

    // Traversal
    std::vector<std::string> omit_dirs;
    std::vector<std::string> whitelist_dirs;
    std::optional<size_t> max_depth;

    // Ignore files
    std::string global_ignore_file;
    bool obey_ignore_files = false;
    std::string ignore_file_name = ".gitignore";

    TransformConfig transform;

    /**
     * @brief Check the rules for values that cannot produce a sensible run
     * @throws ConfigError describing the first invalid setting
     */
    void validate() const;
};

} // namespace Folio
