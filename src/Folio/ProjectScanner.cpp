// =================================================================
// src/Folio/ProjectScanner.cpp
// =================================================================
// Implementation for directory traversal.

#include "Folio/ProjectScanner.hpp"
#include "Folio/Errors.hpp"
#include "Folio/Logger.hpp"
#include "Folio/PatternMatcher.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace Folio {

namespace {

struct DirectoryListing {
    std::vector<fs::directory_entry> files;
    std::vector<fs::directory_entry> directories;
};

bool byName(const fs::directory_entry& a, const fs::directory_entry& b) {
    return a.path().filename().string() < b.path().filename().string();
}

DirectoryListing listDirectory(const fs::path& directory) {
    DirectoryListing listing;
    std::error_code ec;

    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw TraversalError(directory.string(), ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw TraversalError(directory.string(), ec.message());
        }

        const fs::directory_entry& entry = *it;
        std::error_code status_ec;

        if (entry.is_symlink(status_ec)) {
            // Symlinked directories are not followed; symlinked files are read through
            if (entry.is_directory(status_ec)) {
                Logger::getInstance().debug("ProjectScanner",
                    "Not following directory symlink", entry.path().string());
                continue;
            }
        }

        if (entry.is_directory(status_ec)) {
            listing.directories.push_back(entry);
        } else if (entry.is_regular_file(status_ec)) {
            listing.files.push_back(entry);
        }
    }
    if (ec) {
        throw TraversalError(directory.string(), ec.message());
    }

    std::sort(listing.files.begin(), listing.files.end(), byName);
    std::sort(listing.directories.begin(), listing.directories.end(), byName);
    return listing;
}

} // namespace

ProjectScanner::ProjectScanner(const RuleSet& rules)
    : m_rules(rules)
{
    if (!m_rules.global_ignore_file.empty()) {
        m_global_ignore = IgnorePatternSet::fromFile(m_rules.global_ignore_file);
        Logger::getInstance().info("ProjectScanner",
            "Loaded global ignore file with " + std::to_string(m_global_ignore->size()) + " patterns",
            m_rules.global_ignore_file);
    }
}

void ProjectScanner::scan(const fs::path& root, const Visitor& visitor, const fs::path& display_base) {
    m_root = fs::absolute(root).lexically_normal();
    m_display_base = display_base.empty() ? m_root : fs::absolute(display_base).lexically_normal();

    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        throw TraversalError(m_root.string(), "not a directory");
    }

    m_ignore_stack = IgnoreStack();
    if (m_global_ignore) {
        m_ignore_stack.push(*m_global_ignore);
    }

    Logger::getInstance().debug("ProjectScanner", "Scanning directory", m_root.string());
    walkDirectory(m_root, "", 0, visitor);
}

std::vector<PathEntry> ProjectScanner::scanFiles(const fs::path& root) {
    std::vector<PathEntry> discovered_files;
    scan(root, [&discovered_files](const PathEntry& entry) {
        discovered_files.push_back(entry);
    });
    return discovered_files;
}

std::optional<PathEntry> ProjectScanner::scanFile(const fs::path& file, const fs::path& base) {
    fs::path absolute = fs::absolute(file).lexically_normal();
    fs::path absolute_base = fs::absolute(base).lexically_normal();

    IgnoreStack stack;
    if (m_global_ignore) {
        stack.push(*m_global_ignore);
    }

    if (m_rules.obey_ignore_files) {
        fs::path relative_dir = absolute.parent_path().lexically_relative(absolute_base);
        fs::path directory = absolute_base;
        if (auto local = loadLocalIgnore(directory)) {
            stack.push(std::move(*local));
        }
        if (!relative_dir.empty() && relative_dir != "." && *relative_dir.begin() != "..") {
            for (const auto& component : relative_dir) {
                directory /= component;
                if (auto local = loadLocalIgnore(directory)) {
                    stack.push(std::move(*local));
                }
            }
        }
    }

    if (stack.isIgnoredWithParents(absolute, false)) {
        Logger::getInstance().debug("ProjectScanner", "Ignored by pattern", absolute.string());
        return std::nullopt;
    }

    PathEntry entry;
    entry.absolute_path = absolute;
    entry.filename = absolute.filename().string();
    entry.relative_path = absolute.lexically_relative(absolute_base).generic_string();
    entry.display_path = entry.relative_path;

    auto components = std::distance(fs::path(entry.relative_path).begin(), fs::path(entry.relative_path).end());
    entry.depth = components > 0 ? static_cast<size_t>(components - 1) : 0;

    std::error_code ec;
    entry.size = fs::file_size(absolute, ec);
    if (ec) {
        entry.size = 0;
    }

    return entry;
}

void ProjectScanner::walkDirectory(const fs::path& directory, const std::string& relative_dir,
                                   size_t depth, const Visitor& visitor) {
    // Listing first: a TraversalError leaves the ignore stack untouched
    DirectoryListing listing = listDirectory(directory);

    std::optional<IgnorePatternSet> local_ignore = loadLocalIgnore(directory);
    bool pushed_local = false;
    if (local_ignore) {
        m_ignore_stack.push(std::move(*local_ignore));
        pushed_local = true;
    }

    for (const auto& file : listing.files) {
        std::string name = file.path().filename().string();
        fs::path absolute = file.path().lexically_normal();

        if (!m_ignore_stack.empty() && m_ignore_stack.isIgnored(absolute, false)) {
            Logger::getInstance().debug("ProjectScanner", "Ignored by pattern", absolute.string());
            continue;
        }

        PathEntry entry;
        entry.absolute_path = absolute;
        entry.filename = name;
        entry.relative_path = relative_dir.empty() ? name : relative_dir + "/" + name;
        entry.display_path = absolute.lexically_relative(m_display_base).generic_string();
        entry.depth = depth;

        std::error_code ec;
        entry.size = file.file_size(ec);
        if (ec) {
            entry.size = 0;
        }

        visitor(entry);
    }

    if (m_rules.max_depth && depth >= *m_rules.max_depth) {
        if (!listing.directories.empty()) {
            Logger::getInstance().debug("ProjectScanner", "Depth limit reached, not descending", directory.string());
        }
    } else {
        for (const auto& subdirectory : listing.directories) {
            std::string name = subdirectory.path().filename().string();
            std::string relative = relative_dir.empty() ? name : relative_dir + "/" + name;
            fs::path absolute = subdirectory.path().lexically_normal();

            if (!shouldEnterDirectory(name, relative, absolute)) {
                continue;
            }

            try {
                walkDirectory(absolute, relative, depth + 1, visitor);
            } catch (const TraversalError& e) {
                Logger::getInstance().warning("ProjectScanner", "Skipping unreadable directory", e.what());
                m_warnings.push_back({relative, e.reason()});
            }
        }
    }

    if (pushed_local) {
        m_ignore_stack.pop();
    }
}

bool ProjectScanner::shouldEnterDirectory(const std::string& name, const std::string& relative_path,
                                          const fs::path& absolute_path) const {
    if (matchesName(name, m_rules.omit_dirs)) {
        Logger::getInstance().debug("ProjectScanner", "Omitted directory", relative_path);
        return false;
    }

    if (!m_rules.whitelist_dirs.empty()) {
        if (!matchesName(name, m_rules.whitelist_dirs)) {
            return false;
        }
    } else if (!m_rules.whitelist.empty()) {
        if (!matchesName(name, m_rules.whitelist) && !matchesName(relative_path, m_rules.whitelist)) {
            return false;
        }
    }

    if (!m_ignore_stack.empty() && m_ignore_stack.isIgnored(absolute_path, true)) {
        Logger::getInstance().debug("ProjectScanner", "Ignored directory by pattern", relative_path);
        return false;
    }

    return true;
}

std::optional<IgnorePatternSet> ProjectScanner::loadLocalIgnore(const fs::path& directory) const {
    if (!m_rules.obey_ignore_files) {
        return std::nullopt;
    }

    fs::path ignore_file = directory / m_rules.ignore_file_name;
    std::error_code ec;
    if (!fs::is_regular_file(ignore_file, ec)) {
        return std::nullopt;
    }

    return IgnorePatternSet::fromFile(ignore_file);
}

} // namespace Folio
