// =================================================================
// src/Folio/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Folio/IgnorePattern.hpp"
#include "Folio/Errors.hpp"
#include "Folio/Logger.hpp"
#include <fstream>

namespace Folio {

namespace {

void appendLiteral(std::string& out, char c) {
    if (std::string(".^$+{}|()[]\\*?").find(c) != std::string::npos) {
        out += '\\';
    }
    out += c;
}

// Copies a bracket class starting at glob[open]; returns the index of its
// closing ']' or npos when the class never closes.
size_t appendClass(std::string& out, const std::string& glob, size_t open) {
    size_t scan = open + 1;
    if (scan < glob.size() && (glob[scan] == '!' || glob[scan] == '^')) {
        ++scan;
    }
    if (scan < glob.size() && glob[scan] == ']') {
        ++scan;
    }
    size_t close = glob.find(']', scan);
    if (close == std::string::npos) {
        return close;
    }

    out += '[';
    for (size_t k = open + 1; k < close; ++k) {
        char c = glob[k];
        if (k == open + 1 && c == '!') {
            out += '^';
            continue;
        }
        if (c == '\\' || c == '[' || c == ']') {
            out += '\\';
        }
        out += c;
    }
    out += ']';
    return close;
}

std::string translateGlob(const std::string& glob, bool anchored) {
    std::string out = anchored ? "^" : "^(?:.*/)?";
    const size_t n = glob.size();

    for (size_t i = 0; i < n; ++i) {
        const char c = glob[i];

        if (c == '*') {
            bool doubled = i + 1 < n && glob[i + 1] == '*';
            bool whole_component = (i == 0 || glob[i - 1] == '/') &&
                                   (i + 2 >= n || glob[i + 2] == '/');
            if (doubled && whole_component && i + 2 >= n) {
                out += ".*";
                ++i;
            } else if (doubled && whole_component) {
                out += "(?:.*/)?";
                i += 2;
            } else {
                out += "[^/]*";
                i += doubled ? 1 : 0;
            }
        } else if (c == '?') {
            out += "[^/]";
        } else if (c == '[') {
            size_t close = appendClass(out, glob, i);
            if (close == std::string::npos) {
                out += "\\[";
            } else {
                i = close;
            }
        } else if (c == '\\') {
            if (i + 1 < n) {
                appendLiteral(out, glob[++i]);
            } else {
                out += "\\\\";
            }
        } else {
            appendLiteral(out, c);
        }
    }

    return out + "$";
}

} // anonymous namespace

IgnorePattern::IgnorePattern(const std::string& line)
    : m_line(line)
{
    std::string body = line;
    if (!body.empty() && body.back() == '\r') {
        body.pop_back();
    }
    compile(std::move(body));
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_blank || (m_dir_only && !is_directory)) {
        return false;
    }
    return std::regex_match(path, m_compiled);
}

void IgnorePattern::compile(std::string body) {
    if (body.empty() || body.front() == '#') {
        m_blank = true;
        return;
    }

    // Unescaped trailing blanks are not part of the pattern
    while (body.size() > 1 && body.back() == ' ' && body[body.size() - 2] != '\\') {
        body.pop_back();
    }
    if (body == " ") {
        body.clear();
    }

    if (!body.empty() && body.front() == '!') {
        m_negated = true;
        body.erase(0, 1);
    }
    if (!body.empty() && body.back() == '/') {
        m_dir_only = true;
        body.pop_back();
    }
    if (body.find('/') != std::string::npos) {
        m_anchored = true;
        if (body.front() == '/') {
            body.erase(0, 1);
        }
    }

    if (body.empty()) {
        m_blank = true;
        return;
    }

    try {
        m_compiled = std::regex(translateGlob(body, m_anchored), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern", "Dropping uncompilable pattern: " + m_line, e.what());
        m_blank = true;
    }
}

// IgnorePatternSet implementation

IgnorePatternSet::IgnorePatternSet(const std::filesystem::path& base_directory)
    : m_base_directory(base_directory.lexically_normal())
{
}

IgnorePatternSet IgnorePatternSet::fromFile(const std::filesystem::path& file_path) {
    std::filesystem::path absolute = std::filesystem::absolute(file_path).lexically_normal();
    IgnorePatternSet patterns(absolute.parent_path());
    patterns.loadFromFile(absolute);
    return patterns;
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::filesystem::path& file_path) {
    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        throw ConfigError("Ignore file is a directory: " + file_path.string());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot read ignore file: " + file_path.string());
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        IgnorePattern pattern(line);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }

    if (file.bad()) {
        throw ConfigError("Error while reading ignore file: " + file_path.string());
    }

    Logger::getInstance().debug("IgnorePattern",
        "Loaded " + std::to_string(patterns_loaded) + " patterns", file_path.string());
    return patterns_loaded;
}

std::optional<bool> IgnorePatternSet::evaluate(const std::string& path, bool is_directory) const {
    std::optional<bool> verdict;

    // Process patterns in order - later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            verdict = !pattern.isNegation();
        }
    }

    return verdict;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    return evaluate(path, is_directory).value_or(false);
}

std::optional<std::string> IgnorePatternSet::relativeTo(const std::filesystem::path& absolute_path) const {
    std::filesystem::path relative = absolute_path.lexically_normal().lexically_relative(m_base_directory);
    if (relative.empty() || relative == ".") {
        return std::nullopt;
    }
    if (*relative.begin() == "..") {
        return std::nullopt;
    }
    return relative.generic_string();
}

// IgnoreStack implementation

void IgnoreStack::push(IgnorePatternSet patterns) {
    m_sets.push_back(std::move(patterns));
}

void IgnoreStack::pop() {
    if (!m_sets.empty()) {
        m_sets.pop_back();
    }
}

bool IgnoreStack::isIgnored(const std::filesystem::path& absolute_path, bool is_directory) const {
    bool ignored = false;

    for (const auto& patterns : m_sets) {
        std::optional<std::string> relative = patterns.relativeTo(absolute_path);
        if (!relative) {
            continue;
        }
        std::optional<bool> verdict = patterns.evaluate(*relative, is_directory);
        if (verdict) {
            ignored = *verdict;
        }
    }

    return ignored;
}

bool IgnoreStack::isIgnoredWithParents(const std::filesystem::path& absolute_path, bool is_directory) const {
    if (m_sets.empty()) {
        return false;
    }

    std::filesystem::path normalized = absolute_path.lexically_normal();
    for (std::filesystem::path parent = normalized.parent_path();
         !parent.empty() && parent != parent.root_path();
         parent = parent.parent_path()) {
        if (isIgnored(parent, true)) {
            return true;
        }
    }

    return isIgnored(normalized, is_directory);
}

} // namespace Folio
