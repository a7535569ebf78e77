// =================================================================
// src/Folio/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Folio/ConfigParser.hpp"
#include "Folio/Errors.hpp"
#include "Folio/Logger.hpp"
#include "Folio/PatternMatcher.hpp"
#include <filesystem>
#include <set>

namespace Folio {

namespace {

const std::set<std::string> kKnownKeys = {
    "extensions", "omit", "omit_files", "omit_dirs",
    "whitelist_files", "whitelist_dirs", "whitelist",
    "depth", "max_size", "gitignore", "obey_gitignores", "ignore_file_name",
    "nocom", "truncln", "truncstr", "maxlnspace"
};

// Accepts either a YAML sequence or a comma-separated string.
std::vector<std::string> readList(const YAML::Node& node, const std::string& key) {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            items.push_back(item.as<std::string>());
        }
        return items;
    }
    if (node.IsScalar()) {
        return splitList(node.as<std::string>());
    }
    if (node.IsNull()) {
        return {};
    }
    throw ConfigError("'" + key + "' must be a list or a comma-separated string");
}

std::optional<size_t> readLimit(const YAML::Node& node, const std::string& key) {
    if (node.IsNull()) {
        return std::nullopt;
    }
    long long value = node.as<long long>();
    if (value < 0) {
        throw ConfigError("'" + key + "' must not be negative");
    }
    return static_cast<size_t>(value);
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path, bool required)
    : m_path(config_path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        if (required) {
            throw ConfigError("Config file not found: " + config_path);
        }
        // It's okay for the default config file to be absent.
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse config file " + config_path + ": " + e.what());
    }

    if (!m_root.IsNull() && !m_root.IsMap()) {
        throw ConfigError("Config file " + config_path + " must contain a mapping");
    }

    m_loaded = true;
    Logger::getInstance().info("ConfigParser", "Loaded configuration", config_path);
}

void ConfigParser::applyTo(RuleSet& rules) const {
    if (!m_loaded || m_root.IsNull()) {
        return;
    }

    for (auto it = m_root.begin(); it != m_root.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (kKnownKeys.count(key) == 0) {
            Logger::getInstance().warning("ConfigParser", "Ignoring unknown key '" + key + "'", m_path);
        }
    }

    try {
        if (m_root["extensions"]) {
            if (m_root["extensions"].IsNull()) {
                rules.extensions.reset();
            } else {
                rules.extensions = readList(m_root["extensions"], "extensions");
            }
        }
        if (m_root["omit"]) {
            rules.omit_extensions = readList(m_root["omit"], "omit");
        }
        if (m_root["omit_files"]) {
            rules.omit_files = readList(m_root["omit_files"], "omit_files");
        }
        if (m_root["omit_dirs"]) {
            rules.omit_dirs = readList(m_root["omit_dirs"], "omit_dirs");
        }
        if (m_root["whitelist_files"]) {
            rules.whitelist_files = readList(m_root["whitelist_files"], "whitelist_files");
        }
        if (m_root["whitelist_dirs"]) {
            rules.whitelist_dirs = readList(m_root["whitelist_dirs"], "whitelist_dirs");
        }
        if (m_root["whitelist"]) {
            rules.whitelist = readList(m_root["whitelist"], "whitelist");
        }

        if (m_root["depth"]) {
            rules.max_depth = readLimit(m_root["depth"], "depth");
        }
        if (m_root["max_size"]) {
            std::optional<size_t> max_size = readLimit(m_root["max_size"], "max_size");
            rules.max_file_size = max_size ? *max_size : kDefaultMaxFileSize;
        }

        if (m_root["gitignore"]) {
            std::string value = m_root["gitignore"].as<std::string>();
            if (value.empty()) {
                throw ConfigError("Empty gitignore path in config file " + m_path);
            }
            std::filesystem::path ignore_path = value;
            // Relative paths in the file are relative to the file itself
            if (ignore_path.is_relative()) {
                ignore_path = std::filesystem::path(m_path).parent_path() / ignore_path;
            }
            rules.global_ignore_file = ignore_path.string();
        }
        if (m_root["obey_gitignores"]) {
            rules.obey_ignore_files = m_root["obey_gitignores"].as<bool>();
        }
        if (m_root["ignore_file_name"]) {
            rules.ignore_file_name = m_root["ignore_file_name"].as<std::string>();
        }

        if (m_root["nocom"]) {
            rules.transform.strip_comments = m_root["nocom"].as<bool>();
        }
        if (m_root["truncln"]) {
            rules.transform.max_line_length = readLimit(m_root["truncln"], "truncln");
        }
        if (m_root["truncstr"]) {
            rules.transform.max_string_length = readLimit(m_root["truncstr"], "truncstr");
        }
        if (m_root["maxlnspace"]) {
            rules.transform.max_blank_lines = readLimit(m_root["maxlnspace"], "maxlnspace");
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in config file " + m_path + ": " + e.what());
    }
}

} // namespace Folio
