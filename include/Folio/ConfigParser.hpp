// =================================================================
// include/Folio/ConfigParser.hpp
// =================================================================
// Defines the parser for the optional .folio.yml configuration file.

#pragma once

#include "Folio/RuleSet.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace Folio {

/// Config file looked up in the scan root when --config is not given.
constexpr const char* kDefaultConfigFileName = ".folio.yml";

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file.
     * @param required When false, a missing file is treated as an empty configuration.
     * @throws ConfigError if the file is required but missing, or is not valid YAML.
     */
    explicit ConfigParser(const std::string& config_path, bool required = true);

    /**
     * @brief Whether a file was actually loaded.
     */
    bool isLoaded() const { return m_loaded; }

    const std::string& getPath() const { return m_path; }

    /**
     * @brief Overrides every setting present in the file.
     * @param rules Rules holding defaults; settings absent from the file are left untouched.
     * @throws ConfigError if a value has the wrong type or is out of range.
     */
    void applyTo(RuleSet& rules) const;

private:
    std::string m_path;
    bool m_loaded = false;
    YAML::Node m_root;
};

} // namespace Folio
