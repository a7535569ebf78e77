// =================================================================
// include/Folio/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Folio/CliParser.hpp"
#include "Folio/RuleSet.hpp"
#include <filesystem>
#include <memory>

namespace Folio {

class OutputAssembler;

// Process exit codes
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitWriteError = 3;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param options The parsed command-line options.
     */
    explicit Core(const Options& options);

    /**
     * @brief Runs one render: resolve rules, build, write.
     * @return Process exit code; errors are logged and mapped, never thrown.
     */
    int run();

    /**
     * @brief Layers defaults, the config file and command-line options.
     * @return The validated rule set.
     * @throws ConfigError if the config file or any value is invalid.
     */
    RuleSet resolveRules() const;

private:
    /**
     * @brief Directory whose .folio.yml is used when --config is absent.
     */
    std::filesystem::path configSearchRoot() const;

    std::unique_ptr<OutputAssembler> makeAssembler() const;

    void configureLogging() const;

    const Options& m_options;
};

} // namespace Folio
