// =================================================================
// src/Folio/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Folio/Core.hpp"
#include "Folio/ConfigParser.hpp"
#include "Folio/DocumentBuilder.hpp"
#include "Folio/Errors.hpp"
#include "Folio/Logger.hpp"
#include "Folio/OutputAssembler.hpp"
#include "Folio/PatternMatcher.hpp"
#include <chrono>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Folio {

Core::Core(const Options& options)
    : m_options(options)
{
}

int Core::run() {
    configureLogging();

    auto& logger = Logger::getInstance();
    auto start_time = std::chrono::steady_clock::now();
    std::string input = m_options.directory.empty() ? m_options.input_paths_file : m_options.directory;
    logger.logRunStart(input);

    int exit_code = kExitSuccess;
    try {
        RuleSet rules = resolveRules();
        DocumentBuilder builder(rules);

        BuildResult result;
        if (!m_options.directory.empty()) {
            result = builder.buildFromDirectory(m_options.directory);
        } else {
            result = builder.buildFromPaths(DocumentBuilder::readInputPaths(m_options.input_paths_file));
        }

        makeAssembler()->write(result);
    } catch (const ConfigError& e) {
        logger.error("Core", "Configuration error", e.what());
        exit_code = kExitConfigError;
    } catch (const WriteError& e) {
        logger.error("Core", "Output error", e.what());
        exit_code = kExitWriteError;
    } catch (const FolioError& e) {
        logger.error("Core", "Run failed", e.what());
        exit_code = kExitFailure;
    } catch (const std::exception& e) {
        logger.critical("Core", "Unexpected error", e.what());
        exit_code = kExitFailure;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logRunEnd(exit_code, static_cast<long>(duration.count()));
    logger.flush();
    return exit_code;
}

RuleSet Core::resolveRules() const {
    RuleSet rules;

    if (!m_options.config_file.empty()) {
        ConfigParser(m_options.config_file).applyTo(rules);
    } else {
        // The default file is optional, and never part of its own artifact
        fs::path default_file = fs::absolute(configSearchRoot() / kDefaultConfigFileName).lexically_normal();
        ConfigParser config(default_file.string(), false);
        config.applyTo(rules);
        if (config.isLoaded()) {
            rules.excluded_files.push_back(default_file.string());
        }
    }

    if (m_options.extensions) rules.extensions = splitList(*m_options.extensions);
    if (m_options.omit) rules.omit_extensions = splitList(*m_options.omit);
    if (m_options.omit_files) rules.omit_files = splitList(*m_options.omit_files);
    if (m_options.omit_dirs) rules.omit_dirs = splitList(*m_options.omit_dirs);
    if (m_options.whitelist_files) rules.whitelist_files = splitList(*m_options.whitelist_files);
    if (m_options.whitelist_dirs) rules.whitelist_dirs = splitList(*m_options.whitelist_dirs);
    if (m_options.whitelist) rules.whitelist = splitList(*m_options.whitelist);

    if (m_options.depth) rules.max_depth = *m_options.depth;
    if (m_options.max_size) rules.max_file_size = *m_options.max_size;
    if (m_options.gitignore) rules.global_ignore_file = *m_options.gitignore;
    if (m_options.obey_gitignores) rules.obey_ignore_files = true;

    if (m_options.nocom) rules.transform.strip_comments = true;
    if (m_options.truncln) rules.transform.max_line_length = *m_options.truncln;
    if (m_options.truncstr) rules.transform.max_string_length = *m_options.truncstr;
    if (m_options.maxlnspace) rules.transform.max_blank_lines = *m_options.maxlnspace;

    rules.validate();
    return rules;
}

fs::path Core::configSearchRoot() const {
    if (!m_options.directory.empty()) {
        return m_options.directory;
    }
    return fs::current_path();
}

std::unique_ptr<OutputAssembler> Core::makeAssembler() const {
    if (!m_options.output_file.empty()) {
        return std::make_unique<OutputAssembler>(OutputMode::SingleDocument, m_options.output_file);
    }
    if (!m_options.output_dir.empty()) {
        return std::make_unique<OutputAssembler>(OutputMode::MultiDocument, m_options.output_dir);
    }
    return std::make_unique<OutputAssembler>(OutputMode::Stream);
}

void Core::configureLogging() const {
    auto& logger = Logger::getInstance();
    logger.setColorOutput(isatty(STDERR_FILENO) != 0);

    if (m_options.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_options.quiet) {
        logger.setConsoleLogLevel(LogLevel::ERROR);
    }

    if (!logger.initialize(m_options.log_file)) {
        logger.debug("Core", "Continuing with console logging only");
    }
}

} // namespace Folio
