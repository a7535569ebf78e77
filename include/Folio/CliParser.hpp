// =================================================================
// include/Folio/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace Folio {

constexpr const char* kFolioVersion = "0.4.0";

// Parsed command-line options. Optional members are set only when the
// option was given, so they can override the config file selectively.
struct Options {
    // Input: exactly one of the two
    std::string directory;
    std::string input_paths_file;

    // Output: neither means stream to stdout
    std::string output_file;
    std::string output_dir;

    // Comma-separated lists
    std::optional<std::string> extensions;
    std::optional<std::string> omit;
    std::optional<std::string> omit_files;
    std::optional<std::string> omit_dirs;
    std::optional<std::string> whitelist_files;
    std::optional<std::string> whitelist_dirs;
    std::optional<std::string> whitelist;

    // Limits
    std::optional<size_t> truncln;
    std::optional<size_t> truncstr;
    std::optional<size_t> maxlnspace;
    std::optional<size_t> depth;
    std::optional<std::uintmax_t> max_size;
    bool nocom = false;

    // Ignore files
    std::optional<std::string> gitignore;
    bool obey_gitignores = false;

    // General
    std::string config_file;
    std::string log_file;
    bool verbose = false;
    bool quiet = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed options.
     * @return A const reference to the Options struct.
     */
    const Options& getOptions() const;

private:
    void setupInputOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupSelectionOptions(CLI::App& app);
    void setupTransformOptions(CLI::App& app);
    void setupGeneralOptions(CLI::App& app);

    // Copies raw values of options that were actually given into m_options
    void collectGivenValues();

    std::shared_ptr<CLI::App> m_app;
    Options m_options;

    // Raw targets for options whose presence matters
    struct RawValues {
        std::string extensions;
        std::string omit;
        std::string omit_files;
        std::string omit_dirs;
        std::string whitelist_files;
        std::string whitelist_dirs;
        std::string whitelist;
        size_t truncln = 0;
        size_t truncstr = 0;
        size_t maxlnspace = 0;
        size_t depth = 0;
        std::uintmax_t max_size = 0;
        std::string gitignore;
    } m_raw;
};

} // namespace Folio
