// =================================================================
// src/Folio/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Folio/CliParser.hpp"
#include "Folio/RuleSet.hpp"

namespace Folio {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Folio: renders a source tree as one Markdown document of fenced code blocks.", "folio");
    m_app->set_version_flag("--version", std::string("folio ") + kFolioVersion);

    setupInputOptions(*m_app);
    setupOutputOptions(*m_app);
    setupSelectionOptions(*m_app);
    setupTransformOptions(*m_app);
    setupGeneralOptions(*m_app);

    // Runs after a successful parse
    m_app->callback([this]() {
        if (m_options.directory.empty() && m_options.input_paths_file.empty()) {
            throw CLI::RequiredError("DIRECTORY or --input-paths-file");
        }
        collectGivenValues();
    });

    return m_app;
}

const Options& CliParser::getOptions() const {
    return m_options;
}

void CliParser::setupInputOptions(CLI::App& app) {
    auto* directory = app.add_option("directory", m_options.directory, "Directory to render.")
        ->check(CLI::ExistingDirectory);
    auto* paths_file = app.add_option("--input-paths-file", m_options.input_paths_file,
        "File listing directories and files to render, one per line.")
        ->check(CLI::ExistingFile);
    directory->excludes(paths_file);
}

void CliParser::setupOutputOptions(CLI::App& app) {
    auto* output_file = app.add_option("-o,--output-file", m_options.output_file,
        "Write a single Markdown document to this file (default: standard output).");
    auto* output_dir = app.add_option("--output-dir", m_options.output_dir,
        "Write one Markdown document per file into this directory.");
    output_file->excludes(output_dir);
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    app.add_option("--extensions", m_raw.extensions,
        "Comma-separated extensions to render (default: all).");
    app.add_option("--omit", m_raw.omit,
        "Comma-separated extensions to reference without content.");
    app.add_option("--omit-files", m_raw.omit_files,
        "Comma-separated file names to reference without content.");
    app.add_option("--omit-dirs", m_raw.omit_dirs,
        "Comma-separated directory names to skip entirely.");
    app.add_option("--whitelist-files", m_raw.whitelist_files,
        "Comma-separated file names; only these files are rendered.");
    app.add_option("--whitelist-dirs", m_raw.whitelist_dirs,
        "Comma-separated directory names; only these are entered.");
    app.add_option("--whitelist", m_raw.whitelist,
        "Comma-separated names or relative paths of files and directories to keep.");
    app.add_option("--depth", m_raw.depth,
        "Maximum directory depth to descend (0 = root files only).");
    app.add_option("--max-size", m_raw.max_size,
        "Files larger than this many bytes are referenced without content (default: "
        + std::to_string(kDefaultMaxFileSize) + ").");
    app.add_option("--gitignore", m_raw.gitignore,
        "Ignore file applied to the whole scan.")
        ->check(CLI::ExistingFile);
    app.add_flag("--obey-gitignores", m_options.obey_gitignores,
        "Honor ignore files found in each scanned directory.");
}

void CliParser::setupTransformOptions(CLI::App& app) {
    app.add_flag("--nocom", m_options.nocom,
        "Strip comments from recognized languages.");
    app.add_option("--truncln", m_raw.truncln,
        "Truncate lines longer than this many characters.")
        ->check(CLI::PositiveNumber);
    app.add_option("--truncstr", m_raw.truncstr,
        "Truncate string literals longer than this many characters.")
        ->check(CLI::PositiveNumber);
    app.add_option("--maxlnspace", m_raw.maxlnspace,
        "Collapse runs of blank lines to at most this many.");
}

void CliParser::setupGeneralOptions(CLI::App& app) {
    app.add_option("--config", m_options.config_file,
        "YAML configuration file (default: .folio.yml in the scanned directory, if present).")
        ->check(CLI::ExistingFile);
    app.add_option("--log-file", m_options.log_file, "Also write log entries to this file.");
    auto* verbose = app.add_flag("-v,--verbose", m_options.verbose, "Log debug details.");
    auto* quiet = app.add_flag("-q,--quiet", m_options.quiet, "Log errors only.");
    verbose->excludes(quiet);
}

void CliParser::collectGivenValues() {
    auto given = [this](const std::string& name) { return m_app->count(name) > 0; };

    if (given("--extensions")) m_options.extensions = m_raw.extensions;
    if (given("--omit")) m_options.omit = m_raw.omit;
    if (given("--omit-files")) m_options.omit_files = m_raw.omit_files;
    if (given("--omit-dirs")) m_options.omit_dirs = m_raw.omit_dirs;
    if (given("--whitelist-files")) m_options.whitelist_files = m_raw.whitelist_files;
    if (given("--whitelist-dirs")) m_options.whitelist_dirs = m_raw.whitelist_dirs;
    if (given("--whitelist")) m_options.whitelist = m_raw.whitelist;
    if (given("--truncln")) m_options.truncln = m_raw.truncln;
    if (given("--truncstr")) m_options.truncstr = m_raw.truncstr;
    if (given("--maxlnspace")) m_options.maxlnspace = m_raw.maxlnspace;
    if (given("--depth")) m_options.depth = m_raw.depth;
    if (given("--max-size")) m_options.max_size = m_raw.max_size;
    if (given("--gitignore")) m_options.gitignore = m_raw.gitignore;
}

} // namespace Folio
