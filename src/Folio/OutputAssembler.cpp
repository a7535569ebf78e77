// =================================================================
// src/Folio/OutputAssembler.cpp
// =================================================================
// Implementation for output assembly.

#include "Folio/OutputAssembler.hpp"
#include "Folio/Errors.hpp"
#include "Folio/Logger.hpp"
#include <fstream>
#include <set>

namespace fs = std::filesystem;

namespace Folio {

std::string sanitizeFilename(const std::string& display_path) {
    static const std::string unsafe = "<>:\"/\\|?*";

    std::string sanitized = display_path;
    for (auto& c : sanitized) {
        if (unsafe.find(c) != std::string::npos) {
            c = '_';
        }
    }
    return sanitized;
}

std::string assembleDocument(const std::vector<RenderedBlock>& blocks,
                             const std::vector<TraversalWarning>& warnings) {
    std::string document;

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            document += "\n";
        }
        document += blocks[i].text();
    }

    if (!warnings.empty() && !document.empty()) {
        document += "\n";
    }
    for (const auto& warning : warnings) {
        document += "> Warning: skipped directory `" + warning.path + "` (" + warning.reason + ")\n";
    }

    return document;
}

OutputAssembler::OutputAssembler(OutputMode mode, fs::path destination, std::ostream& stream)
    : m_mode(mode),
      m_destination(std::move(destination)),
      m_stream(stream)
{
}

void OutputAssembler::write(const BuildResult& result) {
    m_written_files.clear();

    switch (m_mode) {
        case OutputMode::SingleDocument:
            writeSingle(result);
            break;
        case OutputMode::MultiDocument:
            writeMulti(result);
            break;
        case OutputMode::Stream:
            writeStream(result);
            break;
    }
}

void OutputAssembler::writeSingle(const BuildResult& result) {
    if (m_destination.empty()) {
        throw WriteError("No output file given");
    }

    fs::path parent = m_destination.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw WriteError("Cannot create directory '" + parent.string() + "': " + ec.message());
        }
    }

    writeFile(m_destination, assembleDocument(result.blocks, result.warnings));
    m_written_files.push_back(m_destination);
    FOLIO_LOG_INFO("OutputAssembler", "Wrote document " + m_destination.string());
}

void OutputAssembler::writeMulti(const BuildResult& result) {
    if (m_destination.empty()) {
        throw WriteError("No output directory given");
    }

    std::error_code ec;
    fs::create_directories(m_destination, ec);
    if (ec) {
        throw WriteError("Cannot create directory '" + m_destination.string() + "': " + ec.message());
    }

    std::set<std::string> used_names;
    for (const auto& block : result.blocks) {
        std::string name = sanitizeFilename(block.display_path) + ".md";
        if (!used_names.insert(name).second) {
            Logger::getInstance().debug("OutputAssembler",
                "Output name collision, overwriting earlier file", name + " <- " + block.display_path);
        }

        fs::path file_path = m_destination / name;
        writeFile(file_path, block.text());
        m_written_files.push_back(file_path);
    }

    // Warnings have no per-file home in this mode
    for (const auto& warning : result.warnings) {
        Logger::getInstance().warning("OutputAssembler", "Skipped directory not noted in output",
                                      warning.path + ": " + warning.reason);
    }

    FOLIO_LOG_INFO("OutputAssembler",
        "Wrote " + std::to_string(result.blocks.size()) + " documents to " + m_destination.string());
}

void OutputAssembler::writeStream(const BuildResult& result) {
    m_stream << assembleDocument(result.blocks, result.warnings);
    m_stream.flush();
    if (!m_stream) {
        throw WriteError("Cannot write to output stream");
    }
}

void OutputAssembler::writeFile(const fs::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw WriteError("Cannot open output file: " + file_path.string());
    }

    file << content;
    file.close();
    if (!file) {
        throw WriteError("Cannot write output file: " + file_path.string());
    }
}

} // namespace Folio
