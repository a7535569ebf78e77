// =================================================================
// include/Folio/OutputAssembler.hpp
// =================================================================
// Writes rendered blocks as one document, one document per file, or
// a stream on standard output.

#pragma once

#include "Folio/DocumentBuilder.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace Folio {

enum class OutputMode {
    SingleDocument,
    MultiDocument,
    Stream
};

/**
 * @brief Replace characters that are unsafe in file names (<>:"/\|?*) with '_'
 */
std::string sanitizeFilename(const std::string& display_path);

/**
 * @brief Concatenate blocks separated by a blank line, then append a
 *        "> Warning:" line per skipped directory
 */
std::string assembleDocument(const std::vector<RenderedBlock>& blocks,
                             const std::vector<TraversalWarning>& warnings);

/**
 * @brief Persists a BuildResult in the selected output mode
 *
 * The single-document and stream modes produce byte-identical text.
 * Multi-document mode writes "<sanitized display path>.md" per block; two
 * paths that sanitize to the same name overwrite, the later one winning.
 */
class OutputAssembler {
public:
    /**
     * @brief Construct an assembler
     * @param mode Output mode
     * @param destination Output file (single) or directory (multi); unused for Stream
     * @param stream Sink for Stream mode
     */
    OutputAssembler(OutputMode mode, std::filesystem::path destination = {},
                    std::ostream& stream = std::cout);

    /**
     * @brief Write the result
     * @throws WriteError if any artifact cannot be written
     */
    void write(const BuildResult& result);

    /**
     * @brief Files written by the last write() call, in write order
     */
    const std::vector<std::filesystem::path>& getWrittenFiles() const { return m_written_files; }

private:
    OutputMode m_mode;
    std::filesystem::path m_destination;
    std::ostream& m_stream;
    std::vector<std::filesystem::path> m_written_files;

    void writeSingle(const BuildResult& result);
    void writeMulti(const BuildResult& result);
    void writeStream(const BuildResult& result);

    static void writeFile(const std::filesystem::path& file_path, const std::string& content);
};

} // namespace Folio
