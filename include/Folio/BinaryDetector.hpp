// =================================================================
// include/Folio/BinaryDetector.hpp
// =================================================================
// Header for binary/text classification of file content.

#pragma once

#include <cstddef>
#include <string>
#include <filesystem>

namespace Folio {

/// Number of leading bytes inspected when deciding whether a file is binary.
constexpr size_t kBinarySampleSize = 1024;

/**
 * @brief Check a content sample for binary data
 * @param sample Leading bytes of a file (only the first kBinarySampleSize are inspected)
 * @return true if a NUL byte occurs in the inspected prefix
 */
bool isBinaryContent(const std::string& sample);

/**
 * @brief Read the leading sample of a file and classify it
 * @param file_path File to inspect
 * @return true if the file looks binary
 * @throws ReadError if the file cannot be opened or read
 */
bool isBinaryFile(const std::filesystem::path& file_path);

} // namespace Folio
