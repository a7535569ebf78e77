// =================================================================
// include/Folio/Errors.hpp
// =================================================================
// Exception types raised by the scanning and rendering pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Folio {

/**
 * @brief Base class for every error Folio raises on purpose
 */
class FolioError : public std::runtime_error {
public:
    explicit FolioError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A directory could not be listed (permissions, deleted mid-walk)
 *
 * Recovered by the scanner for subdirectories; fatal only for the scan root.
 */
class TraversalError : public FolioError {
public:
    TraversalError(const std::string& path, const std::string& reason)
        : FolioError("Cannot list directory '" + path + "': " + reason),
          m_path(path), m_reason(reason) {}

    const std::string& path() const { return m_path; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_path;
    std::string m_reason;
};

/**
 * @brief A selected file could not be opened or read
 */
class ReadError : public FolioError {
public:
    explicit ReadError(const std::string& message) : FolioError(message) {}
};

/**
 * @brief File content is not valid UTF-8 text
 */
class DecodeError : public FolioError {
public:
    explicit DecodeError(const std::string& message) : FolioError(message) {}
};

/**
 * @brief Configuration or ignore-file input could not be loaded (fatal)
 */
class ConfigError : public FolioError {
public:
    explicit ConfigError(const std::string& message) : FolioError(message) {}
};

/**
 * @brief An output artifact could not be persisted (fatal)
 */
class WriteError : public FolioError {
public:
    explicit WriteError(const std::string& message) : FolioError(message) {}
};

} // namespace Folio
