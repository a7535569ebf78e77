// =================================================================
// src/Folio/BinaryDetector.cpp
// =================================================================
// Implementation for binary/text classification.

#include "Folio/BinaryDetector.hpp"
#include "Folio/Errors.hpp"
#include <algorithm>
#include <fstream>

namespace Folio {

bool isBinaryContent(const std::string& sample) {
    size_t limit = std::min(sample.size(), kBinarySampleSize);
    return sample.find('\0') < limit;
}

bool isBinaryFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError("Cannot open file: " + file_path.string());
    }

    char buffer[kBinarySampleSize];
    file.read(buffer, kBinarySampleSize);
    if (file.bad()) {
        throw ReadError("Cannot read file: " + file_path.string());
    }

    return isBinaryContent(std::string(buffer, static_cast<size_t>(file.gcount())));
}

} // namespace Folio
