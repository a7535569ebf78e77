// =================================================================
// src/Folio/PatternMatcher.cpp
// =================================================================
// Implementation for name and extension list matching.

#include "Folio/PatternMatcher.hpp"
#include <algorithm>
#include <sstream>

namespace Folio {

std::string getExtension(const std::string& filename) {
    size_t dot_pos = filename.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos == 0) {
        return "";
    }
    return filename.substr(dot_pos + 1);
}

std::string normalizeExtension(const std::string& extension) {
    if (!extension.empty() && extension[0] == '.') {
        return extension.substr(1);
    }
    return extension;
}

bool matchesName(const std::string& name, const std::vector<std::string>& names) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool matchesExtension(const std::string& filename, const std::vector<std::string>& extensions) {
    std::string extension = getExtension(filename);
    if (extension.empty()) {
        return false;
    }

    return std::any_of(extensions.begin(), extensions.end(), [&](const std::string& candidate) {
        return normalizeExtension(candidate) == extension;
    });
}

std::vector<std::string> splitList(const std::string& csv) {
    std::vector<std::string> items;
    std::istringstream stream(csv);
    std::string item;

    while (std::getline(stream, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }

    return items;
}

} // namespace Folio
