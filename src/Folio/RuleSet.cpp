// =================================================================
// src/Folio/RuleSet.cpp
// =================================================================
// Validation for resolved run rules.

#include "Folio/RuleSet.hpp"
#include "Folio/Errors.hpp"

namespace Folio {

void RuleSet::validate() const {
    if (transform.max_line_length && *transform.max_line_length == 0) {
        throw ConfigError("truncln must be greater than 0");
    }

    if (transform.max_string_length && *transform.max_string_length == 0) {
        throw ConfigError("truncstr must be greater than 0");
    }

    if (ignore_file_name.empty() || ignore_file_name.find('/') != std::string::npos) {
        throw ConfigError("ignore_file_name must be a plain file name: '" + ignore_file_name + "'");
    }
}

} // namespace Folio
