#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of configuration documents
 */

#include "semjson/common.hpp"
#include "semjson/value.hpp"

#include <string>

namespace semjson::common {

/**
 * Validate a JSON document against a JSON Schema file.
 *
 * @param doc JSON document to validate
 * @param schema_path Path to JSON Schema file (draft 7)
 * @return Empty on success; SchemaFileOpenFailed, SchemaParseFailed,
 *         SchemaBuildFailed or SchemaValidationFailed (one "/path: reason"
 *         line per violation) on failure
 */
[[nodiscard]] semjson::VoidResult validate_json(const Value& doc, const std::string& schema_path);

}  // namespace semjson::common
