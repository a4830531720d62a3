#pragma once

/**
 * @file engine_config.hpp
 * @brief Engine configuration loaded from a policy file
 *
 * Policy file (schemas/policy.v1.schema.json):
 *   {"schema_version": "semjson_policy.v1",
 *    "optional_fields": ["executeOnce", "disabled"],
 *    "max_depth": 4096}
 */

#include "semjson/common.hpp"
#include "semjson/equality.hpp"
#include "semjson/normalize.hpp"
#include "semjson/value.hpp"

#include <string>

namespace semjson::config {

/// Schema file name looked up in the schema directory
constexpr const char* kPolicySchemaFile = "policy.v1.schema.json";

struct EngineConfig
{
    normalize::NormalizationPolicy policy;
    value::ParseOptions parse;
};

/**
 * Workflow-node optional fields with the default nesting limit
 */
[[nodiscard]] EngineConfig default_engine_config();

/**
 * Build a configuration from a parsed policy document
 * @param doc Policy document
 * @param schema_path Path to policy.v1.schema.json
 * @return Configuration, or the schema validation error
 */
[[nodiscard]] semjson::Result<EngineConfig> engine_config_from_json(const Value& doc,
                                                                    const std::string& schema_path);

/**
 * Read, parse and validate a policy file
 * @param path Policy file
 * @param schema_dir Directory containing policy.v1.schema.json
 */
[[nodiscard]] semjson::Result<EngineConfig> load_engine_config(const std::string& path,
                                                               const std::string& schema_dir);

[[nodiscard]] equality::SemanticComparator make_comparator(const EngineConfig& config);

}  // namespace semjson::config
