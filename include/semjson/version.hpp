#pragma once

/**
 * @file version.hpp
 * @brief semjson version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace semjson {

/// semjson version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Policy file format accepted by the configuration loader
constexpr const char* kPolicySchemaVersion = "semjson_policy.v1";

}  // namespace semjson
