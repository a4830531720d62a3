#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for stable persisted values
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in byte-wise order
 * - No whitespace (minimal representation)
 * - Arrays keep their order
 * - Integral floating values that fit in int64 print as integers;
 *   other floating values use the shortest round-trip form with a
 *   minimal exponent ("1e300", "1.5e-7")
 *
 * Canonicalization is a pure format transform: nulls and optional fields
 * are kept, unlike comparison normalization.
 */

#include "semjson/common.hpp"
#include "semjson/value.hpp"

#include <string>
#include <string_view>

namespace semjson::canonical {

/**
 * Parse JSON text and serialize it in canonical form
 * @param text JSON text
 * @param options Parse limits
 * @return Canonical byte string, or ParseError / DepthExceeded
 */
[[nodiscard]] semjson::Result<std::string> canonicalize(std::string_view text,
                                                        const value::ParseOptions& options = {});

/**
 * Serialize an already-built tree in canonical form
 * @param v JSON value
 * @return Canonical byte string, or NonFiniteNumber / EncodeError
 */
[[nodiscard]] semjson::Result<std::string> canonicalize_value(const Value& v);

}  // namespace semjson::canonical
