#pragma once

/**
 * @file value.hpp
 * @brief JSON value model: parse text into a tagged tree and render it back
 *
 * The tree is nlohmann::json. Every component dispatches on its value_t tag
 * (null, boolean, number_integer, number_unsigned, number_float, string,
 * array, object); binary and discarded values never come out of parse().
 */

#include "semjson/common.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semjson {

/// Parsed JSON tree
using Value = nlohmann::json;

/**
 * Result of comparison normalization.
 * std::nullopt is "Absent": the value carries no comparable information.
 */
using Normalized = std::optional<Value>;

}  // namespace semjson

namespace semjson::value {

/// Error code for malformed JSON text
constexpr const char* kParseErrorCode = "ParseError";

/// Error code for input nested deeper than ParseOptions::max_depth
constexpr const char* kDepthExceededCode = "DepthExceeded";

/// Default nesting limit; the root container is depth 1
constexpr std::size_t kDefaultMaxDepth = 4'096;

/// Hard ceiling on max_depth. Normalization, comparison and canonical
/// serialization recurse once per level and must fit the default thread stack.
constexpr std::size_t kMaxSupportedDepth = 10'000;

struct ParseOptions
{
    std::size_t max_depth = kDefaultMaxDepth;  ///< Clamped to kMaxSupportedDepth
};

/**
 * Parse JSON text.
 *
 * Accepts a single RFC 8259 value with optional surrounding whitespace.
 * Comments and trailing content are rejected. A ParseError carries the byte
 * offset of the syntax error; number literals that overflow a double are
 * reported without one.
 *
 * @param text JSON text
 * @param options Parse limits
 * @return Parsed tree, or ParseError / DepthExceeded
 */
[[nodiscard]] semjson::Result<Value> parse(std::string_view text, const ParseOptions& options = {});

/**
 * Render a tree as compact JSON text.
 * Invalid UTF-8 in strings is replaced with U+FFFD.
 */
[[nodiscard]] std::string render(const Value& v);

/**
 * Scalar test used by the keyed-array discriminator
 * @return true for boolean, number and string values
 */
[[nodiscard]] bool is_scalar(const Value& v) noexcept;

}  // namespace semjson::value
