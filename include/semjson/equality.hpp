#pragma once

/**
 * @file equality.hpp
 * @brief Semantic equality over normalized JSON trees
 */

#include "semjson/common.hpp"
#include "semjson/normalize.hpp"
#include "semjson/value.hpp"

#include <string_view>

namespace semjson::equality {

/// Field whose presence (with a scalar value) on every element marks a keyed array
constexpr std::string_view kKeyField = "key";

/**
 * Keyed-array discriminator.
 * @return true if `v` is an array and every element is an object whose
 *         "key" entry holds a boolean, number or string
 */
[[nodiscard]] bool is_keyed_array(const Value& v);

/**
 * Compare two normalized arrays.
 *
 * Both keyed: equal as multisets of deeply-equal elements (multiplicity
 * counts, elements sharing a "key" value are not merged).
 * Otherwise: same length and pairwise equal in order.
 */
[[nodiscard]] bool arrays_equal(const Value& a, const Value& b);

/**
 * Deep equality of two normalized values.
 * Object key order is irrelevant; numbers compare by value, so 42 == 42.0.
 */
[[nodiscard]] bool values_equal(const Value& a, const Value& b);

/**
 * Deep equality of two normalization results.
 * Absent equals only Absent.
 */
[[nodiscard]] bool equal(const semjson::Normalized& a, const semjson::Normalized& b);

/**
 * Parse, normalize and compare two JSON texts.
 * @return Equality, or the parse error of the first side that failed
 *         (the message names the side: "left" or "right")
 */
[[nodiscard]] semjson::Result<bool> compare_texts(std::string_view a,
                                                  std::string_view b,
                                                  const normalize::NormalizationPolicy& policy,
                                                  const value::ParseOptions& options = {});

/**
 * Fail-closed semantic equality: a text that does not parse is never equal
 * to anything, itself included.
 */
[[nodiscard]] bool semantic_equal(std::string_view a,
                                  std::string_view b,
                                  const normalize::NormalizationPolicy& policy,
                                  const value::ParseOptions& options = {});

/**
 * Policy and parse limits bundled for callers that compare many values
 * under the same configuration.
 */
class SemanticComparator {
public:
    explicit SemanticComparator(normalize::NormalizationPolicy policy,
                                value::ParseOptions options = {});

    [[nodiscard]] bool semantic_equal(std::string_view a, std::string_view b) const;

    [[nodiscard]] semjson::Result<bool> compare_texts(std::string_view a, std::string_view b) const;

    [[nodiscard]] const normalize::NormalizationPolicy& policy() const noexcept
    {
        return m_policy;
    }

    [[nodiscard]] const value::ParseOptions& options() const noexcept { return m_options; }

private:
    normalize::NormalizationPolicy m_policy;
    value::ParseOptions m_options;
};

}  // namespace semjson::equality
