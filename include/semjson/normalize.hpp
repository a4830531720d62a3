#pragma once

/**
 * @file normalize.hpp
 * @brief Comparison normalization: strip nulls, optional fields and empties
 */

#include "semjson/value.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace semjson::normalize {

/// Ordered set with heterogeneous lookup by std::string_view
using FieldSet = std::set<std::string, std::less<>>;

/**
 * Field names an upstream API may omit or include inconsistently
 * because they only carry a default value.
 *
 * Immutable once constructed; pass it to every call that normalizes.
 */
class NormalizationPolicy {
public:
    /// Policy with no optional fields (only nulls and empties are stripped)
    NormalizationPolicy() = default;

    explicit NormalizationPolicy(FieldSet optional_fields);

    /**
     * Node flags that workflow APIs leave out when they hold their default:
     * executeOnce, alwaysOutputData, retryOnFail, onError, continueOnFail,
     * disabled.
     */
    [[nodiscard]] static NormalizationPolicy workflow_node_defaults();

    [[nodiscard]] bool is_optional_field(std::string_view key) const;

    [[nodiscard]] const FieldSet& optional_fields() const noexcept { return m_optional_fields; }

private:
    FieldSet m_optional_fields;
};

/**
 * Normalize a value for comparison.
 *
 * - null -> Absent
 * - object: entries whose key is an optional field, or whose value
 *   normalizes to Absent, are dropped; an empty result is Absent
 * - array: Absent elements are dropped; an empty result is Absent
 * - booleans, numbers and strings are returned unchanged
 *
 * @param v Parsed value (not modified)
 * @param policy Optional-field configuration
 * @return Normalized value, or std::nullopt for Absent
 */
[[nodiscard]] semjson::Normalized normalize(const Value& v, const NormalizationPolicy& policy);

}  // namespace semjson::normalize
