/**
 * @file normalize.cpp
 * @brief Comparison normalization
 *
 * Upstream APIs return `null` for unset attributes and add or drop
 * default-valued flags between reads. Both must look exactly like the field
 * being absent, at every depth and through arrays.
 */

#include "semjson/normalize.hpp"

#include <optional>
#include <utility>

namespace semjson::normalize {

namespace {

[[nodiscard]] semjson::Normalized normalize_object(const Value& object,
                                                   const NormalizationPolicy& policy)
{
    Value result = Value::object();
    auto& entries = result.get_ref<Value::object_t&>();
    for (const auto& [key, child] : object.items()) {
        if (policy.is_optional_field(key)) {
            continue;
        }
        auto normalized = normalize(child, policy);
        if (!normalized) {
            continue;
        }
        entries.emplace(key, std::move(*normalized));
    }
    if (entries.empty()) {
        return std::nullopt;
    }
    return std::make_optional(std::move(result));
}

[[nodiscard]] semjson::Normalized normalize_array(const Value& array,
                                                  const NormalizationPolicy& policy)
{
    Value result = Value::array();
    auto& elements = result.get_ref<Value::array_t&>();
    elements.reserve(array.size());
    for (const auto& elem : array) {
        auto normalized = normalize(elem, policy);
        if (normalized) {
            elements.push_back(std::move(*normalized));
        }
    }
    if (elements.empty()) {
        return std::nullopt;
    }
    return std::make_optional(std::move(result));
}

}  // namespace

NormalizationPolicy::NormalizationPolicy(FieldSet optional_fields)
    : m_optional_fields(std::move(optional_fields))
{}

NormalizationPolicy NormalizationPolicy::workflow_node_defaults()
{
    return NormalizationPolicy(FieldSet{
        "executeOnce",       // default: false
        "alwaysOutputData",  // default: false
        "retryOnFail",       // default: false
        "onError",           // default: set by the API
        "continueOnFail",    // default: false
        "disabled",          // default: false
    });
}

bool NormalizationPolicy::is_optional_field(std::string_view key) const
{
    return m_optional_fields.contains(key);
}

semjson::Normalized normalize(const Value& v, const NormalizationPolicy& policy)
{
    using value_t = Value::value_t;
    switch (v.type()) {
        case value_t::null:
        case value_t::discarded:
            return std::nullopt;
        case value_t::object:
            return normalize_object(v, policy);
        case value_t::array:
            return normalize_array(v, policy);
        case value_t::boolean:
        case value_t::number_integer:
        case value_t::number_unsigned:
        case value_t::number_float:
        case value_t::string:
        case value_t::binary:
            return std::make_optional(v);
    }
    return std::make_optional(v);
}

}  // namespace semjson::normalize
