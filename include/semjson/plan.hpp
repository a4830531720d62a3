#pragma once

/**
 * @file plan.hpp
 * @brief Change-plan modifiers that suppress no-op updates
 *
 * During plan computation the caller holds the persisted value (state), the
 * value written by the user (config) and the proposed value (plan). When
 * state and config are semantically equal the plan takes the state text, so
 * no update is proposed for a reformatted or reordered document.
 */

#include "semjson/equality.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace semjson::plan {

enum class ValueState {
    kKnown,
    kNull,
    kUnknown  ///< Not known until apply
};

/**
 * Text attribute value of a plan, state or config
 */
struct PlanValue
{
    ValueState state = ValueState::kNull;
    std::string text;

    [[nodiscard]] static PlanValue known(std::string text)
    {
        return PlanValue{.state = ValueState::kKnown, .text = std::move(text)};
    }
    [[nodiscard]] static PlanValue null() { return PlanValue{}; }
    [[nodiscard]] static PlanValue unknown()
    {
        return PlanValue{.state = ValueState::kUnknown, .text = std::string{}};
    }

    [[nodiscard]] bool is_known() const noexcept { return state == ValueState::kKnown; }
    [[nodiscard]] bool is_unknown() const noexcept { return state == ValueState::kUnknown; }

    bool operator==(const PlanValue&) const = default;
};

struct StringPlanRequest
{
    PlanValue state;
    PlanValue config;
    PlanValue plan;
};

/**
 * Attribute-level modifier for JSON-encoded string attributes.
 *
 * Returns `state` when all three values are known, state and config texts
 * differ, and they are semantically equal. Returns `plan` otherwise.
 */
[[nodiscard]] PlanValue apply_json_semantic_equality(const StringPlanRequest& request,
                                                     const equality::SemanticComparator& comparator);

enum class AttributeKind {
    kContent,      ///< Compared by exact value
    kJsonContent,  ///< JSON text compared by semantic equality
    kComputed      ///< Assigned by the server; never compared
};

using AttributeMap = std::map<std::string, PlanValue>;

struct ResourceRules
{
    std::map<std::string, AttributeKind> attributes;

    /**
     * Workflow resource: name, active and settings are content; nodes and
     * connections are JSON content; version_id and updated_at are computed.
     */
    [[nodiscard]] static ResourceRules workflow();
};

struct ResourcePlanResult
{
    bool content_changed = false;
    AttributeMap plan;
    std::vector<std::string> changed_attributes;  ///< Sorted by name
};

/**
 * Resource-level modifier.
 *
 * An attribute missing from a map is Null. When no content attribute
 * changed, every computed and JSON content attribute takes its state value,
 * so an update that would only touch server timestamps is not proposed.
 *
 * @param state Persisted attribute values
 * @param plan Proposed attribute values
 * @param rules Attribute classification; attributes without a rule are ignored
 * @param comparator Semantic comparator for JSON content
 */
[[nodiscard]] ResourcePlanResult modify_resource_plan(const AttributeMap& state,
                                                      const AttributeMap& plan,
                                                      const ResourceRules& rules,
                                                      const equality::SemanticComparator& comparator);

}  // namespace semjson::plan
