/**
 * @file plan.cpp
 * @brief Change-plan modifiers
 */

#include "semjson/plan.hpp"

namespace semjson::plan {

namespace {

[[nodiscard]] PlanValue value_or_null(const AttributeMap& values, const std::string& name)
{
    if (auto it = values.find(name); it != values.end()) {
        return it->second;
    }
    return PlanValue::null();
}

[[nodiscard]] bool json_content_changed(const PlanValue& planned,
                                        const PlanValue& persisted,
                                        const equality::SemanticComparator& comparator)
{
    if (planned.is_unknown() || persisted.is_unknown()) {
        return false;
    }
    if (planned.is_known() && persisted.is_known()) {
        return !comparator.semantic_equal(planned.text, persisted.text);
    }
    return planned.state != persisted.state;
}

}  // namespace

PlanValue apply_json_semantic_equality(const StringPlanRequest& request,
                                       const equality::SemanticComparator& comparator)
{
    // Nothing to compare against on create, for computed-only values, or on destroy
    if (!request.state.is_known() || !request.config.is_known() || !request.plan.is_known()) {
        return request.plan;
    }
    if (request.state.text == request.config.text) {
        return request.plan;
    }
    if (comparator.semantic_equal(request.state.text, request.config.text)) {
        return request.state;
    }
    return request.plan;
}

ResourceRules ResourceRules::workflow()
{
    return ResourceRules{
        .attributes = {
            {       "name",     AttributeKind::kContent},
            {     "active",     AttributeKind::kContent},
            {   "settings",     AttributeKind::kContent},
            {      "nodes", AttributeKind::kJsonContent},
            {"connections", AttributeKind::kJsonContent},
            { "version_id",    AttributeKind::kComputed},
            { "updated_at",    AttributeKind::kComputed},
        }
    };
}

ResourcePlanResult modify_resource_plan(const AttributeMap& state,
                                        const AttributeMap& plan,
                                        const ResourceRules& rules,
                                        const equality::SemanticComparator& comparator)
{
    ResourcePlanResult result{.content_changed = false, .plan = plan, .changed_attributes = {}};

    // rules.attributes is ordered, so changed_attributes comes out sorted
    for (const auto& [name, kind] : rules.attributes) {
        const PlanValue planned = value_or_null(plan, name);
        const PlanValue persisted = value_or_null(state, name);
        bool changed = false;
        switch (kind) {
            case AttributeKind::kContent:
                changed = planned != persisted;
                break;
            case AttributeKind::kJsonContent:
                changed = json_content_changed(planned, persisted, comparator);
                break;
            case AttributeKind::kComputed:
                break;
        }
        if (changed) {
            result.changed_attributes.push_back(name);
        }
    }
    result.content_changed = !result.changed_attributes.empty();

    if (!result.content_changed) {
        for (const auto& [name, kind] : rules.attributes) {
            if (kind == AttributeKind::kComputed || kind == AttributeKind::kJsonContent) {
                result.plan[name] = value_or_null(state, name);
            }
        }
    }
    return result;
}

}  // namespace semjson::plan
