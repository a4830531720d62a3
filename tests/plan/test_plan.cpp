/**
 * @file test_plan.cpp
 * @brief Plan modifier tests
 */

#include "semjson/plan.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace semjson::plan;
using semjson::equality::SemanticComparator;
using semjson::normalize::NormalizationPolicy;

namespace {

SemanticComparator workflow_comparator()
{
    return SemanticComparator(NormalizationPolicy::workflow_node_defaults());
}

constexpr const char* kStateNodes = R"([{"id":"n1","name":"Start","position":[240,300]}])";
constexpr const char* kConfigNodes = R"([
  {
    "position": [240, 300],
    "name": "Start",
    "id": "n1",
    "executeOnce": false
  }
])";

AttributeMap make_state()
{
    return AttributeMap{
        {       "name",              PlanValue::known("wf")},
        {     "active",           PlanValue::known("false")},
        {      "nodes",          PlanValue::known(kStateNodes)},
        {"connections",            PlanValue::known(R"({"Start":{}})")},
        { "version_id",              PlanValue::known("v7")},
        { "updated_at", PlanValue::known("2024-01-01T00:00:00Z")},
    };
}

}  // namespace

TEST(JsonSemanticEquality, SemanticallyEqualKeepsState)
{
    const auto comparator = workflow_comparator();
    const StringPlanRequest request{.state = PlanValue::known(kStateNodes),
                                    .config = PlanValue::known(kConfigNodes),
                                    .plan = PlanValue::known(kConfigNodes)};

    EXPECT_EQ(apply_json_semantic_equality(request, comparator), PlanValue::known(kStateNodes));
}

TEST(JsonSemanticEquality, RealChangeKeepsPlan)
{
    const auto comparator = workflow_comparator();
    const std::string config = R"([{"id":"n1","name":"Renamed","position":[240,300]}])";
    const StringPlanRequest request{.state = PlanValue::known(kStateNodes),
                                    .config = PlanValue::known(config),
                                    .plan = PlanValue::known(config)};

    EXPECT_EQ(apply_json_semantic_equality(request, comparator), PlanValue::known(config));
}

TEST(JsonSemanticEquality, IdenticalTextKeepsPlan)
{
    const auto comparator = workflow_comparator();
    const StringPlanRequest request{.state = PlanValue::known(kStateNodes),
                                    .config = PlanValue::known(kStateNodes),
                                    .plan = PlanValue::known("planned")};

    EXPECT_EQ(apply_json_semantic_equality(request, comparator), PlanValue::known("planned"));
}

TEST(JsonSemanticEquality, NotKnownValuesKeepPlan)
{
    const auto comparator = workflow_comparator();
    const std::vector<StringPlanRequest> requests = {
        // create: no state
        {.state = PlanValue::null(),
         .config = PlanValue::known(kConfigNodes),
         .plan = PlanValue::known(kConfigNodes)},
        // config not yet known
        {.state = PlanValue::known(kStateNodes),
         .config = PlanValue::unknown(),
         .plan = PlanValue::unknown()},
        // destroy
        {.state = PlanValue::known(kStateNodes),
         .config = PlanValue::known(kConfigNodes),
         .plan = PlanValue::null()},
    };
    for (const auto& request : requests) {
        EXPECT_EQ(apply_json_semantic_equality(request, comparator), request.plan);
    }
}

TEST(JsonSemanticEquality, InvalidJsonKeepsPlan)
{
    const auto comparator = workflow_comparator();
    const StringPlanRequest request{.state = PlanValue::known("{invalid}"),
                                    .config = PlanValue::known("{ invalid }"),
                                    .plan = PlanValue::known("{ invalid }")};

    EXPECT_EQ(apply_json_semantic_equality(request, comparator), PlanValue::known("{ invalid }"));
}

TEST(ResourcePlan, NoContentChangeKeepsComputedAndJsonState)
{
    const auto comparator = workflow_comparator();
    const auto state = make_state();
    auto plan = state;
    plan["nodes"] = PlanValue::known(kConfigNodes);
    plan["version_id"] = PlanValue::unknown();
    plan["updated_at"] = PlanValue::unknown();

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_FALSE(result.content_changed);
    EXPECT_TRUE(result.changed_attributes.empty());
    EXPECT_EQ(result.plan.at("nodes"), PlanValue::known(kStateNodes));
    EXPECT_EQ(result.plan.at("version_id"), PlanValue::known("v7"));
    EXPECT_EQ(result.plan.at("updated_at"), PlanValue::known("2024-01-01T00:00:00Z"));
    EXPECT_EQ(result.plan.at("name"), PlanValue::known("wf"));
}

TEST(ResourcePlan, ContentChangeKeepsPlan)
{
    const auto comparator = workflow_comparator();
    const auto state = make_state();
    auto plan = state;
    plan["name"] = PlanValue::known("renamed");
    plan["nodes"] = PlanValue::known(kConfigNodes);
    plan["updated_at"] = PlanValue::unknown();

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_TRUE(result.content_changed);
    EXPECT_EQ(result.changed_attributes, std::vector<std::string>{"name"});
    EXPECT_EQ(result.plan.at("updated_at"), PlanValue::unknown());
    EXPECT_EQ(result.plan.at("nodes"), PlanValue::known(kConfigNodes));
}

TEST(ResourcePlan, JsonContentChangeDetected)
{
    const auto comparator = workflow_comparator();
    const auto state = make_state();
    auto plan = state;
    plan["connections"] = PlanValue::known(R"({"Start":{"main":[[{"node":"Next"}]]}})");
    plan["nodes"] = PlanValue::known(R"([{"id":"n1","name":"Start","position":[300,240]}])");

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_TRUE(result.content_changed);
    EXPECT_EQ(result.changed_attributes, (std::vector<std::string>{"connections", "nodes"}));
}

TEST(ResourcePlan, UnknownJsonContentIsNotAChange)
{
    const auto comparator = workflow_comparator();
    const auto state = make_state();
    auto plan = state;
    plan["connections"] = PlanValue::unknown();

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_FALSE(result.content_changed);
    EXPECT_EQ(result.plan.at("connections"), PlanValue::known(R"({"Start":{}})"));
}

TEST(ResourcePlan, NullVersusKnownIsAChange)
{
    const auto comparator = workflow_comparator();
    auto state = make_state();
    state.erase("settings");
    auto plan = state;
    plan["settings"] = PlanValue::known(R"({"timezone":"UTC"})");
    state.erase("connections");

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_TRUE(result.content_changed);
    EXPECT_EQ(result.changed_attributes, (std::vector<std::string>{"connections", "settings"}));
}

TEST(ResourcePlan, AttributesWithoutRulesPassThrough)
{
    const auto comparator = workflow_comparator();
    const auto state = make_state();
    auto plan = state;
    plan["tags"] = PlanValue::known(R"(["a"])");

    const auto result = modify_resource_plan(state, plan, ResourceRules::workflow(), comparator);

    EXPECT_FALSE(result.content_changed);
    EXPECT_EQ(result.plan.at("tags"), PlanValue::known(R"(["a"])"));
}

TEST(ResourcePlan, WorkflowRules)
{
    const auto rules = ResourceRules::workflow();
    EXPECT_EQ(rules.attributes.at("nodes"), AttributeKind::kJsonContent);
    EXPECT_EQ(rules.attributes.at("connections"), AttributeKind::kJsonContent);
    EXPECT_EQ(rules.attributes.at("name"), AttributeKind::kContent);
    EXPECT_EQ(rules.attributes.at("updated_at"), AttributeKind::kComputed);
    EXPECT_EQ(rules.attributes.size(), 7U);
}
