#include "semjson/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace semjson::common::test {

namespace {

namespace fs = std::filesystem;

std::string schema_path(const std::string& name)
{
    return std::string(SEMJSON_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_valid_policy_json()
{
    return nlohmann::json{
        {   "schema_version",                           "semjson_policy.v1"},
        {  "optional_fields", nlohmann::json::array({"executeOnce", "disabled"})},
        {        "max_depth",                                             64}
    };
}

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] std::string write_file(const std::string& name, const std::string& content) const
    {
        const auto path = m_path / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

private:
    fs::path m_path;
};

}  // namespace

TEST(SchemaValidateTest, ValidPolicyPasses)
{
    auto result = validate_json(make_valid_policy_json(), schema_path("policy.v1.schema.json"));
    EXPECT_TRUE(result);
}

TEST(SchemaValidateTest, MinimalPolicyPasses)
{
    const nlohmann::json minimal = {
        { "schema_version",  "semjson_policy.v1"},
        {"optional_fields", nlohmann::json::array()}
    };
    EXPECT_TRUE(validate_json(minimal, schema_path("policy.v1.schema.json")));
}

TEST(SchemaValidateTest, DepthBoundsAccepted)
{
    for (int depth : {1, 10'000}) {
        SCOPED_TRACE(depth);
        auto doc = make_valid_policy_json();
        doc["max_depth"] = depth;
        EXPECT_TRUE(validate_json(doc, schema_path("policy.v1.schema.json")));
    }
}

TEST(SchemaValidateTest, InvalidPoliciesFail)
{
    std::vector<nlohmann::json> invalid_docs;

    auto wrong_version = make_valid_policy_json();
    wrong_version["schema_version"] = "invalid.v0";
    invalid_docs.push_back(wrong_version);

    auto missing_fields = make_valid_policy_json();
    missing_fields.erase("optional_fields");
    invalid_docs.push_back(missing_fields);

    auto duplicate_fields = make_valid_policy_json();
    duplicate_fields["optional_fields"] = nlohmann::json::array({"a", "a"});
    invalid_docs.push_back(duplicate_fields);

    auto empty_field = make_valid_policy_json();
    empty_field["optional_fields"] = nlohmann::json::array({""});
    invalid_docs.push_back(empty_field);

    auto non_string_field = make_valid_policy_json();
    non_string_field["optional_fields"] = nlohmann::json::array({1});
    invalid_docs.push_back(non_string_field);

    auto zero_depth = make_valid_policy_json();
    zero_depth["max_depth"] = 0;
    invalid_docs.push_back(zero_depth);

    auto unsupported_depth = make_valid_policy_json();
    unsupported_depth["max_depth"] = 10'001;
    invalid_docs.push_back(unsupported_depth);

    auto float_depth = make_valid_policy_json();
    float_depth["max_depth"] = 2.5;
    invalid_docs.push_back(float_depth);

    auto extra_property = make_valid_policy_json();
    extra_property["unexpected"] = true;
    invalid_docs.push_back(extra_property);

    invalid_docs.push_back(nlohmann::json::array());

    for (const auto& doc : invalid_docs) {
        SCOPED_TRACE(doc.dump());
        auto result = validate_json(doc, schema_path("policy.v1.schema.json"));

        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, ErrorNamesFailingPath)
{
    auto doc = make_valid_policy_json();
    doc["max_depth"] = "deep";

    auto result = validate_json(doc, schema_path("policy.v1.schema.json"));

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("max_depth"), std::string::npos)
        << result.error().message;
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(make_valid_policy_json(), schema_path("does_not_exist.json"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidateTest, MalformedSchemaFile)
{
    TempDir temp_dir("semjson_schema_malformed_test");
    const auto path = temp_dir.write_file("broken.schema.json", R"({"type": "object",)");

    auto result = validate_json(make_valid_policy_json(), path);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaParseFailed");
}

TEST(SchemaValidateTest, CustomSchemaFile)
{
    TempDir temp_dir("semjson_schema_custom_test");
    const auto path = temp_dir.write_file("names.schema.json", R"({
        "$schema": "http://json-schema.org/draft-07/schema#",
        "type": "array",
        "items": {"type": "string"}
    })");

    EXPECT_TRUE(validate_json(nlohmann::json::array({"a", "b"}), path));
    auto result = validate_json(nlohmann::json::array({"a", 1}), path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

}  // namespace semjson::common::test
