/**
 * @file engine_config.cpp
 * @brief Policy file loading
 */

#include "semjson/engine_config.hpp"

#include "semjson/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace semjson::config {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] semjson::Result<std::string> read_text_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(Error::make("IOError", "Failed to open file for read: " + path));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path));
    }
    return content;
}

}  // namespace

EngineConfig default_engine_config()
{
    return EngineConfig{.policy = normalize::NormalizationPolicy::workflow_node_defaults(),
                        .parse = value::ParseOptions{}};
}

semjson::Result<EngineConfig> engine_config_from_json(const Value& doc,
                                                      const std::string& schema_path)
{
    if (auto result = semjson::common::validate_json(doc, schema_path); !result) {
        return std::unexpected(
            Error::make(result.error().code,
                        "Policy schema validation failed: " + result.error().message));
    }

    normalize::FieldSet fields;
    for (const auto& field : doc.at("optional_fields")) {
        fields.insert(field.get<std::string>());
    }

    value::ParseOptions parse;
    if (auto it = doc.find("max_depth"); it != doc.end()) {
        parse.max_depth = it->get<std::size_t>();
    }

    return EngineConfig{.policy = normalize::NormalizationPolicy(std::move(fields)),
                        .parse = parse};
}

semjson::Result<EngineConfig> load_engine_config(const std::string& path,
                                                 const std::string& schema_dir)
{
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    auto doc = value::parse(*text);
    if (!doc) {
        auto error = doc.error();
        error.message = "Failed to parse policy file " + path + ": " + error.message;
        return std::unexpected(std::move(error));
    }

    const auto schema_path = (fs::path(schema_dir) / kPolicySchemaFile).string();
    return engine_config_from_json(*doc, schema_path);
}

equality::SemanticComparator make_comparator(const EngineConfig& config)
{
    return equality::SemanticComparator(config.policy, config.parse);
}

}  // namespace semjson::config
