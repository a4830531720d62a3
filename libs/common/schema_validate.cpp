/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "semjson/schema_validate.hpp"

#include <format>
#include <fstream>
#include <iterator>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace semjson::common {

namespace {

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            // valijson reports the root as "<root>"; paths are relative to it
            if (part == "<root>") {
                continue;
            }
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

semjson::VoidResult validate_json(const Value& doc, const std::string& schema_path)
{
    std::ifstream schema_stream(schema_path, std::ios::binary);
    if (!schema_stream) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }
    std::string schema_text{std::istreambuf_iterator<char>{schema_stream},
                            std::istreambuf_iterator<char>{}};

    auto schema_json = value::parse(schema_text);
    if (!schema_json) {
        return std::unexpected(
            Error::make("SchemaParseFailed",
                        "Failed to parse schema JSON " + schema_path + ": "
                            + schema_json.error().message));
    }

    valijson::Schema schema;
    valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(doc);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }

    return {};
}

}  // namespace semjson::common
