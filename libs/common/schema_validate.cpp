/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "evmverify/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace evmverify::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "evmverify:schema/";

// valijson understands draft-07 "definitions" only
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
        schema.erase("$defs");
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] evmverify::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return result;
}

}  // namespace

evmverify::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto referenced =
            load_schema(schema_dir / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!referenced) {
            return nullptr;
        }
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*referenced)));
        return owned_schemas.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

evmverify::VoidResult validate_document(const nlohmann::json& j,
                                        const std::filesystem::path& schema_dir,
                                        std::string_view schema_version)
{
    const auto path = schema_dir / (std::string(schema_version) + ".schema.json");
    return validate_json(j, path.string());
}

}  // namespace evmverify::common
