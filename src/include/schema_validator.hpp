#pragma once

#include "error.hpp"
#include <crow.h>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

/**
 * A JSON-Schema-like document compiled into a tree of checks.
 *
 * Supported keywords: type, required, properties, additionalProperties, enum,
 * items, minLength, maxLength, pattern, minimum, maximum, minItems, maxItems.
 * Anything else is ignored so newer schema documents still compile.
 */
struct CompiledSchema {
    // Boolean schemas: `true` accepts everything, `false` rejects everything
    bool accept_all = false;
    bool reject_all = false;

    std::vector<std::string> types;
    std::vector<std::string> required;
    std::map<std::string, std::shared_ptr<const CompiledSchema>> properties;
    bool additional_properties = true;
    std::shared_ptr<const CompiledSchema> additional_schema;
    std::shared_ptr<const CompiledSchema> items;

    // Canonical text of each allowed value
    std::optional<std::vector<std::string>> enum_values;

    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<std::regex> pattern;
    std::string pattern_source;

    std::optional<double> minimum;
    std::optional<double> maximum;

    std::optional<size_t> min_items;
    std::optional<size_t> max_items;

    // Append every violation found under `path`
    void validate(const crow::json::rvalue& value, const std::string& path,
                  std::vector<ValidationError>& violations) const;

private:
    bool matchesType(const crow::json::rvalue& value) const;
};

/**
 * Compiles input schemas once per tool name and validates tool arguments
 * against them. Lookups take a shared lock; registration takes it exclusively.
 */
class SchemaValidator {
public:
    SchemaValidator() = default;

    // Compile and cache; a compile failure leaves any previous entry untouched
    Status registerSchema(const std::string& tool_name, const crow::json::rvalue& schema);
    Status registerSchema(const std::string& tool_name, const crow::json::wvalue& schema);

    // Fails with a "no schema" error when nothing is registered under the name
    Status validate(const std::string& tool_name, const crow::json::rvalue& input) const;

    bool hasSchema(const std::string& tool_name) const;
    size_t schemaCount() const;
    bool removeSchema(const std::string& tool_name);
    void clear();

    static Result<std::shared_ptr<const CompiledSchema>> compile(const crow::json::rvalue& schema);

private:
    static Result<std::shared_ptr<const CompiledSchema>> compileNode(const crow::json::rvalue& schema,
                                                                    const std::string& path);
    static std::optional<Error> compileKeywords(const crow::json::rvalue& schema, const std::string& path,
                                                CompiledSchema& compiled);
    static std::optional<size_t> readCount(const crow::json::rvalue& schema, const std::string& keyword,
                                           const std::string& path, std::optional<Error>& error);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const CompiledSchema>> schemas_;
};

} // namespace toolhost
