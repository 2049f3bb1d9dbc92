#include "schema_validator.hpp"
#include "json_utils.hpp"
#include <algorithm>
#include <mutex>

namespace toolhost {

namespace {

const std::vector<std::string> kTypeNames = {
    "null", "boolean", "integer", "number", "string", "array", "object"
};

std::string childPath(const std::string& path, const std::string& name) {
    return path + "." + name;
}

std::string indexPath(const std::string& path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

// Length in code points; continuation bytes are not counted
size_t utf8Length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::string joined;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            joined += " or ";
        }
        joined += types[i];
    }
    return joined;
}

std::string formatNumber(double value) {
    return crow::json::wvalue(value).dump();
}

Error schemaError(const std::string& path, const std::string& problem) {
    return Error::Config("Invalid input schema", path + ": " + problem);
}

} // namespace

void CompiledSchema::validate(const crow::json::rvalue& value, const std::string& path,
                              std::vector<ValidationError>& violations) const {
    if (accept_all) {
        return;
    }
    if (reject_all) {
        violations.push_back({path, "no value is allowed here"});
        return;
    }

    if (!types.empty() && !matchesType(value)) {
        violations.push_back({path, "expected " + joinTypes(types) + ", got " + JsonUtils::typeName(value)});
        return;
    }

    if (enum_values) {
        auto text = JsonUtils::canonical(value);
        if (std::find(enum_values->begin(), enum_values->end(), text) == enum_values->end()) {
            violations.push_back({path, "value " + text + " is not one of the allowed values"});
        }
    }

    switch (value.t()) {
        case crow::json::type::String: {
            auto text = JsonUtils::extractString(value);
            auto length = utf8Length(text);
            if (min_length && length < *min_length) {
                violations.push_back({path, "must be at least " + std::to_string(*min_length) + " characters"});
            }
            if (max_length && length > *max_length) {
                violations.push_back({path, "must be at most " + std::to_string(*max_length) + " characters"});
            }
            if (pattern && !std::regex_search(text, *pattern)) {
                violations.push_back({path, "does not match pattern " + pattern_source});
            }
            break;
        }
        case crow::json::type::Number: {
            double number = value.d();
            if (minimum && number < *minimum) {
                violations.push_back({path, "must be >= " + formatNumber(*minimum)});
            }
            if (maximum && number > *maximum) {
                violations.push_back({path, "must be <= " + formatNumber(*maximum)});
            }
            break;
        }
        case crow::json::type::List: {
            if (min_items && value.size() < *min_items) {
                violations.push_back({path, "must have at least " + std::to_string(*min_items) + " items"});
            }
            if (max_items && value.size() > *max_items) {
                violations.push_back({path, "must have at most " + std::to_string(*max_items) + " items"});
            }
            if (items) {
                for (size_t i = 0; i < value.size(); ++i) {
                    items->validate(value[i], indexPath(path, i), violations);
                }
            }
            break;
        }
        case crow::json::type::Object: {
            for (const auto& name : required) {
                if (!value.has(name)) {
                    violations.push_back({childPath(path, name), "required property is missing"});
                }
            }
            for (const auto& member : value) {
                auto name = member.key();
                auto property = properties.find(name);
                if (property != properties.end()) {
                    property->second->validate(member, childPath(path, name), violations);
                } else if (!additional_properties) {
                    violations.push_back({childPath(path, name), "additional property is not allowed"});
                } else if (additional_schema) {
                    additional_schema->validate(member, childPath(path, name), violations);
                }
            }
            break;
        }
        default:
            break;
    }
}

bool CompiledSchema::matchesType(const crow::json::rvalue& value) const {
    auto actual = JsonUtils::typeName(value);
    for (const auto& type : types) {
        if (type == actual) {
            return true;
        }
        // Every integer is also a number
        if (type == "number" && actual == "integer") {
            return true;
        }
    }
    return false;
}

Status SchemaValidator::registerSchema(const std::string& tool_name, const crow::json::rvalue& schema) {
    auto compiled = compile(schema);
    if (!compiled) {
        CROW_LOG_WARNING << "Schema for tool '" << tool_name << "' rejected: " << compiled.error().describe();
        return std::move(compiled.error());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    schemas_[tool_name] = compiled.value();
    return Status();
}

Status SchemaValidator::registerSchema(const std::string& tool_name, const crow::json::wvalue& schema) {
    auto decoded = JsonUtils::toRValue(schema);
    if (!decoded) {
        return schemaError("$", "schema could not be serialized");
    }
    return registerSchema(tool_name, decoded);
}

Status SchemaValidator::validate(const std::string& tool_name, const crow::json::rvalue& input) const {
    std::shared_ptr<const CompiledSchema> compiled;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = schemas_.find(tool_name);
        if (it == schemas_.end()) {
            return Error::Validation("No schema registered for tool", {}, tool_name);
        }
        compiled = it->second;
    }

    std::vector<ValidationError> violations;
    if (input) {
        compiled->validate(input, "$", violations);
    } else {
        // Missing arguments are checked as an empty object
        auto empty = crow::json::load("{}");
        compiled->validate(empty, "$", violations);
    }

    if (violations.empty()) {
        return Status();
    }

    std::string details;
    for (const auto& violation : violations) {
        if (!details.empty()) {
            details += "; ";
        }
        details += violation.fieldName + ": " + violation.errorMessage;
    }
    return Error::Validation("Invalid arguments for tool '" + tool_name + "'", std::move(violations), details);
}

bool SchemaValidator::hasSchema(const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return schemas_.find(tool_name) != schemas_.end();
}

size_t SchemaValidator::schemaCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return schemas_.size();
}

bool SchemaValidator::removeSchema(const std::string& tool_name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return schemas_.erase(tool_name) > 0;
}

void SchemaValidator::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    schemas_.clear();
}

Result<std::shared_ptr<const CompiledSchema>> SchemaValidator::compile(const crow::json::rvalue& schema) {
    if (!schema) {
        return schemaError("$", "schema is not valid JSON");
    }
    return compileNode(schema, "$");
}

Result<std::shared_ptr<const CompiledSchema>> SchemaValidator::compileNode(const crow::json::rvalue& schema,
                                                                          const std::string& path) {
    auto compiled = std::make_shared<CompiledSchema>();

    switch (schema.t()) {
        case crow::json::type::True:
            compiled->accept_all = true;
            break;
        case crow::json::type::False:
            compiled->reject_all = true;
            break;
        case crow::json::type::Object: {
            auto error = compileKeywords(schema, path, *compiled);
            if (error) {
                return std::move(*error);
            }
            break;
        }
        default:
            return schemaError(path, "schema must be an object or a boolean");
    }

    return std::shared_ptr<const CompiledSchema>(std::move(compiled));
}

std::optional<Error> SchemaValidator::compileKeywords(const crow::json::rvalue& schema, const std::string& path,
                                                     CompiledSchema& compiled) {
    if (schema.has("type")) {
        const auto& type = schema["type"];
        if (JsonUtils::isString(type)) {
            compiled.types.push_back(JsonUtils::extractString(type));
        } else if (JsonUtils::isArray(type)) {
            for (const auto& entry : type) {
                if (!JsonUtils::isString(entry)) {
                    return schemaError(path, "type entries must be strings");
                }
                compiled.types.push_back(JsonUtils::extractString(entry));
            }
        } else {
            return schemaError(path, "type must be a string or an array of strings");
        }

        for (const auto& name : compiled.types) {
            if (std::find(kTypeNames.begin(), kTypeNames.end(), name) == kTypeNames.end()) {
                return schemaError(path, "unknown type '" + name + "'");
            }
        }
    }

    if (schema.has("required")) {
        const auto& required = schema["required"];
        if (!JsonUtils::isArray(required)) {
            return schemaError(path, "required must be an array of strings");
        }
        for (const auto& entry : required) {
            if (!JsonUtils::isString(entry)) {
                return schemaError(path, "required must be an array of strings");
            }
            compiled.required.push_back(JsonUtils::extractString(entry));
        }
    }

    if (schema.has("properties")) {
        const auto& properties = schema["properties"];
        if (!JsonUtils::isObject(properties)) {
            return schemaError(path, "properties must be an object");
        }
        for (const auto& property : properties) {
            auto name = property.key();
            auto child = compileNode(property, path + ".properties." + name);
            if (!child) {
                return std::move(child.error());
            }
            compiled.properties[name] = child.value();
        }
    }

    if (schema.has("additionalProperties")) {
        const auto& additional = schema["additionalProperties"];
        if (JsonUtils::isBool(additional)) {
            compiled.additional_properties = additional.t() == crow::json::type::True;
        } else if (JsonUtils::isObject(additional)) {
            auto child = compileNode(additional, path + ".additionalProperties");
            if (!child) {
                return std::move(child.error());
            }
            compiled.additional_schema = child.value();
        } else {
            return schemaError(path, "additionalProperties must be a boolean or a schema");
        }
    }

    if (schema.has("items")) {
        const auto& items = schema["items"];
        if (!JsonUtils::isObject(items) && !JsonUtils::isBool(items)) {
            return schemaError(path, "items must be a single schema");
        }
        auto child = compileNode(items, path + ".items");
        if (!child) {
            return std::move(child.error());
        }
        compiled.items = child.value();
    }

    if (schema.has("enum")) {
        const auto& values = schema["enum"];
        if (!JsonUtils::isArray(values)) {
            return schemaError(path, "enum must be an array");
        }
        std::vector<std::string> allowed;
        for (const auto& value : values) {
            allowed.push_back(JsonUtils::canonical(value));
        }
        compiled.enum_values = std::move(allowed);
    }

    std::optional<Error> error;
    compiled.min_length = readCount(schema, "minLength", path, error);
    compiled.max_length = readCount(schema, "maxLength", path, error);
    compiled.min_items = readCount(schema, "minItems", path, error);
    compiled.max_items = readCount(schema, "maxItems", path, error);
    if (error) {
        return error;
    }

    for (const char* keyword : {"minimum", "maximum"}) {
        if (!schema.has(keyword)) {
            continue;
        }
        if (!JsonUtils::isNumber(schema[keyword])) {
            return schemaError(path, std::string(keyword) + " must be a number");
        }
        if (std::string(keyword) == "minimum") {
            compiled.minimum = schema[keyword].d();
        } else {
            compiled.maximum = schema[keyword].d();
        }
    }

    if (schema.has("pattern")) {
        const auto& pattern = schema["pattern"];
        if (!JsonUtils::isString(pattern)) {
            return schemaError(path, "pattern must be a string");
        }
        compiled.pattern_source = JsonUtils::extractString(pattern);
        try {
            compiled.pattern.emplace(compiled.pattern_source, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return schemaError(path, "invalid pattern '" + compiled.pattern_source + "': " + e.what());
        }
    }

    return std::nullopt;
}

std::optional<size_t> SchemaValidator::readCount(const crow::json::rvalue& schema, const std::string& keyword,
                                                 const std::string& path, std::optional<Error>& error) {
    if (!schema.has(keyword)) {
        return std::nullopt;
    }

    const auto& value = schema[keyword];
    auto count = JsonUtils::toInt64(value);
    if (!count || *count < 0) {
        if (!error) {
            error = schemaError(path, keyword + " must be a non-negative integer");
        }
        return std::nullopt;
    }
    return static_cast<size_t>(*count);
}

} // namespace toolhost
