#pragma once

#include <crow.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace toolhost {

/**
 * Utility functions for reading decoded JSON documents.
 *
 * Decoded documents are crow::json::rvalue trees. A child rvalue borrows the
 * parent's buffer, so anything that must outlive the parent goes through clone().
 */
class JsonUtils {
public:
    /**
     * Extract string from JSON value.
     * Returns the string value directly, or empty string if value is not a string.
     */
    static std::string extractString(const crow::json::rvalue& value) {
        if (!isString(value)) {
            return "";
        }

        // For rvalue, .s() gives us the string directly
        return std::string(value.s());
    }

    /**
     * Extract optional string from JSON object by key.
     * Returns nullopt if key is missing or value is not a string.
     */
    static std::optional<std::string> extractOptionalString(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!isObject(json) || !json.has(key)) {
            return std::nullopt;
        }

        return isString(json[key]) ? std::optional<std::string>(extractString(json[key])) : std::nullopt;
    }

    /**
     * Extract required string from JSON object by key.
     *
     * @throws std::runtime_error if key missing or wrong type
     */
    static std::string extractRequiredString(
        const crow::json::rvalue& json,
        const std::string& key,
        const std::string& error_msg = "") {

        auto result = extractOptionalString(json, key);
        if (!result) {
            std::string msg = error_msg.empty() ? "Missing required field: " + key : error_msg;
            throw std::runtime_error(msg);
        }
        return result.value();
    }

    /**
     * Extract integer from JSON object by key.
     * Returns nullopt if key is missing or value is not an integral number.
     */
    static std::optional<int64_t> extractInt(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!isObject(json) || !json.has(key)) {
            return std::nullopt;
        }

        return toInt64(json[key]);
    }

    /**
     * Exact 64-bit value of an integral number. Integers are read from their
     * text, never through a double, so ids beyond 2^53 keep every digit.
     * Returns nullopt for fractions and values outside the int64 range.
     */
    static std::optional<int64_t> toInt64(const crow::json::rvalue& value) {
        if (!isNumber(value)) {
            return std::nullopt;
        }

        std::optional<int64_t> exact;
        try {
            switch (value.nt()) {
                case crow::json::num_type::Signed_integer:
                    exact = value.i();
                    break;
                case crow::json::num_type::Unsigned_integer: {
                    uint64_t unsigned_value = value.u();
                    if (unsigned_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        return std::nullopt;
                    }
                    exact = static_cast<int64_t>(unsigned_value);
                    break;
                }
                default:
                    break;
            }
        } catch (const std::exception&) {
            // Digits beyond the 64-bit range
            return std::nullopt;
        }

        if (exact) {
            // An overlong literal saturates the text parse; the double reading is still close to the truth
            double approx = value.d();
            if (std::fabs(approx - static_cast<double>(*exact)) > std::fabs(approx) * 1e-9) {
                return std::nullopt;
            }
            return exact;
        }

        // 3.0 is integral; 1e300 is too, but has no int64 form
        double d = value.d();
        if (!std::isfinite(d) || std::floor(d) != d || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }

    /**
     * Extract double from JSON object by key.
     */
    static std::optional<double> extractDouble(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!isObject(json) || !json.has(key)) {
            return std::nullopt;
        }

        const auto& value = json[key];
        if (isNumber(value)) {
            return value.d();
        }

        return std::nullopt;
    }

    /**
     * Extract boolean from JSON object by key.
     */
    static std::optional<bool> extractBool(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (!isObject(json) || !json.has(key)) {
            return std::nullopt;
        }

        const auto& value = json[key];
        if (value.t() == crow::json::type::True) {
            return true;
        } else if (value.t() == crow::json::type::False) {
            return false;
        }

        return std::nullopt;
    }

    /**
     * Deep copy that owns its own buffer.
     * Needed whenever a value must outlive the document it was read from.
     */
    static crow::json::rvalue clone(const crow::json::rvalue& value) {
        return crow::json::load(crow::json::wvalue(value).dump());
    }

    /**
     * Convert a built document into a decoded one (owning).
     */
    static crow::json::rvalue toRValue(const crow::json::wvalue& value) {
        return crow::json::load(value.dump());
    }

    /**
     * Canonical text of a value, used for equality checks (enum, const).
     * Object keys come out sorted because wvalue stores objects in a map.
     */
    static std::string canonical(const crow::json::rvalue& value) {
        return crow::json::wvalue(value).dump();
    }

    static std::string typeName(const crow::json::rvalue& value) {
        if (!value) {
            return "undefined";
        }
        switch (value.t()) {
            case crow::json::type::Null:
                return "null";
            case crow::json::type::True:
            case crow::json::type::False:
                return "boolean";
            case crow::json::type::Number:
                return isInteger(value) ? "integer" : "number";
            case crow::json::type::String:
                return "string";
            case crow::json::type::List:
                return "array";
            case crow::json::type::Object:
                return "object";
            default:
                return "unknown";
        }
    }

    static bool isNull(const crow::json::rvalue& value) {
        return value && value.t() == crow::json::type::Null;
    }

    static bool isString(const crow::json::rvalue& value) {
        return value && value.t() == crow::json::type::String;
    }

    static bool isNumber(const crow::json::rvalue& value) {
        return value && value.t() == crow::json::type::Number;
    }

    static bool isInteger(const crow::json::rvalue& value) {
        if (!isNumber(value)) {
            return false;
        }
        if (value.nt() != crow::json::num_type::Floating_point) {
            return true;
        }
        double d = value.d();
        return std::isfinite(d) && std::floor(d) == d;
    }

    static bool isBool(const crow::json::rvalue& value) {
        return value && (value.t() == crow::json::type::True || value.t() == crow::json::type::False);
    }

    static bool isObject(const crow::json::rvalue& value) {
        return value && value.t() == crow::json::type::Object;
    }

    static bool isArray(const crow::json::rvalue& value) {
        return value && value.t() == crow::json::type::List;
    }
};

} // namespace toolhost
