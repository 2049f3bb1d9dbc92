#include "error.hpp"
#include "mcp_constants.hpp"

namespace toolhost {

namespace constants = toolhost::mcp::constants;

Error Error::Validation(const std::string& msg, std::vector<ValidationError> violations,
                        const std::string& details) {
    return Error{ErrorCategory::Validation, msg, details, constants::VALIDATION_ERROR, std::move(violations)};
}

Error Error::NotFound(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::NotFound, msg, details, constants::TOOL_NOT_FOUND, {}};
}

Error Error::ToolExecution(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::ToolExecution, msg, details, constants::TOOL_EXECUTION_ERROR, {}};
}

Error Error::NotConfigured(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::NotConfigured, msg, details, constants::NOT_CONFIGURED, {}};
}

Error Error::NotInitialized(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::NotInitialized, msg, details, constants::NOT_INITIALIZED, {}};
}

Error Error::Transport(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::Transport, msg, details, constants::TRANSPORT_ERROR, {}};
}

Error Error::Cancelled(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::Cancelled, msg, details, constants::REQUEST_CANCELLED, {}};
}

Error Error::Config(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::Configuration, msg, details, constants::INTERNAL_ERROR, {}};
}

Error Error::Internal(const std::string& msg, const std::string& details) {
    return Error{ErrorCategory::Internal, msg, details, constants::INTERNAL_ERROR, {}};
}

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Protocol:
            return "Protocol";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::ToolExecution:
            return "ToolExecution";
        case ErrorCategory::NotConfigured:
            return "NotConfigured";
        case ErrorCategory::NotInitialized:
            return "NotInitialized";
        case ErrorCategory::Transport:
            return "Transport";
        case ErrorCategory::Cancelled:
            return "Cancelled";
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

int Error::httpStatus() const {
    switch (category) {
        case ErrorCategory::Protocol:
        case ErrorCategory::Validation:
        case ErrorCategory::NotInitialized:
            return constants::HTTP_BAD_REQUEST;
        case ErrorCategory::NotFound:
            return constants::HTTP_NOT_FOUND;
        case ErrorCategory::NotConfigured:
            return constants::HTTP_SERVICE_UNAVAILABLE;
        default:
            return constants::HTTP_INTERNAL_SERVER_ERROR;
    }
}

std::string Error::describe() const {
    if (details.empty()) {
        return message;
    }
    return message + ": " + details;
}

crow::json::wvalue Error::toData() const {
    crow::json::wvalue data;
    data["category"] = getCategoryName();

    if (!details.empty()) {
        data["details"] = details;
    }

    if (!violations.empty()) {
        crow::json::wvalue list = crow::json::wvalue::list();
        for (size_t i = 0; i < violations.size(); ++i) {
            list[i]["field"] = violations[i].fieldName;
            list[i]["message"] = violations[i].errorMessage;
        }
        data["violations"] = std::move(list);
    }

    return data;
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["code"] = code;
    error_json["message"] = message;
    error_json["data"] = toData();
    return error_json;
}

} // namespace toolhost
