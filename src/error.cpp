#include "error.hpp"

namespace switchyard {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::BadRequest:
            return "BadRequest";
        case ErrorCategory::Unauthorized:
            return "Unauthorized";
        case ErrorCategory::RouteNotFound:
            return "RouteNotFound";
        case ErrorCategory::MethodNotAllowed:
            return "MethodNotAllowed";
        case ErrorCategory::InternalFault:
            return "InternalFault";
        case ErrorCategory::Configuration:
            return "Configuration";
        default:
            return "Unknown";
    }
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["category"] = getCategoryName();
    error_json["message"] = message;
    error_json["code"] = http_status_code;

    if (!details.empty()) {
        error_json["details"] = details;
    }

    return error_json;
}

} // namespace switchyard
