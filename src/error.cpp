#include "error.hpp"

namespace sqlscript {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Connection:
            return "Connection";
        case ErrorCategory::Database:
            return "Database";
        case ErrorCategory::UnsupportedStatement:
            return "UnsupportedStatement";
        case ErrorCategory::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    return error_json;
}

} // namespace sqlscript
