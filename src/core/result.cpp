#include <embedded_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace embedded_mcp {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:         return 2;
        case ErrorCategory::AlreadyRunning: return 3;
        case ErrorCategory::InvalidPort:    return 4;
        case ErrorCategory::StartupTimeout: return 5;
        case ErrorCategory::BindFailed:     return 6;
        case ErrorCategory::Cancelled:      return 7;
        case ErrorCategory::Automation:     return 8;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::AlreadyRunning: return "already_running";
        case ErrorCategory::InvalidPort:    return "invalid_port";
        case ErrorCategory::StartupTimeout: return "startup_timeout";
        case ErrorCategory::BindFailed:     return "bind_failed";
        case ErrorCategory::Cancelled:      return "cancelled";
        case ErrorCategory::Automation:     return "automation";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << CategoryName() << "]: " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::ordered_json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::ordered_json{{"error", body}}.dump();
}

} // namespace embedded_mcp
