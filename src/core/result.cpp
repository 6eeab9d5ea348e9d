#include <toolserve/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace toolserve {

Error Error::Config(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::nullopt};
}

Error Error::Bind(const std::string& address, int port,
                  const std::string& message) {
    return Error{"HttpServer", message, ErrorCategory::Bind,
                 address + ":" + std::to_string(port)};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:   return 2;
        case ErrorCategory::Bind:     return 3;
        case ErrorCategory::Io:       return 4;
        case ErrorCategory::Internal: return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:   return "config";
        case ErrorCategory::Bind:     return "bind";
        case ErrorCategory::Io:       return "io";
        case ErrorCategory::Internal: return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (detail.has_value() && !detail->empty()) {
        oss << " [" << *detail << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (detail.has_value()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace toolserve
