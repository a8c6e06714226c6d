#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_bridge {

namespace {

// Try to extract a human-readable message from a provider's JSON error body.
// Providers use several shapes depending on the framework behind them:
//   {"error": {"message": "..."}}   JSON-RPC style error object
//   {"error": "..."}                flat error string
//   {"message": "..."}              generic REST error
//   {"detail": "..."}               FastAPI / Starlette
std::optional<std::string> ExtractProviderError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) return std::nullopt;

    if (json.contains("error")) {
        const auto& err = json["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
        if (err.is_string()) {
            return err.get<std::string>();
        }
    }
    if (json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    if (json.contains("detail") && json["detail"].is_string()) {
        return json["detail"].get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto provider_error = ExtractProviderError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
        case 422:
            category = ErrorCategory::ToolExecution;
            message = "Bad request";
            break;
        case 404:
            category = ErrorCategory::Protocol;
            message = "Not found";
            break;
        case 405:
            category = ErrorCategory::Protocol;
            message = "Method not allowed";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 500:
            category = ErrorCategory::ToolExecution;
            message = "Provider internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Transport;
            message = "Provider unavailable";
            break;
        default:
            category = status_code >= 500 ? ErrorCategory::Transport
                                          : ErrorCategory::Protocol;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (provider_error.has_value()) {
        message += ": " + *provider_error;
    }

    Error error{operation, endpoint, message, category};
    error.http_status = status_code;
    return error;
}

Error Error::FromRpcError(const std::string& operation,
                          const std::string& endpoint,
                          const std::string& rpc_error) {
    Error error{operation, endpoint, rpc_error, ErrorCategory::ToolExecution};

    auto json = nlohmann::json::parse(rpc_error, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return error;
    }

    if (json.contains("code") && json["code"].is_number_integer()) {
        error.rpc_code = json["code"].get<int>();
        // JSON-RPC reserved range: the request itself was not understood.
        if (*error.rpc_code <= -32600 && *error.rpc_code >= -32700) {
            error.category = ErrorCategory::Protocol;
        }
    }
    if (json.contains("message") && json["message"].is_string()) {
        error.message = json["message"].get<std::string>();
    }
    if (json.contains("data") && !json["data"].is_null()) {
        error.message += " (" + (json["data"].is_string()
                                     ? json["data"].get<std::string>()
                                     : json["data"].dump()) + ")";
    }
    return error;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    if (rpc_code.has_value()) {
        oss << " (RPC " << *rpc_code << ")";
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
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    if (rpc_code.has_value()) {
        body["rpc_code"] = *rpc_code;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace mcp_bridge
