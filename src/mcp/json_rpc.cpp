#include <mcp_bridge/mcp/json_rpc.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_bridge {

namespace {

nlohmann::json ParamsOrEmpty(const nlohmann::json& params) {
    return params.is_null() ? nlohmann::json::object() : params;
}

} // anonymous namespace

nlohmann::json MakeRpcRequest(std::int64_t id,
                              const std::string& method,
                              const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", ParamsOrEmpty(params)}
    };
}

nlohmann::json MakeRpcNotification(const std::string& method,
                                   const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", ParamsOrEmpty(params)}
    };
}

nlohmann::json MakeRpcResult(const nlohmann::json& id,
                             const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeRpcError(const nlohmann::json& id,
                            int code,
                            const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

RpcMessageKind ClassifyRpcMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return RpcMessageKind::Invalid;
    }
    const bool has_id = message.contains("id") && !message["id"].is_null();
    const bool has_method = message.contains("method") && message["method"].is_string();

    if (has_method) {
        return has_id ? RpcMessageKind::Request : RpcMessageKind::Notification;
    }
    if (has_id && message.contains("error")) {
        return RpcMessageKind::ErrorResponse;
    }
    if (has_id && message.contains("result")) {
        return RpcMessageKind::Response;
    }
    return RpcMessageKind::Invalid;
}

std::optional<std::int64_t> RpcResponseId(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }
    const auto& id = message["id"];
    if (id.is_number_integer()) {
        return id.get<std::int64_t>();
    }
    if (id.is_string()) {
        const auto& s = id.get_ref<const std::string&>();
        if (s.empty() || s.size() > 18 ||
            !std::all_of(s.begin(), s.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        return std::stoll(s);
    }
    return std::nullopt;
}

} // namespace mcp_bridge
