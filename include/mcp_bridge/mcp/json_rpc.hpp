#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 framing helpers.
//
// Messages are single JSON objects, one per line on a pipe transport.
// ---------------------------------------------------------------------------

constexpr int kRpcParseError = -32700;
constexpr int kRpcInvalidRequest = -32600;
constexpr int kRpcMethodNotFound = -32601;
constexpr int kRpcInvalidParams = -32602;
constexpr int kRpcInternalError = -32603;

enum class RpcMessageKind {
    Response,      // has id and result
    ErrorResponse, // has id and error
    Request,       // has id and method (peer-initiated)
    Notification,  // has method, no id
    Invalid,
};

/// Build a request object. A null `params` is sent as {}.
nlohmann::json MakeRpcRequest(std::int64_t id,
                              const std::string& method,
                              const nlohmann::json& params);

/// Build a notification object (no id). A null `params` is sent as {}.
nlohmann::json MakeRpcNotification(const std::string& method,
                                   const nlohmann::json& params);

nlohmann::json MakeRpcResult(const nlohmann::json& id,
                             const nlohmann::json& result);

nlohmann::json MakeRpcError(const nlohmann::json& id,
                            int code,
                            const std::string& message);

RpcMessageKind ClassifyRpcMessage(const nlohmann::json& message);

/// Integer id of a response, if it carries one. Numeric strings are
/// accepted since some providers echo ids as strings.
std::optional<std::int64_t> RpcResponseId(const nlohmann::json& message);

} // namespace mcp_bridge
