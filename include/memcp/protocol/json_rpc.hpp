#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace memcp {

using Json = nlohmann::ordered_json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

struct RequestError {
    enum class Code {
        NotAnObject,
        InvalidMethod,
        InvalidId,
        InvalidParams
    };

    Code code{Code::NotAnObject};
    std::string message;

    /// JSON-RPC error code reported for this decoding failure.
    [[nodiscard]] int rpc_code() const noexcept;
};

template <typename T>
using RequestResult = tl::expected<T, RequestError>;

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────
// Decoding is lenient the way MCP stdio clients expect: "jsonrpc" is not
// required, "params" may be absent or null (both read as {}), and "id" may be
// absent. An absent id is answered with a null id.

class JsonRpcRequest {
public:
    explicit JsonRpcRequest(std::string method,
                            Json params = Json::object(),
                            std::optional<Json> id = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const Json& params() const noexcept;
    [[nodiscard]] const std::optional<Json>& id() const noexcept;

    /// The id to echo in a response: the request's id, or null.
    [[nodiscard]] Json response_id() const;

    [[nodiscard]] Json to_json() const;
    static RequestResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    Json params_;
    std::optional<Json> id_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
};

/// {"jsonrpc": "2.0", "id": id, "result": result}
[[nodiscard]] Json make_result_response(Json id, Json result);

/// {"jsonrpc": "2.0", "id": id, "error": {...}}
[[nodiscard]] Json make_error_response(Json id, const JsonRpcError& error);

}  // namespace memcp
