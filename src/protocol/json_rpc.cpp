#include "memcp/protocol/json_rpc.hpp"

namespace memcp {
namespace {

bool is_valid_id(const Json& node) {
    const bool is_string = node.is_string();
    const bool is_number = node.is_number();
    const bool is_null = node.is_null();
    return (is_string == true) || (is_number == true) || (is_null == true);
}

}  // namespace

int RequestError::rpc_code() const noexcept {
    switch (code) {
        case Code::InvalidParams:
            return ErrorCode::InvalidParams;
        case Code::NotAnObject:
        case Code::InvalidMethod:
        case Code::InvalidId:
            return ErrorCode::InvalidRequest;
    }
    return ErrorCode::InvalidRequest;
}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               Json params,
                               std::optional<Json> id)
    : method_(std::move(method)),
      params_(std::move(params)),
      id_(std::move(id)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const Json& JsonRpcRequest::params() const noexcept {
    return params_;
}

const std::optional<Json>& JsonRpcRequest::id() const noexcept {
    return id_;
}

Json JsonRpcRequest::response_id() const {
    return id_.value_or(Json(nullptr));
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (id_.has_value()) {
        payload["id"] = *id_;
    }
    payload["params"] = params_;
    return payload;
}

RequestResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(RequestError{
            RequestError::Code::NotAnObject,
            "payload must be a JSON object"});
    }

    const auto method_it = payload.find("method");
    const bool has_method = (method_it != payload.end());
    if ((has_method == false) || (method_it->is_string() == false)) {
        return tl::unexpected(RequestError{
            RequestError::Code::InvalidMethod,
            "method must be a string"});
    }

    std::optional<Json> parsed_id;
    const auto id_it = payload.find("id");
    if (id_it != payload.end()) {
        if (is_valid_id(*id_it) == false) {
            return tl::unexpected(RequestError{
                RequestError::Code::InvalidId,
                "id must be a string, number or null"});
        }
        parsed_id = *id_it;
    }

    Json parsed_params = Json::object();
    const auto params_it = payload.find("params");
    if ((params_it != payload.end()) && (params_it->is_null() == false)) {
        if (params_it->is_object() == false) {
            return tl::unexpected(RequestError{
                RequestError::Code::InvalidParams,
                "params must be an object"});
        }
        parsed_params = *params_it;
    }

    return JsonRpcRequest(
        method_it->get<std::string>(),
        std::move(parsed_params),
        std::move(parsed_id));
}

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

Json make_result_response(Json id, Json result) {
    Json response = Json::object();
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = std::move(id);
    response["result"] = std::move(result);
    return response;
}

Json make_error_response(Json id, const JsonRpcError& error) {
    Json response = Json::object();
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = std::move(id);
    response["error"] = error.to_json();
    return response;
}

}  // namespace memcp
