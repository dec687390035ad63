#include "memcp/server/stdio_server.hpp"

#include "memcp/json/fast_json.hpp"
#include "memcp/log/logger.hpp"

#include <format>

namespace memcp {
namespace {

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

Json parse_error_response() {
    return make_error_response(nullptr, JsonRpcError{ErrorCode::ParseError, "Parse error"});
}

// Id of a payload that failed request decoding, when it is still usable.
Json recoverable_id(const Json& payload) {
    if (payload.is_object() == false) {
        return nullptr;
    }
    const auto it = payload.find("id");
    if ((it != payload.end()) && (it->is_string() || it->is_number())) {
        return *it;
    }
    return nullptr;
}

}  // namespace

StdioServer::StdioServer(StdioTransport& transport, Dispatcher& dispatcher)
    : transport_(transport)
    , dispatcher_(dispatcher)
{}

void StdioServer::request_stop() noexcept {
    stop_requested_.store(true, std::memory_order_release);
}

bool StdioServer::stop_requested() const noexcept {
    return stop_requested_.load(std::memory_order_acquire);
}

std::optional<Json> StdioServer::process_line(std::string_view line) {
    const std::string_view text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    MEMCP_LOG_TRACE(std::format("<- {}", text));

    auto parsed = fast_parse(text);
    if (parsed.has_value() == false) {
        MEMCP_LOG_ERROR(std::format("Failed to parse JSON: {}", parsed.error().message));
        return parse_error_response();
    }

    auto request = JsonRpcRequest::from_json(*parsed);
    if (request.has_value() == false) {
        const auto& error = request.error();
        MEMCP_LOG_ERROR(std::format("Invalid request: {}", error.message));
        const bool bad_params = (error.rpc_code() == ErrorCode::InvalidParams);
        const std::string_view prefix = bad_params ? "Invalid params" : "Invalid Request";
        return make_error_response(recoverable_id(*parsed), JsonRpcError{
            error.rpc_code(),
            std::format("{}: {}", prefix, error.message)});
    }

    try {
        return dispatcher_.dispatch(*request);
    } catch (const std::exception& e) {
        MEMCP_LOG_ERROR(std::format("Unhandled error in {}: {}", request->method(), e.what()));
        return make_error_response(request->response_id(), JsonRpcError{
            ErrorCode::InternalError,
            std::format("Internal error: {}", e.what())});
    } catch (...) {
        MEMCP_LOG_ERROR(std::format("Unhandled non-standard exception in {}", request->method()));
        return make_error_response(request->response_id(), JsonRpcError{
            ErrorCode::InternalError,
            "Internal error: unknown exception"});
    }
}

StopReason StdioServer::run() {
    while (stop_requested() == false) {
        auto line = transport_.read_line();
        if (line.has_value() == false) {
            const auto& error = line.error();
            switch (error.category) {
                case TransportError::Category::Closed:
                    return StopReason::EndOfStream;
                case TransportError::Category::Interrupted:
                    return StopReason::Interrupted;
                case TransportError::Category::Protocol:
                case TransportError::Category::Io:
                    break;
            }
            MEMCP_LOG_ERROR(std::format("Rejected input line: {}", error.message));
            if (transport_.send(parse_error_response()).has_value() == false) {
                return StopReason::OutputFailed;
            }
            ++responses_sent_;
            continue;
        }

        auto response = process_line(*line);
        if (response.has_value() == false) {
            continue;
        }

        MEMCP_LOG_TRACE(std::format("-> {}", response->dump(-1, ' ', false, Json::error_handler_t::replace)));
        auto sent = transport_.send(*response);
        if (sent.has_value() == false) {
            MEMCP_LOG_ERROR(std::format("Failed to write response: {}", sent.error().message));
            return StopReason::OutputFailed;
        }
        ++responses_sent_;
    }
    return StopReason::StopRequested;
}

}  // namespace memcp
