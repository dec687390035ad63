#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Server Loop
// ═══════════════════════════════════════════════════════════════════════════
// Read-decode-dispatch-encode-write, one line at a time, strictly in arrival
// order. Per-line failures are answered and the loop continues:
//
//   blank line                  skipped, no output
//   not JSON                    error -32700 "Parse error", id null
//   JSON but not a request      error -32600 (-32602 for bad params)
//   notification                no output
//   handler exception           error -32603 "Internal error: <what>"
//
// The loop ends only when the input closes, a read is interrupted by a
// signal, request_stop() is called, or the output stream fails.

#include "memcp/server/dispatcher.hpp"
#include "memcp/transport/stdio_transport.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string_view>

namespace memcp {

enum class StopReason {
    EndOfStream,
    Interrupted,
    StopRequested,
    OutputFailed
};

[[nodiscard]] constexpr std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::EndOfStream:   return "end of stream";
        case StopReason::Interrupted:   return "interrupted";
        case StopReason::StopRequested: return "stop requested";
        case StopReason::OutputFailed:  return "output failed";
    }
    return "unknown";
}

class StdioServer {
public:
    StdioServer(StdioTransport& transport, Dispatcher& dispatcher);

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /// Response for one input line, or nullopt when nothing is to be written.
    [[nodiscard]] std::optional<Json> process_line(std::string_view line);

    StopReason run();

    /// Safe to call from another thread; takes effect before the next read.
    void request_stop() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept;

    [[nodiscard]] std::size_t responses_sent() const noexcept { return responses_sent_; }

private:
    StdioTransport& transport_;
    Dispatcher& dispatcher_;
    std::atomic<bool> stop_requested_{false};
    std::size_t responses_sent_{0};
};

}  // namespace memcp
