#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "memcp/transport.hpp"

namespace memcp {

inline constexpr std::size_t kDefaultMaxLineLength = std::size_t{8} << 20;  // 8 MiB

struct StdioTransportConfig {
    std::istream* input{nullptr};
    std::ostream* output{nullptr};
    bool auto_flush{true};
    std::size_t max_line_length{kDefaultMaxLineLength};
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioTransport
// ─────────────────────────────────────────────────────────────────────────────
// Newline-delimited framing: one JSON message per line in both directions.
// Blocking and single-threaded; the caller drives read_line()/send() in turn.

class StdioTransport {
public:
    /// Throws std::invalid_argument when either stream is null.
    explicit StdioTransport(StdioTransportConfig config);

    /// Next line without its terminator (a trailing '\r' is dropped too).
    /// Lines longer than max_line_length are consumed and reported as a
    /// Protocol error; the stream stays usable.
    [[nodiscard]] TransportResult<std::string> read_line();

    /// Writes the compact encoding of message followed by '\n'.
    [[nodiscard]] TransportResult<void> send(const Json& message);

    [[nodiscard]] const StdioTransportConfig& config() const noexcept;

private:
    StdioTransportConfig config_;
};

}  // namespace memcp
