#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>

#include <tl/expected.hpp>

namespace memcp {

using Json = nlohmann::ordered_json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Closed,       // Peer closed the stream (EOF)
        Interrupted,  // A blocking read was interrupted by a signal
        Protocol,     // Framing violation (line too long)
        Io            // Stream failure while writing
    };

    Category category{};
    std::string message;
};

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace memcp
