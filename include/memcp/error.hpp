#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Application Errors
// ═══════════════════════════════════════════════════════════════════════════
// Failures that a tool call reports back to the client inside its result
// payload. Each carries a short kind string ("ValidationError", "NotFound",
// ...) that is exposed to the client next to the message.

#include <stdexcept>
#include <string>
#include <string_view>

namespace memcp {

class Error : public std::runtime_error {
public:
    Error(std::string kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(std::move(kind))
    {}

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

/// Missing or malformed tool argument
class ValidationError final : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error("ValidationError", message)
    {}
};

/// tools/call named a tool that is not in the catalog
class UnknownToolError final : public Error {
public:
    explicit UnknownToolError(const std::string& message)
        : Error("UnknownToolError", message)
    {}
};

/// Default identity could not be determined
class IdentityError final : public Error {
public:
    explicit IdentityError(const std::string& message)
        : Error("IdentityError", message)
    {}
};

/// Kind string reported to the client for an arbitrary exception.
[[nodiscard]] std::string error_kind(const std::exception& e);

}  // namespace memcp
