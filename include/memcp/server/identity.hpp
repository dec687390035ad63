#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Identity Resolver
// ═══════════════════════════════════════════════════════════════════════════
// Every memory operation is scoped to a user. A tool call may name the user
// through its "user_id" argument (a string, or an integer taken by its decimal
// text). When it does not, or the string is empty, the process-wide default
// identity is used.
//
// The default comes from an IdentityProvider. It is computed on first use
// and then reused for the life of the resolver. If the provider fails, the
// fallback literal becomes the default; resolution itself never fails.

#include "memcp/error.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace memcp {

using Json = nlohmann::ordered_json;

inline constexpr const char* kFallbackUserId = "mcp_user";

struct Identity {
    std::string user_id;
    std::optional<std::string> agent_id;
};

// ─────────────────────────────────────────────────────────────────────────────
// Providers
// ─────────────────────────────────────────────────────────────────────────────

class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;

    /// Default user id. Throws IdentityError (or any exception) when none is
    /// available.
    [[nodiscard]] virtual std::string default_user_id() = 0;
};

/// Reads the default user id from an environment variable.
class EnvironmentIdentityProvider final : public IdentityProvider {
public:
    explicit EnvironmentIdentityProvider(std::string variable);

    [[nodiscard]] std::string default_user_id() override;

    [[nodiscard]] const std::string& variable() const noexcept { return variable_; }

private:
    std::string variable_;
};

/// Fixed default user id (from configuration).
class StaticIdentityProvider final : public IdentityProvider {
public:
    explicit StaticIdentityProvider(std::string user_id);

    [[nodiscard]] std::string default_user_id() override;

private:
    std::string user_id_;
};

// ─────────────────────────────────────────────────────────────────────────────
// IdentityResolver
// ─────────────────────────────────────────────────────────────────────────────

class IdentityResolver {
public:
    /// A null provider means the fallback is always the default.
    explicit IdentityResolver(std::shared_ptr<IdentityProvider> provider,
                              std::string fallback_user_id = kFallbackUserId);

    IdentityResolver(const IdentityResolver&) = delete;
    IdentityResolver& operator=(const IdentityResolver&) = delete;

    /// Effective identity for a tool call's arguments. Never throws for a
    /// JSON object; the result always has a non-empty user id.
    [[nodiscard]] Identity resolve(const Json& arguments);

    /// The process-wide default, computing it on first call.
    [[nodiscard]] const std::string& default_user_id();

private:
    std::shared_ptr<IdentityProvider> provider_;
    std::string fallback_user_id_;
    std::once_flag default_once_;
    std::string default_user_id_;
};

}  // namespace memcp
