#include "memcp/server/identity.hpp"

#include "memcp/log/logger.hpp"

#include <cstdlib>
#include <format>

namespace memcp {
namespace {

// Strings are taken as-is and integers by their decimal text; anything else
// (including an empty string) counts as absent.
std::optional<std::string> identifier(const Json& arguments, const char* key) {
    if (arguments.is_object() == false) {
        return std::nullopt;
    }
    const auto it = arguments.find(key);
    if (it == arguments.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->dump();
    }
    if (it->is_string() == false) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Providers
// ─────────────────────────────────────────────────────────────────────────────

EnvironmentIdentityProvider::EnvironmentIdentityProvider(std::string variable)
    : variable_(std::move(variable))
{}

std::string EnvironmentIdentityProvider::default_user_id() {
    const char* value = std::getenv(variable_.c_str());
    if ((value == nullptr) || (value[0] == '\0')) {
        throw IdentityError(std::format("environment variable {} is not set", variable_));
    }
    return std::string(value);
}

StaticIdentityProvider::StaticIdentityProvider(std::string user_id)
    : user_id_(std::move(user_id))
{}

std::string StaticIdentityProvider::default_user_id() {
    if (user_id_.empty()) {
        throw IdentityError("configured default user id is empty");
    }
    return user_id_;
}

// ─────────────────────────────────────────────────────────────────────────────
// IdentityResolver
// ─────────────────────────────────────────────────────────────────────────────

IdentityResolver::IdentityResolver(std::shared_ptr<IdentityProvider> provider,
                                   std::string fallback_user_id)
    : provider_(std::move(provider))
    , fallback_user_id_(std::move(fallback_user_id))
{
    if (fallback_user_id_.empty()) {
        fallback_user_id_ = kFallbackUserId;
    }
}

const std::string& IdentityResolver::default_user_id() {
    std::call_once(default_once_, [this]() {
        if (!provider_) {
            default_user_id_ = fallback_user_id_;
            return;
        }
        try {
            std::string user_id = provider_->default_user_id();
            if (user_id.empty()) {
                throw IdentityError("identity provider returned an empty user id");
            }
            default_user_id_ = std::move(user_id);
        } catch (const std::exception& e) {
            MEMCP_LOG_WARN(std::format("Failed to get user_id from config: {}, using default", e.what()));
            default_user_id_ = fallback_user_id_;
        }
    });
    return default_user_id_;
}

Identity IdentityResolver::resolve(const Json& arguments) {
    Identity identity;
    identity.agent_id = identifier(arguments, "agent_id");

    if (auto user_id = identifier(arguments, "user_id")) {
        identity.user_id = std::move(*user_id);
        return identity;
    }

    identity.user_id = default_user_id();
    MEMCP_LOG_DEBUG(std::format("Using default user_id: {}", identity.user_id));
    return identity;
}

}  // namespace memcp
