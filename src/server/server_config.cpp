#include "memcp/server/server_config.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>

namespace memcp {
namespace {

constexpr std::array<std::string_view, 11> kAllowedKeys = {
    "server_name",
    "server_version",
    "protocol_version",
    "default_user_id",
    "user_id_env",
    "fallback_user_id",
    "log_level",
    "log_file",
    "max_line_length",
    "max_sanitize_passes",
    "engine_capacity"
};

bool is_allowed_key(std::string_view key) {
    for (const auto allowed : kAllowedKeys) {
        if (allowed == key) {
            return true;
        }
    }
    return false;
}

std::string allowed_keys_list() {
    std::string list;
    for (const auto key : kAllowedKeys) {
        if (list.empty() == false) {
            list += ", ";
        }
        list += key;
    }
    return list;
}

tl::unexpected<ConfigError> invalid_value(std::string_view key, std::string_view expected) {
    return tl::unexpected(ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("Config key '{}' must be {}", key, expected)});
}

ConfigResult<std::string> string_value(const Json& json, std::string_view key) {
    if (json.is_string() == false) {
        return invalid_value(key, "a string");
    }
    return json.get<std::string>();
}

ConfigResult<std::string> non_empty_string_value(const Json& json, std::string_view key) {
    auto text = string_value(json, key);
    if (text.has_value() && text->empty()) {
        return invalid_value(key, "a non-empty string");
    }
    return text;
}

ConfigResult<std::size_t> size_value(const Json& json, std::string_view key) {
    if (json.is_number_unsigned()) {
        return json.get<std::size_t>();
    }
    if (json.is_number_integer() && (json.get<std::int64_t>() >= 0)) {
        return static_cast<std::size_t>(json.get<std::int64_t>());
    }
    return invalid_value(key, "a non-negative integer");
}

ConfigResult<LogLevel> log_level_value(std::string_view text, std::string_view source) {
    const auto level = parse_log_level(text);
    if (!level) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::format("Invalid log level '{}' in {} (expected trace, debug, info, warn, error, fatal or off)",
                        text, source)});
    }
    return *level;
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::optional<std::string> environment(const char* name) {
    const char* value = std::getenv(name);
    if ((value == nullptr) || (*value == '\0')) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

ConfigResult<ServerConfig> ServerConfig::from_json(const Json& json, ServerConfig base) {
    if (json.is_object() == false) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            "Config must be a JSON object"});
    }

    ServerConfig config = std::move(base);

    for (const auto& [key, value] : json.items()) {
        if (is_allowed_key(key) == false) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::UnknownKey,
                std::format("Unknown config key '{}' (allowed: {})", key, allowed_keys_list())});
        }

        if (key == "server_name") {
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.server_name = std::move(*text);
        } else if (key == "server_version") {
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.server_version = std::move(*text);
        } else if (key == "protocol_version") {
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.protocol_version = std::move(*text);
        } else if (key == "default_user_id") {
            if (value.is_null()) {
                config.default_user_id.reset();
                continue;
            }
            auto text = string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            if (text->empty()) {
                config.default_user_id.reset();
            } else {
                config.default_user_id = std::move(*text);
            }
        } else if (key == "user_id_env") {
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.user_id_env = std::move(*text);
        } else if (key == "fallback_user_id") {
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.fallback_user_id = std::move(*text);
        } else if (key == "log_level") {
            auto text = string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            auto level = log_level_value(*text, "config file");
            if (!level) return tl::unexpected(level.error());
            config.log_level = *level;
        } else if (key == "log_file") {
            if (value.is_null()) {
                config.log_file.reset();
                continue;
            }
            auto text = non_empty_string_value(value, key);
            if (!text) return tl::unexpected(text.error());
            config.log_file = std::move(*text);
        } else if (key == "max_line_length") {
            auto size = size_value(value, key);
            if (!size) return tl::unexpected(size.error());
            if (*size == 0) {
                return invalid_value(key, "greater than zero");
            }
            config.max_line_length = *size;
        } else if (key == "max_sanitize_passes") {
            auto size = size_value(value, key);
            if (!size) return tl::unexpected(size.error());
            if (*size == 0) {
                return invalid_value(key, "at least 1");
            }
            config.max_sanitize_passes = *size;
        } else if (key == "engine_capacity") {
            auto size = size_value(value, key);
            if (!size) return tl::unexpected(size.error());
            config.engine_capacity = *size;
        }
    }

    return config;
}

ConfigResult<ServerConfig> ServerConfig::load_file(const std::string& path, ServerConfig base) {
    std::ifstream file(path);
    if (file.is_open() == false) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            std::format("Cannot open config file: {}", path)});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Json json;
    try {
        json = Json::parse(buffer.str());
    } catch (const Json::parse_error& e) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            std::format("Invalid JSON in config file {}: {}", path, e.what())});
    }

    return from_json(json, std::move(base));
}

ConfigResult<void> ServerConfig::apply_environment() {
    if (const auto level_text = environment(kLogLevelEnv)) {
        auto level = log_level_value(*level_text, kLogLevelEnv);
        if (!level) {
            return tl::unexpected(level.error());
        }
        log_level = *level;
    }
    if (auto file = environment(kLogFileEnv)) {
        log_file = std::move(*file);
    }
    if (auto user_id = environment(kDefaultUserIdOverrideEnv)) {
        default_user_id = std::move(*user_id);
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// .env Loading
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<std::size_t> load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (file.is_open() == false) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            std::format("Cannot open env file: {}", path)});
    }

    std::size_t assigned = 0;
    std::size_t line_number = 0;
    std::string raw;
    while (std::getline(file, raw)) {
        ++line_number;
        std::string_view line = trim(raw);
        if (line.empty() || (line.front() == '#')) {
            continue;
        }

        constexpr std::string_view kExport = "export ";
        if (line.starts_with(kExport)) {
            line = trim(line.substr(kExport.size()));
        }

        const auto equals = line.find('=');
        if ((equals == std::string_view::npos) || (equals == 0)) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::ParseError,
                std::format("{}:{}: expected KEY=VALUE", path, line_number)});
        }

        const std::string key(trim(line.substr(0, equals)));
        std::string_view value = trim(line.substr(equals + 1));
        const bool quoted = (value.size() >= 2)
            && ((value.front() == '"') || (value.front() == '\''))
            && (value.back() == value.front());
        if (quoted) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), std::string(value).c_str(), 0) != 0) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                std::format("{}:{}: cannot set environment variable '{}'", path, line_number, key)});
        }
        ++assigned;
    }

    return assigned;
}

}  // namespace memcp
