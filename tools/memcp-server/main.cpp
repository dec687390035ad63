// ─────────────────────────────────────────────────────────────────────────────
// memcp-server - MCP Memory Server over stdio
// ─────────────────────────────────────────────────────────────────────────────
// Serves the memcp memory tools to an MCP client over stdin/stdout.
//
// Usage:
//   memcp-server
//   memcp-server --config memcp.json --log-level debug
//   memcp-server --env .env --log-file /tmp/memcp.log
//
// stdout carries the JSON-RPC stream only; all logging goes to stderr (and
// the optional log file).

#include <cxxopts.hpp>
#include <asio.hpp>

#include "memcp/engine/engine_binding.hpp"
#include "memcp/engine/in_memory_engine.hpp"
#include "memcp/engine/instrumented_engine.hpp"
#include "memcp/log/spdlog_logger.hpp"
#include "memcp/server/dispatcher.hpp"
#include "memcp/server/identity.hpp"
#include "memcp/server/server_config.hpp"
#include "memcp/server/stdio_server.hpp"
#include "memcp/transport/stdio_transport.hpp"

#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

using namespace memcp;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsageError = 2;

// ═══════════════════════════════════════════════════════════════════════════
// Shutdown Signals
// ═══════════════════════════════════════════════════════════════════════════
// SIGINT/SIGTERM are watched by an asio::signal_set on a background thread.
// That thread blocks both signals so the kernel delivers them to the main
// thread, whose blocking read then fails with EINTR and ends the loop. The
// handler also requests a stop for the case where the read was not blocked.

class ShutdownSignals {
public:
    explicit ShutdownSignals(StdioServer& server)
        : signals_(io_, SIGINT, SIGTERM)
    {
        signals_.async_wait([&server](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            MEMCP_LOG_INFO(std::format("Received signal {}", signal_number));
            server.request_stop();
        });

        sigset_t blocked;
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGINT);
        sigaddset(&blocked, SIGTERM);

        sigset_t previous;
        pthread_sigmask(SIG_BLOCK, &blocked, &previous);
        thread_ = std::thread([this] { io_.run(); });
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    }

    ~ShutdownSignals() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

private:
    asio::io_context io_;
    asio::signal_set signals_;
    std::thread thread_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<ServerConfig> resolve_config(const cxxopts::ParseResult& result) {
    ServerConfig config;

    if (result.count("config")) {
        auto loaded = ServerConfig::load_file(result["config"].as<std::string>(), config);
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (result.count("env")) {
        auto loaded = load_env_file(result["env"].as<std::string>());
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
    }

    auto environment = config.apply_environment();
    if (!environment) {
        return tl::unexpected(environment.error());
    }

    if (result.count("log-level")) {
        const auto text = result["log-level"].as<std::string>();
        const auto level = parse_log_level(text);
        if (!level) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                std::format("Invalid --log-level '{}'", text)});
        }
        config.log_level = *level;
    }

    if (result.count("log-file")) {
        config.log_file = result["log-file"].as<std::string>();
    }

    return config;
}

std::unique_ptr<ILogger> make_logger(const ServerConfig& config) {
    if (config.log_file) {
        return make_spdlog_stderr_file_logger(*config.log_file, config.log_level);
    }
    return make_spdlog_stderr_logger(config.log_level);
}

std::shared_ptr<IdentityProvider> make_identity_provider(const ServerConfig& config) {
    if (config.default_user_id) {
        return std::make_shared<StaticIdentityProvider>(*config.default_user_id);
    }
    return std::make_shared<EnvironmentIdentityProvider>(config.user_id_env);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("memcp-server", "MCP memory server over stdio");

    options.add_options()
        ("c,config", "JSON configuration file", cxxopts::value<std::string>())
        ("e,env", "Environment file (KEY=VALUE lines)", cxxopts::value<std::string>())
        ("l,log-level", "Log level: trace, debug, info, warn, error, fatal, off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("v,version", "Print version")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options.help() << "\n";
        return kExitUsageError;
    }

    if (result.count("help")) {
        std::cout << options.help() << "\n";
        return kExitOk;
    }

    auto config = resolve_config(result);
    if (!config) {
        std::cerr << "Configuration error: " << config.error().message << "\n";
        return kExitConfigError;
    }

    if (result.count("version")) {
        std::cout << config->server_name << " " << config->server_version
                  << " (MCP " << config->protocol_version << ")\n";
        return kExitOk;
    }

    try {
        set_logger(make_logger(*config));
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file: " << e.what() << "\n";
        return kExitConfigError;
    }

    const std::size_t capacity = config->engine_capacity;
    std::shared_ptr<InstrumentedEngine> instrumented;
    EngineBinding binding([capacity, &instrumented]() -> std::shared_ptr<MemoryEngine> {
        InMemoryEngineConfig engine_config;
        engine_config.capacity = capacity;
        instrumented = std::make_shared<InstrumentedEngine>(
            std::make_shared<InMemoryEngine>(std::move(engine_config)));
        return instrumented;
    });

    IdentityResolver identity(make_identity_provider(*config), config->fallback_user_id);

    DispatcherConfig dispatcher_config;
    dispatcher_config.server_info = Implementation{config->server_name, config->server_version};
    dispatcher_config.protocol_version = config->protocol_version;
    dispatcher_config.max_sanitize_passes = config->max_sanitize_passes;
    Dispatcher dispatcher(std::move(dispatcher_config), binding, identity);

    StdioTransportConfig transport_config;
    transport_config.input = &std::cin;
    transport_config.output = &std::cout;
    transport_config.max_line_length = config->max_line_length;
    StdioTransport transport(transport_config);

    StdioServer server(transport, dispatcher);

    MEMCP_LOG_INFO("Starting memcp MCP server...");
    StopReason reason = StopReason::EndOfStream;
    {
        ShutdownSignals signals(server);
        reason = server.run();
    }
    MEMCP_LOG_INFO(std::format("Server loop ended: {} ({} responses)",
                               to_string(reason), server.responses_sent()));
    if (instrumented) {
        instrumented->log_summary();
    }
    MEMCP_LOG_INFO("Server shutting down...");

    // Closes the log file
    set_logger(nullptr);
    return kExitOk;
}
