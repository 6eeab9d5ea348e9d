#include <toolserve/config/config_loader.hpp>
#include <toolserve/core/log.hpp>
#include <toolserve/core/terminal.hpp>
#include <toolserve/core/version.hpp>
#include <toolserve/mcp/builtin_tools.hpp>
#include <toolserve/mcp/http_server.hpp>
#include <toolserve/mcp/server_context.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr const char* kComponent = "main";

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_restart_requested{false};

extern "C" void HandleShutdownSignal(int /*signum*/) {
    g_shutdown_requested = true;
}

#ifndef _WIN32
extern "C" void HandleRestartSignal(int /*signum*/) {
    g_restart_requested = true;
}
#endif

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);
#ifndef _WIN32
    std::signal(SIGHUP, HandleRestartSignal);
#endif
}

void PrintError(const toolserve::Error& error, bool json) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Check for --version anywhere on the command line.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << toolserve::kServerName << " " << toolserve::kVersion << "\n";
            return true;
        }
    }
    return false;
}

toolserve::LogLevel EffectiveLogLevel(const toolserve::ServerConfig& config) {
    if (config.verbose) return toolserve::LogLevel::Debug;
    if (config.quiet) return toolserve::LogLevel::Warn;
    return config.log_level;
}

// Install the global logger. Fails only when log_file cannot be opened.
toolserve::Result<void, toolserve::Error> InitLogging(
    const toolserve::ServerConfig& config, bool force_color, bool force_no_color) {
    using namespace toolserve;

    std::unique_ptr<ILogSink> sink;
    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file);
        if (!file_sink->IsOpen()) {
            return Result<void, Error>::Err(Error{
                "Logging", "Cannot open log file", ErrorCategory::Io,
                *config.log_file});
        }
        sink = std::move(file_sink);
    } else if (config.json_log) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ConsoleSink>(
            ResolveLogColor(force_color, force_no_color));
    }
    InitGlobalLogger(std::move(sink), EffectiveLogLevel(config));
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolserve;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Step 1: CLI flags (argparse handles --help and exits).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    auto cli = std::move(cli_result).Value();

    // Step 2: YAML config, overridden by explicit CLI flags.
    ServerConfig config = cli.config;
    if (cli.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), cli.config.json_log);
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(yaml_result.Value(), cli.config);
    }

    // Step 3: Validate.
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_log);
        return valid.Error().ExitCode();
    }

    // Step 4: Logging.
    auto logging = InitLogging(config, cli.force_color, cli.force_no_color);
    if (logging.IsErr()) {
        PrintError(logging.Error(), config.json_log);
        return logging.Error().ExitCode();
    }

    // Step 5: Server context and listener. Built-in tools are re-registered
    // on every (re)start.
    ServerContext context(ServerInfo::Default(config.host_version));
    BuiltinToolOptions tool_options{config.checks_folder};
    auto installer = [&context, tool_options](ToolRegistry& registry) {
        RegisterBuiltinTools(registry, tool_options, context);
    };

    HttpServerOptions server_options;
    server_options.bind_address = config.bind_address;
    server_options.worker_threads = config.worker_threads;
    server_options.read_timeout_seconds = config.read_timeout_seconds;

    McpHttpServer server(context, installer, server_options);
    auto started = server.Start(config.port);
    if (started.IsErr()) {
        PrintError(started.Error(), config.json_log);
        return started.Error().ExitCode();
    }

    // Step 6: Serve until SIGINT/SIGTERM. SIGHUP restarts the listener.
    InstallSignalHandlers();
    while (!g_shutdown_requested.load()) {
        if (g_restart_requested.exchange(false)) {
            LogInfo(kComponent, "Restart requested");
            auto restarted = server.Restart(config.port);
            if (restarted.IsErr()) {
                PrintError(restarted.Error(), config.json_log);
                return restarted.Error().ExitCode();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LogInfo(kComponent, "Shutting down after " +
                            std::to_string(server.RequestCount()) + " requests");
    server.Stop();
    return kExitSuccess;
}
