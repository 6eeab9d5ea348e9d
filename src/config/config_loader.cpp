#include <toolserve/config/config_loader.hpp>

#include <toolserve/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <limits>
#include <stdexcept>

namespace toolserve {

namespace {

constexpr int kMaxWorkerThreads = 256;

Result<LogLevel, Error> ParseLevelField(const std::string& value,
                                        const std::string& source) {
    auto level = ParseLogLevel(value);
    if (!level.has_value()) {
        return Result<LogLevel, Error>::Err(Error::Config(
            "Invalid " + source + " '" + value +
            "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<uint16_t, Error> ToPort(int value, const std::string& source) {
    if (value < 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(Error::Config(
            "Invalid " + source + ": " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            Error::Config("Failed to parse YAML file: " + std::string(e.what())));
    }

    ServerConfig config;
    try {
        // -- Listener --
        if (root["port"]) {
            auto port = ToPort(root["port"].as<int>(), "port");
            if (port.IsErr()) {
                return Result<ServerConfig, Error>::Err(port.Error());
            }
            config.port = port.Value();
        }
        if (root["bind_address"]) {
            config.bind_address = root["bind_address"].as<std::string>();
        }
        if (root["worker_threads"]) {
            config.worker_threads = root["worker_threads"].as<int>();
        }
        if (root["read_timeout"]) {
            config.read_timeout_seconds = root["read_timeout"].as<int>();
        }

        // -- Host / tools --
        if (root["host_version"]) {
            config.host_version = root["host_version"].as<std::string>();
        }
        if (root["checks_folder"]) {
            auto folder = root["checks_folder"].as<std::string>();
            if (!folder.empty()) {
                config.checks_folder = folder;
            }
        }

        // -- Logging --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto level = ParseLevelField(root["log_level"].as<std::string>(),
                                         "log_level");
            if (level.IsErr()) {
                return Result<ServerConfig, Error>::Err(level.Error());
            }
            config.log_level = level.Value();
        }
        if (root["json_log"]) {
            config.json_log = root["json_log"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        // Scalar conversion failures (e.g. port: "abc").
        return Result<ServerConfig, Error>::Err(
            Error::Config("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    // --version is handled by main before parsing, so only --help is added
    // here; -v stays free for --verbose.
    argparse::ArgumentParser program("toolserve", kVersion,
                                     argparse::default_arguments::help);

    // Listener
    program.add_argument("-p", "--port")
        .help("TCP port for the MCP endpoint")
        .scan<'i', int>();
    program.add_argument("--bind")
        .help("Address to bind (default 127.0.0.1)");
    program.add_argument("--workers")
        .help("Number of request worker threads")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("HTTP read/write timeout in seconds")
        .scan<'i', int>();

    // Host / tools
    program.add_argument("--host-version")
        .help("Host version string reported by /health and get_version");
    program.add_argument("--checks-folder")
        .help("Folder with <checkId>.md check descriptions");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Append logs to this file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-log")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output (debug level)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log warnings and errors")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // runtime_error for unknown flags, invalid_argument from scan<'i'>.
        return Result<CliOptions, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    auto& config = options.config;

    if (auto val = program.present<int>("--port")) {
        auto port = ToPort(*val, "--port");
        if (port.IsErr()) {
            return Result<CliOptions, Error>::Err(port.Error());
        }
        config.port = port.Value();
    }
    if (auto val = program.present("--bind")) {
        config.bind_address = *val;
    }
    if (auto val = program.present<int>("--workers")) {
        config.worker_threads = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.read_timeout_seconds = *val;
    }
    if (auto val = program.present("--host-version")) {
        config.host_version = *val;
    }
    if (auto val = program.present("--checks-folder")) {
        if (!val->empty()) {
            config.checks_folder = *val;
        }
    }
    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevelField(*val, "--log-level");
        if (level.IsErr()) {
            return Result<CliOptions, Error>::Err(level.Error());
        }
        config.log_level = level.Value();
    }
    config.json_log = program.get<bool>("--json-log");
    config.verbose = program.get<bool>("--verbose");
    config.quiet = program.get<bool>("--quiet");
    options.force_color = program.get<bool>("--color");
    options.force_no_color = program.get<bool>("--no-color");

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ServerConfig MergeConfigs(const ServerConfig& yaml_base,
                          const ServerConfig& cli_overrides) {
    const ServerConfig defaults;
    ServerConfig merged = yaml_base;

    if (cli_overrides.port != defaults.port) {
        merged.port = cli_overrides.port;
    }
    if (cli_overrides.bind_address != defaults.bind_address) {
        merged.bind_address = cli_overrides.bind_address;
    }
    if (cli_overrides.worker_threads != defaults.worker_threads) {
        merged.worker_threads = cli_overrides.worker_threads;
    }
    if (cli_overrides.read_timeout_seconds != defaults.read_timeout_seconds) {
        merged.read_timeout_seconds = cli_overrides.read_timeout_seconds;
    }
    if (cli_overrides.host_version != defaults.host_version) {
        merged.host_version = cli_overrides.host_version;
    }
    if (cli_overrides.checks_folder.has_value()) {
        merged.checks_folder = cli_overrides.checks_folder;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level != defaults.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.json_log) {
        merged.json_log = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.port == 0) {
        return Result<void, Error>::Err(Error::Config("Invalid port: 0"));
    }
    if (config.bind_address.empty()) {
        return Result<void, Error>::Err(
            Error::Config("Missing required field: bind_address"));
    }
    if (config.worker_threads < 1 || config.worker_threads > kMaxWorkerThreads) {
        return Result<void, Error>::Err(
            Error::Config("worker_threads must be between 1 and " +
                          std::to_string(kMaxWorkerThreads) + ", got " +
                          std::to_string(config.worker_threads)));
    }
    if (config.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            Error::Config("Timeout must be positive, got " +
                          std::to_string(config.read_timeout_seconds)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            Error::Config("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolserve
