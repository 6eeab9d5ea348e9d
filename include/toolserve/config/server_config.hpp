#pragma once

#include <toolserve/core/log.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolserve {

constexpr uint16_t kDefaultPort = 8765;
constexpr int kDefaultWorkerThreads = 4;
constexpr int kDefaultReadTimeoutSeconds = 30;

struct ServerConfig {
    uint16_t port = kDefaultPort;
    std::string bind_address = "127.0.0.1";
    int worker_threads = kDefaultWorkerThreads;
    int read_timeout_seconds = kDefaultReadTimeoutSeconds;

    // Reported by /health, GET /mcp and the get_version tool.
    std::string host_version = "unknown";

    // Folder of <checkId>.md files; empty disables get_check_description.
    std::optional<std::string> checks_folder;

    std::optional<std::string> log_file;
    LogLevel log_level = LogLevel::Info;
    bool json_log = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace toolserve
