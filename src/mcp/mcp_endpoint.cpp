#include <toolserve/mcp/mcp_endpoint.hpp>

#include <toolserve/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iomanip>
#include <random>
#include <sstream>

namespace toolserve {

namespace {

constexpr const char* kComponent = "http";
constexpr const char* kJsonMediaType = "application/json";

constexpr const char* kInvalidOriginBody =
    R"({"jsonrpc":"2.0","error":{"code":-32600,"message":"Invalid Origin"},"id":null})";
constexpr const char* kSseNotSupportedBody =
    R"({"error":"Server-initiated SSE not supported"})";
constexpr const char* kMethodNotAllowedBody = R"({"error":"Method not allowed"})";

// Host origins must end after the host or continue with a port or path, so
// "http://localhost.evil.example" does not match "http://localhost".
constexpr std::string_view kLoopbackOrigins[] = {
    "http://localhost",
    "https://localhost",
    "http://127.0.0.1",
    "https://127.0.0.1",
};

constexpr std::string_view kSchemeOrigins[] = {
    "file://",
    "vscode-webview://",
};

bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

bool AcceptsEventStream(const httplib::Request& req) {
    return req.get_header_value("Accept").find(kEventStreamMediaType) !=
           std::string::npos;
}

void SendJson(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, kJsonMediaType);
}

} // anonymous namespace

bool IsAllowedOrigin(std::string_view origin) {
    for (auto prefix : kLoopbackOrigins) {
        if (!StartsWith(origin, prefix)) continue;
        if (origin.size() == prefix.size()) return true;
        char next = origin[prefix.size()];
        if (next == ':' || next == '/') return true;
    }
    for (auto prefix : kSchemeOrigins) {
        if (StartsWith(origin, prefix)) return true;
    }
    return false;
}

std::string FormatSseEvent(uint64_t event_id, std::string_view payload) {
    std::string event;
    event.reserve(payload.size() + 32);
    event += "id: ";
    event += std::to_string(event_id);
    event += "\ndata: ";
    event += payload;
    event += "\n\n";
    return event;
}

std::string GenerateSessionId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    // Version 4 in the time_hi nibble, RFC 4122 variant in clock_seq.
    uint64_t hi = (dist(engine) & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    uint64_t lo = (dist(engine) & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

// ---------------------------------------------------------------------------
// McpEndpoint
// ---------------------------------------------------------------------------
McpEndpoint::McpEndpoint(ServerContext& context)
    : context_(context), handler_(context) {}

void McpEndpoint::HandleMcp(const httplib::Request& req,
                            httplib::Response& res) const {
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !IsAllowedOrigin(origin)) {
        LogInfo(kComponent, "Invalid Origin header rejected: " + origin);
        SendJson(res, 403, kInvalidOriginBody);
        return;
    }

    if (req.method == "POST") {
        HandlePost(req, res);
    } else if (req.method == "GET" || req.method == "HEAD") {
        HandleGet(req, res);
    } else if (req.method == "DELETE") {
        // Sessions are not tracked; termination is accepted as a no-op.
        res.status = 200;
    } else {
        SendJson(res, 405, kMethodNotAllowedBody);
    }
}

void McpEndpoint::HandlePost(const httplib::Request& req,
                             httplib::Response& res) const {
    auto count = context_.IncrementRequestCount();
    LogDebug(kComponent, "MCP request #" + std::to_string(count) + " from " +
                             req.remote_addr);

    auto reply = handler_.Process(req.body);
    if (!reply.HasBody()) {
        res.status = 202;
        return;
    }

    if (reply.session_established) {
        res.set_header(kSessionIdHeader, GenerateSessionId());
    }

    res.status = 200;
    if (AcceptsEventStream(req)) {
        res.set_header("Cache-Control", "no-cache");
        res.set_content(FormatSseEvent(context_.NextEventId(), *reply.body),
                        kEventStreamMediaType);
    } else {
        res.set_content(*reply.body, kJsonMediaType);
    }
}

void McpEndpoint::HandleGet(const httplib::Request& req,
                            httplib::Response& res) const {
    if (AcceptsEventStream(req)) {
        LogInfo(kComponent, "SSE GET request received, returning 405");
        SendJson(res, 405, kSseNotSupportedBody);
        return;
    }

    const auto& info = context_.Info();
    nlohmann::json body = {
        {"name", info.name},
        {"version", info.version},
        {"host_version", info.host_version},
        {"protocol_version", info.protocol_version},
        {"status", "running"}
    };
    SendJson(res, 200, body.dump());
}

void McpEndpoint::HandleHealth(const httplib::Request& /*req*/,
                               httplib::Response& res) const {
    nlohmann::json body = {
        {"status", "ok"},
        {"host_version", context_.Info().host_version}
    };
    SendJson(res, 200, body.dump());
}

} // namespace toolserve
