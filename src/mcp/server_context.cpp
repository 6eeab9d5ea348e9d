#include <toolserve/mcp/server_context.hpp>

#include <toolserve/core/version.hpp>

#include <utility>

namespace toolserve {

ServerInfo ServerInfo::Default(std::string host_version) {
    return ServerInfo{kServerName, kVersion, kAuthor, kProtocolVersion,
                      std::move(host_version)};
}

ServerContext::ServerContext(ServerInfo info) : info_(std::move(info)) {}

uint64_t ServerContext::IncrementRequestCount() noexcept {
    return request_count_.fetch_add(1, std::memory_order_relaxed) + 1;
}

uint64_t ServerContext::RequestCount() const noexcept {
    return request_count_.load(std::memory_order_relaxed);
}

void ServerContext::ResetRequestCount() noexcept {
    request_count_.store(0, std::memory_order_relaxed);
}

uint64_t ServerContext::NextEventId() noexcept {
    return event_id_.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace toolserve
