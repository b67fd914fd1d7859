/**
 * @file server_types.h
 * @brief Server-related type definitions for portal
 */

#ifndef PORTAL_SERVER_SERVER_TYPES_H
#define PORTAL_SERVER_SERVER_TYPES_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <portal/core/types.h>
#include <portal/engine/receiver_engine.h>
#include <portal/transport/websocket_channel.h>

namespace portal {

enum class server_state {
    stopped,
    starting,
    running,
    stopping
};

[[nodiscard]] constexpr auto to_string(server_state state) -> const char* {
    switch (state) {
        case server_state::stopped: return "stopped";
        case server_state::starting: return "starting";
        case server_state::running: return "running";
        case server_state::stopping: return "stopping";
        default: return "unknown";
    }
}

struct server_config {
    std::filesystem::path root_directory;
    endpoint listen_address{"0.0.0.0", 0};
    std::string websocket_path = "/ws";
    std::size_t max_sessions = 64;
    receiver_config receiver;
    channel_config channel;

    [[nodiscard]] auto is_valid() const -> bool {
        return !root_directory.empty() && max_sessions > 0 &&
               !websocket_path.empty() && websocket_path.front() == '/';
    }
};

struct server_statistics {
    uint64_t total_sessions = 0;
    uint64_t failed_sessions = 0;
    uint64_t rejected_sessions = 0;
    uint64_t files_received = 0;
    uint64_t bytes_written = 0;
    std::size_t active_sessions = 0;
};

struct session_info {
    uint64_t id = 0;
    std::string remote_address;
    std::size_t files_received = 0;
    uint64_t bytes_written = 0;
    std::optional<error> failure;
};

}  // namespace portal

#endif  // PORTAL_SERVER_SERVER_TYPES_H
