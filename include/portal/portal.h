/**
 * @file portal.h
 * @brief Main header for the portal library
 * @version 0.1.0
 *
 * Include this header to access the server, the sending side and the
 * channel types.
 *
 * @code
 * #include <portal/portal.h>
 *
 * using namespace portal;
 *
 * // Receive into a directory
 * auto server = portal_server::builder()
 *     .with_root_directory("/path/to/drop")
 *     .with_listen_address(endpoint{8080})
 *     .build();
 *
 * // Send from another process
 * auto channel = websocket_channel::connect(endpoint{"192.168.1.20", 8080}, "/ws");
 * sender_engine sender(*channel.value());
 * @endcode
 */

#ifndef PORTAL_PORTAL_H
#define PORTAL_PORTAL_H

#include <string>

// Core
#include <portal/core/types.h>
#include <portal/core/logging.h>
#include <portal/core/byte_pipe.h>
#include <portal/core/path_guard.h>
#include <portal/core/protocol.h>
#include <portal/core/stream_codec.h>

// Transport
#include <portal/transport/message_channel.h>
#include <portal/transport/websocket_channel.h>
#include <portal/transport/network_info.h>

// Engines
#include <portal/engine/file_enumerator.h>
#include <portal/engine/receiver_engine.h>
#include <portal/engine/sender_engine.h>

// Server
#include <portal/server/server_types.h>
#include <portal/server/portal_server.h>

namespace portal {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace portal

#endif  // PORTAL_PORTAL_H
