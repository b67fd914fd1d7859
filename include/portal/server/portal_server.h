/**
 * @file portal_server.h
 * @brief WebSocket drop server
 */

#ifndef PORTAL_SERVER_PORTAL_SERVER_H
#define PORTAL_SERVER_PORTAL_SERVER_H

#include <functional>
#include <memory>

#include <portal/core/stream_codec.h>
#include <portal/core/types.h>
#include <portal/server/server_types.h>

namespace portal {

/**
 * @brief Accepts transfer sessions and writes their files under a root
 *
 * Each accepted WebSocket connection on the configured path runs one
 * receiver_engine on its own thread.
 *
 * @code
 * auto server_result = portal_server::builder()
 *     .with_root_directory("/srv/drop")
 *     .with_listen_address(endpoint{8080})
 *     .build();
 *
 * if (server_result.has_value()) {
 *     auto& server = server_result.value();
 *     (void)server.start();
 * }
 * @endcode
 */
class portal_server {
public:
    class builder {
    public:
        builder();

        /**
         * @brief Directory receiving files; created if missing
         */
        auto with_root_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Address to bind; port 0 picks a free port
         */
        auto with_listen_address(const endpoint& address) -> builder&;

        /**
         * @brief Request target of the WebSocket endpoint (default: /ws)
         */
        auto with_websocket_path(std::string path) -> builder&;

        auto with_codec(codec_type codec) -> builder&;

        /**
         * @brief Concurrent session limit (default: 64)
         */
        auto with_max_sessions(std::size_t max_count) -> builder&;

        /**
         * @brief Compressed bytes buffered between network and decoder (default: 1MB)
         */
        auto with_pipe_capacity(std::size_t bytes) -> builder&;

        /**
         * @brief Largest accepted WebSocket message (default: 16MB)
         */
        auto with_max_message_size(std::size_t bytes) -> builder&;

        /**
         * @brief Validate, create and canonicalize the root, then build
         */
        [[nodiscard]] auto build() -> result<portal_server>;

    private:
        server_config config_;
    };

    portal_server(const portal_server&) = delete;
    auto operator=(const portal_server&) -> portal_server& = delete;
    portal_server(portal_server&&) noexcept;
    auto operator=(portal_server&&) noexcept -> portal_server&;
    ~portal_server();

    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop accepting, tear down open sessions and join their threads
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto state() const -> server_state;

    /**
     * @brief Bound port, or 0 if not running
     */
    [[nodiscard]] auto port() const -> uint16_t;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;
    [[nodiscard]] auto config() const -> const server_config&;
    [[nodiscard]] auto get_statistics() const -> server_statistics;

    void on_file_received(std::function<void(const received_file&)> callback);
    void on_session_started(std::function<void(const session_info&)> callback);
    void on_session_ended(std::function<void(const session_info&)> callback);

private:
    portal_server(server_config config, path_guard guard);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace portal

#endif  // PORTAL_SERVER_PORTAL_SERVER_H
