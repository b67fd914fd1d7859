/**
 * @file websocket_channel.h
 * @brief WebSocket implementation of message_channel (Boost.Beast)
 */

#ifndef PORTAL_TRANSPORT_WEBSOCKET_CHANNEL_H
#define PORTAL_TRANSPORT_WEBSOCKET_CHANNEL_H

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>

#include <portal/core/types.h>
#include <portal/transport/message_channel.h>

namespace portal {

/**
 * @brief WebSocket channel settings
 */
struct channel_config {
    std::size_t max_message_size = 16 * 1024 * 1024;
    std::chrono::seconds handshake_timeout{30};
    std::chrono::seconds idle_timeout{300};
    bool keep_alive_pings = true;
};

/**
 * @brief message_channel over one WebSocket connection
 *
 * Each channel runs its own I/O thread. Outgoing messages are queued and
 * written in order; buffered_amount() is the size of that queue. receive()
 * and the send calls may be used from different threads.
 *
 * @code
 * auto channel = websocket_channel::connect(endpoint{"127.0.0.1", 8080}, "/ws");
 * if (channel.has_value()) {
 *     (void)channel.value()->send_text("EOT");
 * }
 * @endcode
 */
class websocket_channel : public message_channel {
public:
    /**
     * @brief Complete the server side handshake on an accepted socket
     * @param socket Connected socket, ownership is taken
     * @param target Request target to accept; other targets get HTTP 404
     * @param config Channel settings
     */
    [[nodiscard]] static auto accept(boost::asio::ip::tcp::socket socket,
                                     const std::string& target,
                                     const channel_config& config = {})
        -> result<std::unique_ptr<websocket_channel>>;

    /**
     * @brief Open a client connection and perform the handshake
     */
    [[nodiscard]] static auto connect(const endpoint& remote,
                                      const std::string& target,
                                      const channel_config& config = {})
        -> result<std::unique_ptr<websocket_channel>>;

    ~websocket_channel() override;

    websocket_channel(const websocket_channel&) = delete;
    auto operator=(const websocket_channel&) -> websocket_channel& = delete;

    [[nodiscard]] auto send_text(std::string_view text) -> result<void> override;
    [[nodiscard]] auto send_binary(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto receive() -> result<channel_message> override;
    [[nodiscard]] auto buffered_amount() const -> std::size_t override;
    [[nodiscard]] auto close() -> result<void> override;
    void close_with_error(std::string_view reason) override;
    [[nodiscard]] auto is_open() const -> bool override;
    [[nodiscard]] auto remote_address() const -> std::string override;

    /**
     * @brief Tear down the connection without a close handshake
     *
     * Unblocks a pending receive(). Used by the server on shutdown.
     */
    void shutdown();

private:
    struct impl;
    explicit websocket_channel(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace portal

#endif  // PORTAL_TRANSPORT_WEBSOCKET_CHANNEL_H
