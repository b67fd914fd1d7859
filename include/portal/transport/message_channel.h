/**
 * @file message_channel.h
 * @brief Message-framed duplex channel abstraction
 *
 * A session runs over exactly one channel. Messages are delivered in order
 * and keep their boundaries; each one is either text (control) or binary
 * (payload).
 */

#ifndef PORTAL_TRANSPORT_MESSAGE_CHANNEL_H
#define PORTAL_TRANSPORT_MESSAGE_CHANNEL_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <portal/core/types.h>

namespace portal {

enum class message_kind {
    text,
    binary
};

[[nodiscard]] constexpr auto to_string(message_kind kind) -> const char* {
    switch (kind) {
        case message_kind::text: return "text";
        case message_kind::binary: return "binary";
        default: return "unknown";
    }
}

/**
 * @brief One complete inbound message
 */
struct channel_message {
    message_kind kind = message_kind::binary;
    std::vector<std::byte> data;

    [[nodiscard]] auto is_text() const -> bool { return kind == message_kind::text; }

    [[nodiscard]] auto text() const -> std::string {
        return std::string(reinterpret_cast<const char*>(data.data()), data.size());
    }

    [[nodiscard]] static auto make_text(std::string_view text) -> channel_message {
        channel_message msg;
        msg.kind = message_kind::text;
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        msg.data.assign(first, first + text.size());
        return msg;
    }

    [[nodiscard]] static auto make_binary(std::span<const std::byte> payload)
        -> channel_message {
        channel_message msg;
        msg.kind = message_kind::binary;
        msg.data.assign(payload.begin(), payload.end());
        return msg;
    }
};

/**
 * @brief Abstract transport channel
 *
 * Sends may queue; buffered_amount() reports the bytes accepted by send_*
 * but not yet handed to the network. receive() blocks until the next message
 * arrives or the channel fails.
 */
class message_channel {
public:
    virtual ~message_channel() = default;

    [[nodiscard]] virtual auto send_text(std::string_view text) -> result<void> = 0;

    [[nodiscard]] virtual auto send_binary(std::span<const std::byte> data) -> result<void> = 0;

    [[nodiscard]] virtual auto receive() -> result<channel_message> = 0;

    [[nodiscard]] virtual auto buffered_amount() const -> std::size_t = 0;

    /**
     * @brief Normal close after flushing queued messages
     */
    [[nodiscard]] virtual auto close() -> result<void> = 0;

    /**
     * @brief Close signalling a protocol failure with the given reason
     */
    virtual void close_with_error(std::string_view reason) = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    [[nodiscard]] virtual auto remote_address() const -> std::string = 0;

protected:
    message_channel() = default;
    message_channel(const message_channel&) = default;
    auto operator=(const message_channel&) -> message_channel& = default;
};

}  // namespace portal

#endif  // PORTAL_TRANSPORT_MESSAGE_CHANNEL_H
