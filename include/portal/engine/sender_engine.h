/**
 * @file sender_engine.h
 * @brief Outbound side of a transfer session
 */

#ifndef PORTAL_ENGINE_SENDER_ENGINE_H
#define PORTAL_ENGINE_SENDER_ENGINE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include <portal/core/protocol.h>
#include <portal/core/stream_codec.h>
#include <portal/core/types.h>
#include <portal/transport/message_channel.h>

namespace portal {

enum class sender_state {
    idle,
    awaiting_ready,
    streaming,
    awaiting_ack
};

[[nodiscard]] constexpr auto to_string(sender_state state) -> const char* {
    switch (state) {
        case sender_state::idle: return "idle";
        case sender_state::awaiting_ready: return "awaiting_ready";
        case sender_state::streaming: return "streaming";
        case sender_state::awaiting_ack: return "awaiting_ack";
        default: return "unknown";
    }
}

struct sender_config {
    std::size_t buffered_threshold = 2 * 1024 * 1024;   // 2MB
    std::chrono::milliseconds poll_interval{50};
    std::size_t read_chunk_size = 64 * 1024;             // 64KB
    codec_type codec = codec_type::gzip;
    compression_level level = compression_level::balanced;
};

struct transfer_progress {
    std::string name;
    uint64_t bytes_read = 0;
    uint64_t bytes_sent = 0;      ///< Compressed bytes handed to the channel
    int64_t total_size = 0;
};

struct transmit_result {
    file_header header;
    uint64_t bytes_read = 0;
    uint64_t bytes_sent = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Drives the header, READY, payload, EOF cycle for one session
 *
 * One transmit is in flight at a time; concurrent callers wait on the
 * availability gate. The gate opens again right after EOF is sent; the
 * receiver's EOF acknowledgement is consumed lazily by the next transmit
 * or by await_acks().
 *
 * @code
 * sender_engine sender(channel);
 * for (const auto& entry : entries) {
 *     auto sent = sender.transmit(entry.source, entry.name);
 *     if (!sent) return sent.error();
 * }
 * (void)sender.await_acks();
 * (void)sender.end();
 * @endcode
 */
class sender_engine {
public:
    explicit sender_engine(message_channel& channel, sender_config config = {});
    ~sender_engine();

    sender_engine(const sender_engine&) = delete;
    auto operator=(const sender_engine&) -> sender_engine& = delete;

    /**
     * @brief Send a file from disk
     * @param file Source path
     * @param name Destination name; defaults to the file name
     */
    [[nodiscard]] auto transmit(const std::filesystem::path& file,
                                std::optional<std::string> name = std::nullopt)
        -> result<transmit_result>;

    /**
     * @brief Send arbitrary content under the given header
     */
    [[nodiscard]] auto transmit(const file_header& header, std::istream& content)
        -> result<transmit_result>;

    /**
     * @brief Wait for the receiver to acknowledge every file sent so far
     */
    [[nodiscard]] auto await_acks() -> result<void>;

    /**
     * @brief Send EOT; the session accepts no further transmits
     */
    [[nodiscard]] auto end() -> result<void>;

    [[nodiscard]] auto state() const -> sender_state;
    [[nodiscard]] auto pending_acks() const -> std::size_t;

    void on_progress(std::function<void(const transfer_progress&)> callback);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Build a header from file metadata
 */
[[nodiscard]] auto make_file_header(const std::filesystem::path& file, std::string name)
    -> result<file_header>;

/**
 * @brief Guess a content type from the file extension
 */
[[nodiscard]] auto guess_mime_type(const std::filesystem::path& file) -> std::string;

}  // namespace portal

#endif  // PORTAL_ENGINE_SENDER_ENGINE_H
