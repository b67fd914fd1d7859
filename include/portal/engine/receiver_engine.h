/**
 * @file receiver_engine.h
 * @brief Inbound side of a transfer session
 */

#ifndef PORTAL_ENGINE_RECEIVER_ENGINE_H
#define PORTAL_ENGINE_RECEIVER_ENGINE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <portal/core/byte_pipe.h>
#include <portal/core/path_guard.h>
#include <portal/core/protocol.h>
#include <portal/core/stream_codec.h>
#include <portal/core/types.h>
#include <portal/transport/message_channel.h>

namespace portal {

enum class receiver_state {
    awaiting_header,
    awaiting_chunks,
    draining,
    done
};

[[nodiscard]] constexpr auto to_string(receiver_state state) -> const char* {
    switch (state) {
        case receiver_state::awaiting_header: return "awaiting_header";
        case receiver_state::awaiting_chunks: return "awaiting_chunks";
        case receiver_state::draining: return "draining";
        case receiver_state::done: return "done";
        default: return "unknown";
    }
}

struct receiver_config {
    codec_type codec = codec_type::gzip;
    std::size_t pipe_capacity = byte_pipe::default_capacity;
};

/**
 * @brief A file persisted by the receiver
 */
struct received_file {
    file_header header;
    std::filesystem::path path;
    uint64_t bytes_written = 0;
    uint64_t compressed_bytes = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Outcome of a session that ended without error
 */
struct session_summary {
    std::size_t files_received = 0;
    uint64_t bytes_written = 0;
    bool ended_by_eot = false;    ///< false when the peer closed the channel
};

/**
 * @brief Reads headers and payloads from one channel and persists files
 *
 * Each file runs through: header, path check, open, READY, payload frames
 * decoded on a separate thread, EOF, drain, mtime, EOF reply. Any failure
 * is sent to the peer as text, the channel is closed with that reason, and
 * run() returns the error. Files completed earlier in the session stay.
 *
 * @code
 * auto guard = path_guard::create(root);
 * receiver_engine receiver(*channel, guard.value());
 * auto summary = receiver.run();
 * @endcode
 */
class receiver_engine {
public:
    receiver_engine(message_channel& channel, path_guard guard, receiver_config config = {});
    ~receiver_engine();

    receiver_engine(const receiver_engine&) = delete;
    auto operator=(const receiver_engine&) -> receiver_engine& = delete;

    /**
     * @brief Process files until EOT, channel closure, or the first failure
     */
    [[nodiscard]] auto run() -> result<session_summary>;

    [[nodiscard]] auto state() const -> receiver_state;

    void on_file_received(std::function<void(const received_file&)> callback);

    /**
     * @brief Identifier used in log records for this session
     */
    void set_session_id(std::string id);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace portal

#endif  // PORTAL_ENGINE_RECEIVER_ENGINE_H
