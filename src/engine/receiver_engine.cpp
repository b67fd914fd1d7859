/**
 * @file receiver_engine.cpp
 * @brief Receiver engine implementation
 */

#include <portal/engine/receiver_engine.h>
#include <portal/core/logging.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <system_error>

namespace portal {

namespace fs = std::filesystem;

namespace {

enum class file_outcome {
    completed,
    session_ended
};

// Aborts the pipe on scope exit so the decoder thread can always be joined.
class pipe_abort_guard {
public:
    explicit pipe_abort_guard(byte_pipe& pipe) : pipe_(pipe) {}
    ~pipe_abort_guard() {
        pipe_.abort(error{error_code::internal_error, "file transfer abandoned"});
    }

    pipe_abort_guard(const pipe_abort_guard&) = delete;
    auto operator=(const pipe_abort_guard&) -> pipe_abort_guard& = delete;

private:
    byte_pipe& pipe_;
};

// Empty when the instant is outside the range of the system or file clock.
auto from_epoch_ms(int64_t ms) -> std::optional<fs::file_time_type> {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using file_duration = fs::file_time_type::duration;

    constexpr auto sys_max = duration_cast<milliseconds>(
        std::chrono::system_clock::duration::max()).count();
    constexpr auto sys_min = duration_cast<milliseconds>(
        std::chrono::system_clock::duration::min()).count();
    if (ms > sys_max || ms < sys_min) {
        return std::nullopt;
    }

    // Offset of the file clock epoch, so the shift happens in milliseconds
    auto offset = duration_cast<milliseconds>(
        std::chrono::file_clock::to_sys(fs::file_time_type{}).time_since_epoch()).count();
    auto file_ms = ms - offset;

    constexpr auto file_max = duration_cast<milliseconds>(file_duration::max()).count();
    constexpr auto file_min = duration_cast<milliseconds>(file_duration::min()).count();
    if (file_ms > file_max || file_ms < file_min) {
        return std::nullopt;
    }
    return fs::file_time_type(duration_cast<file_duration>(milliseconds(file_ms)));
}

auto invalid_framing(const std::string& detail) -> error {
    return error{error_code::io_error, "invalid framing: " + detail};
}

}  // namespace

struct receiver_engine::impl {
    message_channel& channel;
    path_guard guard;
    receiver_config config;

    std::atomic<receiver_state> current_state{receiver_state::awaiting_header};
    std::string session_id;
    session_summary summary;

    std::mutex callback_mutex;
    std::function<void(const received_file&)> file_callback;

    impl(message_channel& ch, path_guard g, receiver_config cfg)
        : channel(ch), guard(std::move(g)), config(cfg) {}

    void set_state(receiver_state state) {
        auto old_state = current_state.exchange(state);
        if (old_state != state) {
            PORTAL_LOG_TRACE(log_category::receiver,
                std::string("Receiver state: ") + to_string(old_state) + " -> " +
                to_string(state));
        }
    }

    auto context(const std::string& filename = {}) const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.session_id = session_id;
        ctx.filename = filename;
        ctx.peer_address = channel.remote_address();
        return ctx;
    }

    // std::nullopt means the session ended: EOT, or the peer closed between files.
    auto next_header() -> result<std::optional<file_header>> {
        auto received = channel.receive();
        if (!received) {
            if (received.error().code == error_code::connection_closed) {
                PORTAL_LOG_DEBUG(log_category::receiver, "Peer closed the session");
                return std::optional<file_header>{};
            }
            return unexpected{received.error()};
        }

        auto inbound = classify(std::move(received.value()));
        if (auto* signal = std::get_if<control_signal>(&inbound)) {
            if (*signal == control_signal::eot) {
                summary.ended_by_eot = true;
                return std::optional<file_header>{};
            }
            return unexpected{error{error_code::header_error,
                "invalid header: got " + std::string(to_string(*signal))}};
        }
        if (auto* text = std::get_if<text_frame>(&inbound)) {
            auto header = decode_header(text->text);
            if (!header) {
                return unexpected{header.error()};
            }
            return std::optional<file_header>{std::move(header.value())};
        }
        return unexpected{error{error_code::header_error,
            "invalid header: binary message where a header was expected"}};
    }

    static auto decode_into(byte_pipe& pipe, std::ofstream& file, codec_type codec,
                            uint64_t& written, uint64_t& compressed) -> result<void> {
        stream_decoder decoder(codec);
        auto sink = [&file, &written](std::span<const std::byte> bytes) -> result<void> {
            file.write(reinterpret_cast<const char*>(bytes.data()),
                       static_cast<std::streamsize>(bytes.size()));
            if (!file) {
                return unexpected{error{error_code::io_error, "write failed"}};
            }
            written += bytes.size();
            return {};
        };

        while (true) {
            auto block = pipe.read();
            if (!block) {
                return unexpected{block.error()};
            }
            if (!block.value()) {
                break;
            }

            compressed += block.value()->size();
            auto decoded = decoder.update(*block.value(), sink);
            if (!decoded) {
                pipe.abort(decoded.error());
                return decoded;
            }
        }

        auto finished = decoder.finish();
        if (!finished) {
            return finished;
        }

        file.flush();
        if (!file) {
            return unexpected{error{error_code::io_error, "flush failed"}};
        }
        return {};
    }

    auto receive_file(const file_header& header) -> result<file_outcome> {
        auto start_time = std::chrono::steady_clock::now();

        auto target = guard.resolve(header.name);
        if (!target) {
            return unexpected{target.error()};
        }
        const auto& path = target.value();

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::io_error,
                "cannot create directory for " + header.name + ": " + ec.message()}};
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected{error{error_code::io_error, "cannot create " + header.name}};
        }

        auto ready = channel.send_text(to_string(control_signal::ready));
        if (!ready) {
            return unexpected{ready.error()};
        }
        set_state(receiver_state::awaiting_chunks);

        uint64_t written = 0;
        uint64_t compressed = 0;
        byte_pipe pipe(config.pipe_capacity);
        auto decoding = std::async(std::launch::async, [&] {
            return decode_into(pipe, file, config.codec, written, compressed);
        });
        pipe_abort_guard abort_on_exit(pipe);

        // Abort the pipeline and wait for the decoder before reporting err.
        auto abandon = [&](error err) -> result<file_outcome> {
            pipe.abort(err);
            (void)decoding.get();
            return unexpected{std::move(err)};
        };

        while (true) {
            auto received = channel.receive();
            if (!received) {
                return abandon(received.error());
            }

            auto inbound = classify(std::move(received.value()));
            if (auto* payload = std::get_if<payload_frame>(&inbound)) {
                auto queued = pipe.write(payload->data);
                if (!queued) {
                    // The decoder aborted the pipe; its result names the cause.
                    auto decoded = decoding.get();
                    return unexpected{decoded ? queued.error() : decoded.error()};
                }
                continue;
            }

            if (auto* text = std::get_if<text_frame>(&inbound)) {
                return abandon(invalid_framing("unexpected text '" + text->text + "'"));
            }

            auto signal = std::get<control_signal>(inbound);
            if (signal == control_signal::eof) {
                break;
            }
            if (signal == control_signal::eot) {
                pipe.close_write();
                auto decoded = decoding.get();
                if (!decoded) {
                    auto ctx = context(header.name);
                    ctx.error_message = decoded.error().message;
                    PORTAL_LOG_DEBUG_CTX(log_category::receiver, "Session ended mid-file", ctx);
                }
                summary.ended_by_eot = true;
                return file_outcome::session_ended;
            }
            return abandon(invalid_framing("unexpected " + std::string(to_string(signal))));
        }

        pipe.close_write();
        set_state(receiver_state::draining);
        auto decoded = decoding.get();
        if (!decoded) {
            return unexpected{decoded.error()};
        }

        file.close();
        if (file.fail()) {
            return unexpected{error{error_code::io_error, "cannot close " + header.name}};
        }

        if (auto mtime = from_epoch_ms(header.last_modified)) {
            fs::last_write_time(path, *mtime, ec);
        } else {
            ec = std::make_error_code(std::errc::value_too_large);
        }
        if (ec) {
            auto ctx = context(header.name);
            ctx.error_message = ec.message() + " (lastModified " +
                                std::to_string(header.last_modified) + ")";
            PORTAL_LOG_WARN_CTX(log_category::receiver, "Cannot set modification time", ctx);
        }

        received_file outcome;
        outcome.header = header;
        outcome.path = path;
        outcome.bytes_written = written;
        outcome.compressed_bytes = compressed;
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        auto ctx = context(header.name);
        ctx.file_size = static_cast<uint64_t>(header.size);
        ctx.bytes_written = written;
        ctx.duration_ms = static_cast<uint64_t>(outcome.duration.count());
        if (outcome.duration.count() > 0) {
            ctx.rate_mbps = static_cast<double>(written) / (1024.0 * 1024.0) /
                            (static_cast<double>(outcome.duration.count()) / 1000.0);
        }
        PORTAL_LOG_INFO_CTX(log_category::receiver, "Received file", ctx);

        auto acked = channel.send_text(to_string(control_signal::eof));
        if (!acked) {
            return unexpected{acked.error()};
        }

        summary.files_received++;
        summary.bytes_written += written;
        {
            std::lock_guard lock(callback_mutex);
            if (file_callback) {
                file_callback(outcome);
            }
        }
        return file_outcome::completed;
    }

    // Best-effort report of a session-ending failure to the peer.
    auto fail(error err) -> result<session_summary> {
        set_state(receiver_state::done);

        auto ctx = context();
        ctx.error_message = err.message;
        PORTAL_LOG_ERROR_CTX(log_category::receiver,
            std::string("Session failed: ") + to_string(err.code), ctx);

        if (!is_transport_error(err.code)) {
            auto reported = channel.send_text(err.message);
            if (!reported) {
                PORTAL_LOG_DEBUG(log_category::receiver,
                    "Could not report failure to peer: " + reported.error().message);
            }
        }
        channel.close_with_error(err.message);
        return unexpected{std::move(err)};
    }
};

receiver_engine::receiver_engine(message_channel& channel, path_guard guard,
                                 receiver_config config)
    : impl_(std::make_unique<impl>(channel, std::move(guard), config)) {}

receiver_engine::~receiver_engine() = default;

auto receiver_engine::run() -> result<session_summary> {
    impl_->summary = session_summary{};

    while (true) {
        impl_->set_state(receiver_state::awaiting_header);

        auto header = impl_->next_header();
        if (!header) {
            return impl_->fail(header.error());
        }
        if (!header.value()) {
            break;
        }

        auto outcome = impl_->receive_file(*header.value());
        if (!outcome) {
            return impl_->fail(outcome.error());
        }
        if (outcome.value() == file_outcome::session_ended) {
            break;
        }
    }

    impl_->set_state(receiver_state::done);
    auto ctx = impl_->context();
    PORTAL_LOG_DEBUG_CTX(log_category::receiver,
        "Session complete: " + std::to_string(impl_->summary.files_received) + " files", ctx);
    return impl_->summary;
}

auto receiver_engine::state() const -> receiver_state {
    return impl_->current_state.load();
}

void receiver_engine::on_file_received(std::function<void(const received_file&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->file_callback = std::move(callback);
}

void receiver_engine::set_session_id(std::string id) {
    impl_->session_id = std::move(id);
}

}  // namespace portal
