/**
 * @file sender_engine.cpp
 * @brief Sender engine implementation
 */

#include <portal/engine/sender_engine.h>
#include <portal/core/logging.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace portal {

namespace {

struct mime_entry {
    std::string_view extension;
    std::string_view type;
};

constexpr std::array<mime_entry, 24> mime_types = {{
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".csv", "text/csv"},
    {".js", "text/javascript"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
}};

auto to_epoch_ms(std::filesystem::file_time_type time) -> int64_t {
    auto system_time = std::chrono::file_clock::to_sys(time);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        system_time.time_since_epoch()).count();
}

}  // namespace

auto guess_mime_type(const std::filesystem::path& file) -> std::string {
    auto extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : mime_types) {
        if (entry.extension == extension) {
            return std::string(entry.type);
        }
    }
    return "application/octet-stream";
}

auto make_file_header(const std::filesystem::path& file, std::string name)
    -> result<file_header> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return unexpected{error{error_code::io_error,
            "not a regular file: " + file.string()}};
    }

    file_header header;
    header.name = std::move(name);

    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return unexpected{error{error_code::io_error,
            "cannot stat " + file.string() + ": " + ec.message()}};
    }
    header.size = static_cast<int64_t>(size);

    auto modified = std::filesystem::last_write_time(file, ec);
    if (ec) {
        return unexpected{error{error_code::io_error,
            "cannot read modification time of " + file.string() + ": " + ec.message()}};
    }
    header.last_modified = to_epoch_ms(modified);
    header.mime = guess_mime_type(file);

    return header;
}

struct sender_engine::impl {
    message_channel& channel;
    sender_config config;

    // Availability gate: one transmit in flight per session
    std::mutex gate;

    std::atomic<sender_state> current_state{sender_state::idle};
    std::atomic<std::size_t> pending_acks{0};
    std::atomic<bool> ended{false};

    std::mutex callback_mutex;
    std::function<void(const transfer_progress&)> progress_callback;

    impl(message_channel& ch, sender_config cfg) : channel(ch), config(std::move(cfg)) {}

    void set_state(sender_state state) {
        auto old_state = current_state.exchange(state);
        if (old_state != state) {
            PORTAL_LOG_TRACE(log_category::sender,
                std::string("Sender state: ") + to_string(old_state) + " -> " + to_string(state));
        }
    }

    void report(const transfer_progress& progress) {
        std::lock_guard lock(callback_mutex);
        if (progress_callback) {
            progress_callback(progress);
        }
    }

    // Reads until READY, consuming outstanding EOF acknowledgements on the way.
    auto await_ready() -> result<void> {
        while (true) {
            auto received = channel.receive();
            if (!received) {
                return unexpected{received.error()};
            }

            auto inbound = classify(std::move(received.value()));
            if (auto* signal = std::get_if<control_signal>(&inbound)) {
                if (*signal == control_signal::ready) {
                    return {};
                }
                if (*signal == control_signal::eof && pending_acks > 0) {
                    --pending_acks;
                    continue;
                }
                return unexpected{error{error_code::protocol_error,
                    "expected READY, got " + std::string(to_string(*signal))}};
            }
            if (auto* text = std::get_if<text_frame>(&inbound)) {
                return unexpected{error{error_code::protocol_error, text->text}};
            }
            return unexpected{error{error_code::protocol_error,
                "expected READY, got binary message"}};
        }
    }

    auto wait_for_capacity() -> result<void> {
        while (channel.buffered_amount() > config.buffered_threshold) {
            if (!channel.is_open()) {
                return unexpected{error{error_code::connection_closed,
                    "channel closed while waiting to send"}};
            }
            std::this_thread::sleep_for(config.poll_interval);
        }
        return {};
    }

    auto send_frame(std::span<const std::byte> frame) -> result<void> {
        if (frame.empty()) {
            return {};
        }
        auto ready = wait_for_capacity();
        if (!ready) {
            return ready;
        }
        return channel.send_binary(frame);
    }

    auto stream_content(const file_header& header, std::istream& content,
                        transmit_result& outcome) -> result<void> {
        stream_encoder encoder(config.codec, config.level);
        std::vector<char> buffer(std::max<std::size_t>(config.read_chunk_size, 1));

        transfer_progress progress;
        progress.name = header.name;
        progress.total_size = header.size;

        while (content) {
            content.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = static_cast<std::size_t>(content.gcount());
            if (count == 0) {
                break;
            }

            auto encoded = encoder.update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), count));
            if (!encoded) {
                return unexpected{encoded.error()};
            }

            auto sent = send_frame(encoded.value());
            if (!sent) {
                return sent;
            }

            outcome.bytes_read += count;
            outcome.bytes_sent += encoded.value().size();
            progress.bytes_read = outcome.bytes_read;
            progress.bytes_sent = outcome.bytes_sent;
            report(progress);
        }

        if (content.bad()) {
            return unexpected{error{error_code::io_error,
                "read failed for " + header.name}};
        }

        auto trailer = encoder.finish();
        if (!trailer) {
            return unexpected{trailer.error()};
        }
        auto sent = send_frame(trailer.value());
        if (!sent) {
            return sent;
        }
        outcome.bytes_sent += trailer.value().size();
        return {};
    }
};

sender_engine::sender_engine(message_channel& channel, sender_config config)
    : impl_(std::make_unique<impl>(channel, std::move(config))) {}

sender_engine::~sender_engine() = default;

auto sender_engine::transmit(const std::filesystem::path& file,
                             std::optional<std::string> name) -> result<transmit_result> {
    auto header = make_file_header(file, name ? std::move(*name) : file.filename().string());
    if (!header) {
        return unexpected{header.error()};
    }

    std::ifstream content(file, std::ios::binary);
    if (!content) {
        return unexpected{error{error_code::io_error, "cannot open " + file.string()}};
    }

    return transmit(header.value(), content);
}

auto sender_engine::transmit(const file_header& header, std::istream& content)
    -> result<transmit_result> {
    std::unique_lock gate_lock(impl_->gate);

    if (impl_->ended) {
        return unexpected{error{error_code::protocol_error, "session already ended"}};
    }

    auto start_time = std::chrono::steady_clock::now();
    transmit_result outcome;
    outcome.header = header;

    impl_->set_state(sender_state::awaiting_ready);
    auto sent = impl_->channel.send_text(encode_header(header));
    if (sent) {
        sent = impl_->await_ready();
    }
    if (!sent) {
        impl_->set_state(sender_state::idle);
        transfer_log_context ctx;
        ctx.filename = header.name;
        ctx.error_message = sent.error().message;
        PORTAL_LOG_ERROR_CTX(log_category::sender, "Header rejected", ctx);
        return unexpected{sent.error()};
    }

    impl_->set_state(sender_state::streaming);
    auto streamed = impl_->stream_content(header, content, outcome);
    if (streamed) {
        streamed = impl_->channel.send_text(to_string(control_signal::eof));
    }
    if (!streamed) {
        impl_->set_state(sender_state::idle);
        transfer_log_context ctx;
        ctx.filename = header.name;
        ctx.bytes_written = outcome.bytes_read;
        ctx.error_message = streamed.error().message;
        PORTAL_LOG_ERROR_CTX(log_category::sender, "Transmit failed", ctx);
        return unexpected{streamed.error()};
    }

    ++impl_->pending_acks;
    impl_->set_state(sender_state::awaiting_ack);

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    transfer_log_context ctx;
    ctx.filename = header.name;
    ctx.file_size = outcome.bytes_read;
    ctx.bytes_written = outcome.bytes_sent;
    ctx.duration_ms = static_cast<uint64_t>(outcome.duration.count());
    PORTAL_LOG_DEBUG_CTX(log_category::sender, "File sent", ctx);

    return outcome;
}

auto sender_engine::await_acks() -> result<void> {
    std::unique_lock gate_lock(impl_->gate);

    while (impl_->pending_acks > 0) {
        auto received = impl_->channel.receive();
        if (!received) {
            return unexpected{received.error()};
        }

        auto inbound = classify(std::move(received.value()));
        if (auto* signal = std::get_if<control_signal>(&inbound);
            signal && *signal == control_signal::eof) {
            --impl_->pending_acks;
            continue;
        }
        if (auto* text = std::get_if<text_frame>(&inbound)) {
            return unexpected{error{error_code::protocol_error, text->text}};
        }
        return unexpected{error{error_code::protocol_error,
            "unexpected message while awaiting acknowledgement"}};
    }

    impl_->set_state(sender_state::idle);
    return {};
}

auto sender_engine::end() -> result<void> {
    std::unique_lock gate_lock(impl_->gate);

    if (impl_->ended.exchange(true)) {
        return {};
    }

    auto sent = impl_->channel.send_text(to_string(control_signal::eot));
    if (!sent) {
        return sent;
    }
    impl_->set_state(sender_state::idle);
    PORTAL_LOG_DEBUG(log_category::sender, "Session ended");
    return {};
}

auto sender_engine::state() const -> sender_state {
    return impl_->current_state.load();
}

auto sender_engine::pending_acks() const -> std::size_t {
    return impl_->pending_acks.load();
}

void sender_engine::on_progress(std::function<void(const transfer_progress&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_callback = std::move(callback);
}

}  // namespace portal
