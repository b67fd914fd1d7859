/**
 * @file portal_server.cpp
 * @brief Portal server implementation
 */

#include <portal/server/portal_server.h>
#include <portal/core/logging.h>

#include <atomic>
#include <list>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

namespace portal {

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct portal_server::impl {
    struct session_slot {
        uint64_t id = 0;
        std::thread thread;
        std::atomic<bool> finished{false};

        // Set while the receiver runs so stop() can interrupt it
        std::mutex channel_mutex;
        websocket_channel* channel = nullptr;
    };

    server_config config;
    path_guard guard;
    std::atomic<server_state> current_state{server_state::stopped};
    std::atomic<uint16_t> listen_port{0};

    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread accept_thread;

    std::mutex sessions_mutex;
    std::list<std::unique_ptr<session_slot>> sessions;
    std::atomic<uint64_t> next_session_id{1};
    std::atomic<bool> stopping{false};

    // Statistics
    mutable std::mutex stats_mutex;
    server_statistics statistics;

    // Callbacks
    std::mutex callback_mutex;
    std::function<void(const received_file&)> file_callback;
    std::function<void(const session_info&)> started_callback;
    std::function<void(const session_info&)> ended_callback;

    impl(server_config cfg, path_guard g) : config(std::move(cfg)), guard(std::move(g)) {}

    void do_accept() {
        acceptor->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (ec) {
                PORTAL_LOG_WARN(log_category::server, "Accept failed: " + ec.message());
            } else {
                admit(std::move(socket));
            }
            if (acceptor->is_open()) {
                do_accept();
            }
        });
    }

    // Join the threads of sessions that have ended. Requires sessions_mutex.
    void reap_finished_locked() {
        for (auto it = sessions.begin(); it != sessions.end();) {
            if ((*it)->finished) {
                (*it)->thread.join();
                it = sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    void admit(tcp::socket socket) {
        std::lock_guard lock(sessions_mutex);
        reap_finished_locked();

        if (sessions.size() >= config.max_sessions) {
            boost::system::error_code ec;
            auto peer = socket.remote_endpoint(ec);
            PORTAL_LOG_WARN(log_category::server,
                "Session limit reached (" + std::to_string(config.max_sessions) +
                "), closing connection from " +
                (ec ? std::string("unknown") : peer.address().to_string()));
            {
                std::lock_guard stats_lock(stats_mutex);
                statistics.rejected_sessions++;
            }
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
            return;
        }

        {
            std::lock_guard stats_lock(stats_mutex);
            statistics.total_sessions++;
            statistics.active_sessions++;
        }

        auto slot = std::make_unique<session_slot>();
        slot->id = next_session_id++;
        auto* raw = slot.get();
        sessions.push_back(std::move(slot));
        raw->thread = std::thread([this, raw, socket = std::move(socket)]() mutable {
            run_session(*raw, std::move(socket));
            raw->finished = true;
        });
    }

    void run_session(session_slot& slot, tcp::socket socket) {
        session_info info;
        info.id = slot.id;

        auto accepted = websocket_channel::accept(
            std::move(socket), config.websocket_path, config.channel);
        if (!accepted) {
            info.failure = accepted.error();
            finish_session(info);
            return;
        }
        auto& channel = *accepted.value();
        info.remote_address = channel.remote_address();

        {
            std::lock_guard lock(slot.channel_mutex);
            if (stopping) {
                channel.shutdown();
                info.failure = error{error_code::connection_closed, "server is stopping"};
            } else {
                slot.channel = &channel;
            }
        }
        if (info.failure) {
            finish_session(info);
            return;
        }

        notify(started_callback, info);

        transfer_log_context ctx;
        ctx.session_id = std::to_string(info.id);
        ctx.peer_address = info.remote_address;
        PORTAL_LOG_INFO_CTX(log_category::session, "Session started", ctx);

        receiver_engine receiver(channel, guard, config.receiver);
        receiver.set_session_id(ctx.session_id);
        receiver.on_file_received([this, &info](const received_file& file) {
            info.files_received++;
            info.bytes_written += file.bytes_written;
            {
                std::lock_guard lock(stats_mutex);
                statistics.files_received++;
                statistics.bytes_written += file.bytes_written;
            }

            std::function<void(const received_file&)> callback;
            {
                std::lock_guard lock(callback_mutex);
                callback = file_callback;
            }
            if (callback) {
                callback(file);
            }
        });

        auto summary = receiver.run();
        if (summary) {
            auto closed = channel.close();
            if (!closed) {
                PORTAL_LOG_DEBUG(log_category::session,
                    "Close after session " + ctx.session_id + " failed: " +
                    closed.error().message);
            }
        } else {
            info.failure = summary.error();
        }

        {
            std::lock_guard lock(slot.channel_mutex);
            slot.channel = nullptr;
        }
        finish_session(info);
    }

    void finish_session(const session_info& info) {
        transfer_log_context ctx;
        ctx.session_id = std::to_string(info.id);
        ctx.peer_address = info.remote_address;
        ctx.bytes_written = info.bytes_written;
        if (info.failure) {
            ctx.error_message = info.failure->message;
            PORTAL_LOG_WARN_CTX(log_category::session,
                "Session ended with " + std::string(to_string(info.failure->code)), ctx);
        } else {
            PORTAL_LOG_INFO_CTX(log_category::session,
                "Session ended after " + std::to_string(info.files_received) + " files", ctx);
        }

        notify(ended_callback, info);

        // Last, so an observer of active_sessions == 0 sees the callbacks done
        std::lock_guard lock(stats_mutex);
        statistics.active_sessions--;
        if (info.failure) {
            statistics.failed_sessions++;
        }
    }

    void notify(const std::function<void(const session_info&)>& target,
                const session_info& info) {
        std::function<void(const session_info&)> callback;
        {
            std::lock_guard lock(callback_mutex);
            callback = target;
        }
        if (callback) {
            callback(info);
        }
    }

    void release_listener() {
        acceptor.reset();
        ioc.reset();
        listen_port = 0;
    }
};

// Builder implementation
portal_server::builder::builder() = default;

auto portal_server::builder::with_root_directory(const std::filesystem::path& dir) -> builder& {
    config_.root_directory = dir;
    return *this;
}

auto portal_server::builder::with_listen_address(const endpoint& address) -> builder& {
    config_.listen_address = address;
    return *this;
}

auto portal_server::builder::with_websocket_path(std::string path) -> builder& {
    config_.websocket_path = std::move(path);
    return *this;
}

auto portal_server::builder::with_codec(codec_type codec) -> builder& {
    config_.receiver.codec = codec;
    return *this;
}

auto portal_server::builder::with_max_sessions(std::size_t max_count) -> builder& {
    config_.max_sessions = max_count;
    return *this;
}

auto portal_server::builder::with_pipe_capacity(std::size_t bytes) -> builder& {
    config_.receiver.pipe_capacity = bytes;
    return *this;
}

auto portal_server::builder::with_max_message_size(std::size_t bytes) -> builder& {
    config_.channel.max_message_size = bytes;
    return *this;
}

auto portal_server::builder::build() -> result<portal_server> {
    if (config_.root_directory.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                               "root_directory is required"}};
    }
    if (!config_.is_valid() || config_.receiver.pipe_capacity == 0 ||
        config_.channel.max_message_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "invalid server configuration"}};
    }

    // Create root directory if it doesn't exist
    std::error_code ec;
    if (!std::filesystem::exists(config_.root_directory, ec)) {
        std::filesystem::create_directories(config_.root_directory, ec);
        if (ec) {
            return unexpected{error{error_code::io_error,
                                   "Failed to create root directory: " + ec.message()}};
        }
    }

    auto guard = path_guard::create(config_.root_directory);
    if (!guard) {
        return unexpected{guard.error()};
    }

    config_.root_directory = guard.value().root();
    return portal_server{config_, std::move(guard.value())};
}

// portal_server implementation
portal_server::portal_server(server_config config, path_guard guard)
    : impl_(std::make_unique<impl>(std::move(config), std::move(guard))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

portal_server::portal_server(portal_server&&) noexcept = default;
auto portal_server::operator=(portal_server&&) noexcept -> portal_server& = default;

portal_server::~portal_server() {
    if (impl_ && is_running()) {
        (void)stop();
    }
}

auto portal_server::start() -> result<void> {
    if (impl_->current_state != server_state::stopped) {
        PORTAL_LOG_WARN(log_category::server, "Server start failed: already running");
        return unexpected{error{error_code::already_initialized,
                               "Server is already running"}};
    }

    const auto& listen = impl_->config.listen_address;
    PORTAL_LOG_INFO(log_category::server, "Starting server on " + listen.to_string());
    impl_->current_state = server_state::starting;

    boost::system::error_code ec;
    auto address = net::ip::make_address(listen.host, ec);
    if (ec) {
        impl_->current_state = server_state::stopped;
        return unexpected{error{error_code::invalid_configuration,
                               "Invalid listen address " + listen.host + ": " + ec.message()}};
    }

    impl_->ioc = std::make_unique<net::io_context>(1);
    impl_->acceptor = std::make_unique<tcp::acceptor>(*impl_->ioc);

    tcp::endpoint local(address, listen.port);
    auto& acceptor = *impl_->acceptor;
    acceptor.open(local.protocol(), ec);
    if (!ec) {
        acceptor.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(local, ec);
    }
    if (!ec) {
        acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        impl_->release_listener();
        impl_->current_state = server_state::stopped;
        PORTAL_LOG_ERROR(log_category::server,
            "Failed to listen on " + listen.to_string() + ": " + ec.message());
        return unexpected{error{error_code::transport_error,
                               "Failed to listen on " + listen.to_string() + ": " +
                               ec.message()}};
    }

    impl_->listen_port = acceptor.local_endpoint(ec).port();
    impl_->stopping = false;
    impl_->do_accept();
    impl_->accept_thread = std::thread([state = impl_.get()] { state->ioc->run(); });

    impl_->current_state = server_state::running;
    PORTAL_LOG_INFO(log_category::server,
        "Server started on port " + std::to_string(impl_->listen_port.load()) +
        ", writing to " + impl_->guard.root().string());
    return {};
}

auto portal_server::stop() -> result<void> {
    if (impl_->current_state != server_state::running) {
        PORTAL_LOG_WARN(log_category::server, "Server stop called but server is not running");
        return unexpected{error{error_code::not_initialized,
                               "Server is not running"}};
    }

    PORTAL_LOG_INFO(log_category::server, "Stopping server");
    impl_->current_state = server_state::stopping;
    impl_->stopping = true;

    net::post(*impl_->ioc, [state = impl_.get()] {
        boost::system::error_code ec;
        state->acceptor->close(ec);
    });
    impl_->accept_thread.join();

    // Sessions still in their handshake finish it or time out on their own.
    std::list<std::unique_ptr<impl::session_slot>> remaining;
    {
        std::lock_guard lock(impl_->sessions_mutex);
        remaining.swap(impl_->sessions);
    }
    for (auto& slot : remaining) {
        std::lock_guard lock(slot->channel_mutex);
        if (slot->channel != nullptr) {
            slot->channel->shutdown();
        }
    }
    for (auto& slot : remaining) {
        slot->thread.join();
    }

    impl_->release_listener();
    impl_->current_state = server_state::stopped;
    PORTAL_LOG_INFO(log_category::server, "Server stopped");
    return {};
}

auto portal_server::is_running() const -> bool {
    return impl_->current_state == server_state::running;
}

auto portal_server::state() const -> server_state {
    return impl_->current_state;
}

auto portal_server::port() const -> uint16_t {
    return impl_->listen_port;
}

auto portal_server::root() const -> const std::filesystem::path& {
    return impl_->guard.root();
}

auto portal_server::config() const -> const server_config& {
    return impl_->config;
}

auto portal_server::get_statistics() const -> server_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->statistics;
}

void portal_server::on_file_received(std::function<void(const received_file&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->file_callback = std::move(callback);
}

void portal_server::on_session_started(std::function<void(const session_info&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->started_callback = std::move(callback);
}

void portal_server::on_session_ended(std::function<void(const session_info&)> callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->ended_callback = std::move(callback);
}

}  // namespace portal
