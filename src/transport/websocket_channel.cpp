/**
 * @file websocket_channel.cpp
 * @brief WebSocket channel implementation on Boost.Beast
 */

#include <portal/transport/websocket_channel.h>
#include <portal/core/logging.h>

#include <atomic>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace portal {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

// RFC 6455 limits a close reason to 123 bytes
constexpr std::size_t max_close_reason = 123;

auto truncate_reason(std::string_view reason) -> std::string {
    return std::string(reason.substr(0, std::min(reason.size(), max_close_reason)));
}

}  // namespace

struct websocket_channel::impl {
    struct outbound {
        std::vector<std::byte> data;
        bool text = false;
        bool close = false;
        websocket::close_code code = websocket::close_code::normal;
        std::string reason;
        std::shared_ptr<std::promise<beast::error_code>> closed;
    };

    channel_config config;
    net::io_context ioc{1};
    websocket::stream<beast::tcp_stream> ws;
    net::executor_work_guard<net::io_context::executor_type> work;
    std::thread io_thread;
    std::string remote;

    // Touched only on the I/O thread
    std::deque<outbound> queue;
    bool writing = false;
    beast::flat_buffer read_buffer;

    std::atomic<std::size_t> buffered{0};
    std::atomic<bool> open{false};
    std::atomic<bool> close_sent{false};

    mutable std::mutex failure_mutex;
    std::optional<error> failure;

    explicit impl(channel_config cfg)
        : config(std::move(cfg)), ws(ioc), work(net::make_work_guard(ioc)) {}

    ~impl() {
        stop();
    }

    void start() {
        io_thread = std::thread([this] { ioc.run(); });
    }

    void stop() {
        if (!io_thread.joinable()) {
            return;
        }
        open = false;
        net::post(ioc, [this] {
            beast::error_code ec;
            beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(ws).close();
        });
        work.reset();
        io_thread.join();
    }

    // Run an asynchronous operation on the I/O thread and wait for its completion.
    template <typename Operation>
    auto run_blocking(Operation&& operation) -> beast::error_code {
        auto done = std::make_shared<std::promise<beast::error_code>>();
        auto future = done->get_future();
        net::post(ioc, [&operation, done] {
            operation([done](beast::error_code ec) { done->set_value(ec); });
        });
        return future.get();
    }

    void record_failure(error err) {
        std::lock_guard lock(failure_mutex);
        if (!failure) {
            failure = std::move(err);
        }
        open = false;
    }

    auto current_failure() const -> std::optional<error> {
        std::lock_guard lock(failure_mutex);
        return failure;
    }

    auto enqueue(outbound message) -> result<void> {
        if (auto err = current_failure()) {
            return unexpected{*err};
        }
        if (!open || close_sent) {
            return unexpected{error{error_code::connection_closed, "channel is closed"}};
        }

        buffered += message.data.size();
        net::post(ioc, [this, message = std::move(message)]() mutable {
            queue.push_back(std::move(message));
            if (!writing) {
                write_next();
            }
        });
        return {};
    }

    void write_next() {
        if (queue.empty()) {
            writing = false;
            return;
        }
        writing = true;

        auto& front = queue.front();
        if (front.close) {
            ws.async_close(websocket::close_reason(front.code, front.reason),
                [this](beast::error_code ec) {
                    auto closed = std::move(queue.front().closed);
                    queue.pop_front();
                    open = false;
                    if (closed) {
                        closed->set_value(ec);
                    }
                    discard_queue(ec ? ec : beast::error_code(websocket::error::closed));
                });
            return;
        }

        ws.text(front.text);
        ws.async_write(net::buffer(front.data.data(), front.data.size()),
            [this](beast::error_code ec, std::size_t) {
                buffered -= queue.front().data.size();
                queue.pop_front();
                if (ec) {
                    PORTAL_LOG_DEBUG(log_category::transport,
                        "WebSocket write to " + remote + " failed: " + ec.message());
                    record_failure(error{error_code::transport_error,
                        "write failed: " + ec.message()});
                    discard_queue(ec);
                    return;
                }
                write_next();
            });
    }

    // Fail every queued message after the channel can no longer write.
    void discard_queue(beast::error_code ec) {
        for (auto& pending : queue) {
            buffered -= pending.data.size();
            if (pending.closed) {
                pending.closed->set_value(ec);
            }
        }
        queue.clear();
        writing = false;
    }

    // Queue a close frame behind any pending writes.
    auto request_close(websocket::close_code code, std::string reason)
        -> std::shared_ptr<std::promise<beast::error_code>> {
        outbound message;
        message.close = true;
        message.code = code;
        message.reason = std::move(reason);
        message.closed = std::make_shared<std::promise<beast::error_code>>();
        auto closed = message.closed;

        net::post(ioc, [this, message = std::move(message)]() mutable {
            queue.push_back(std::move(message));
            if (!writing) {
                write_next();
            }
        });
        return closed;
    }

    auto wait_closed(const std::shared_ptr<std::promise<beast::error_code>>& closed)
        -> std::optional<beast::error_code> {
        auto future = closed->get_future();
        if (future.wait_for(config.handshake_timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

    void apply_options(beast::role_type role) {
        auto timeouts = websocket::stream_base::timeout::suggested(role);
        timeouts.handshake_timeout = config.handshake_timeout;
        timeouts.idle_timeout = config.idle_timeout;
        timeouts.keep_alive_pings = config.keep_alive_pings;
        ws.set_option(timeouts);
        ws.read_message_max(config.max_message_size);
        ws.auto_fragment(false);
    }
};

websocket_channel::websocket_channel(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

websocket_channel::~websocket_channel() {
    if (impl_) {
        impl_->stop();
    }
}

auto websocket_channel::accept(tcp::socket socket,
                               const std::string& target,
                               const channel_config& config)
    -> result<std::unique_ptr<websocket_channel>> {
    get_logger().initialize();

    auto state = std::make_unique<impl>(config);

    beast::error_code ec;
    auto peer = socket.remote_endpoint(ec);
    state->remote = ec ? std::string("unknown")
                       : peer.address().to_string() + ":" + std::to_string(peer.port());
    auto protocol = ec ? tcp::v4() : peer.protocol();

    // Move the connection onto this channel's io_context.
    auto handle = socket.release(ec);
    if (ec) {
        return unexpected{error{error_code::connection_failed,
            "cannot take over socket: " + ec.message()}};
    }
    beast::get_lowest_layer(state->ws).socket().assign(protocol, handle, ec);
    if (ec) {
        return unexpected{error{error_code::connection_failed,
            "cannot adopt socket: " + ec.message()}};
    }

    state->start();

    http::request<http::string_body> request;
    beast::flat_buffer handshake_buffer;
    ec = state->run_blocking([&](auto complete) {
        beast::get_lowest_layer(state->ws).expires_after(state->config.handshake_timeout);
        http::async_read(beast::get_lowest_layer(state->ws), handshake_buffer, request,
            [complete](beast::error_code read_ec, std::size_t) { complete(read_ec); });
    });
    if (ec) {
        PORTAL_LOG_DEBUG(log_category::transport,
            "Handshake read from " + state->remote + " failed: " + ec.message());
        return unexpected{error{error_code::connection_failed,
            "handshake failed: " + ec.message()}};
    }

    if (!websocket::is_upgrade(request) || request.target() != target) {
        PORTAL_LOG_DEBUG(log_category::transport,
            "Rejecting request for " + std::string(request.target()) + " from " + state->remote);

        auto response = std::make_shared<http::response<http::string_body>>(
            http::status::not_found, request.version());
        response->set(http::field::server, "portal");
        response->set(http::field::content_type, "text/plain");
        response->keep_alive(false);
        response->body() = "WebSocket endpoint is " + target + "\n";
        response->prepare_payload();

        (void)state->run_blocking([&](auto complete) {
            http::async_write(beast::get_lowest_layer(state->ws), *response,
                [complete, response](beast::error_code write_ec, std::size_t) {
                    complete(write_ec);
                });
        });
        return unexpected{error{error_code::protocol_error,
            "unexpected request target: " + std::string(request.target())}};
    }

    ec = state->run_blocking([&](auto complete) {
        beast::get_lowest_layer(state->ws).expires_never();
        state->apply_options(beast::role_type::server);
        state->ws.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "portal");
            }));
        state->ws.async_accept(request, complete);
    });
    if (ec) {
        return unexpected{error{error_code::connection_failed,
            "websocket accept failed: " + ec.message()}};
    }

    state->open = true;
    PORTAL_LOG_DEBUG(log_category::transport, "WebSocket accepted from " + state->remote);
    return std::unique_ptr<websocket_channel>(new websocket_channel(std::move(state)));
}

auto websocket_channel::connect(const endpoint& remote,
                                const std::string& target,
                                const channel_config& config)
    -> result<std::unique_ptr<websocket_channel>> {
    get_logger().initialize();

    auto state = std::make_unique<impl>(config);
    state->remote = remote.to_string();

    beast::error_code ec;
    tcp::resolver resolver(state->ioc);
    auto endpoints = resolver.resolve(remote.host, std::to_string(remote.port), ec);
    if (ec) {
        return unexpected{error{error_code::connection_failed,
            "cannot resolve " + remote.host + ": " + ec.message()}};
    }

    net::connect(beast::get_lowest_layer(state->ws).socket(), endpoints, ec);
    if (ec) {
        PORTAL_LOG_ERROR(log_category::transport,
            "Connection to " + remote.to_string() + " failed: " + ec.message());
        return unexpected{error{error_code::connection_failed,
            "cannot connect to " + remote.to_string() + ": " + ec.message()}};
    }

    state->start();

    auto host = remote.host + ":" + std::to_string(remote.port);
    ec = state->run_blocking([&](auto complete) {
        state->apply_options(beast::role_type::client);
        state->ws.async_handshake(host, target, complete);
    });
    if (ec) {
        return unexpected{error{error_code::connection_failed,
            "websocket handshake failed: " + ec.message()}};
    }

    state->open = true;
    PORTAL_LOG_DEBUG(log_category::transport, "WebSocket connected to " + state->remote + target);
    return std::unique_ptr<websocket_channel>(new websocket_channel(std::move(state)));
}

auto websocket_channel::send_text(std::string_view text) -> result<void> {
    impl::outbound message;
    const auto* first = reinterpret_cast<const std::byte*>(text.data());
    message.data.assign(first, first + text.size());
    message.text = true;
    return impl_->enqueue(std::move(message));
}

auto websocket_channel::send_binary(std::span<const std::byte> data) -> result<void> {
    impl::outbound message;
    message.data.assign(data.begin(), data.end());
    return impl_->enqueue(std::move(message));
}

auto websocket_channel::receive() -> result<channel_message> {
    if (auto err = impl_->current_failure()) {
        return unexpected{*err};
    }
    if (!impl_->open) {
        return unexpected{error{error_code::connection_closed, "channel is closed"}};
    }

    channel_message message;
    auto ec = impl_->run_blocking([&](auto complete) {
        impl_->ws.async_read(impl_->read_buffer,
            [this, &message, complete](beast::error_code read_ec, std::size_t) {
                if (!read_ec) {
                    auto& buffer = impl_->read_buffer;
                    message.kind = impl_->ws.got_text() ? message_kind::text
                                                        : message_kind::binary;
                    const auto* first = static_cast<const std::byte*>(buffer.data().data());
                    message.data.assign(first, first + buffer.size());
                    buffer.consume(buffer.size());
                }
                complete(read_ec);
            });
    });

    if (ec == websocket::error::closed) {
        impl_->open = false;
        auto reason = std::string(impl_->ws.reason().reason.c_str());
        return unexpected{error{error_code::connection_closed,
            reason.empty() ? std::string("closed by peer") : "closed by peer: " + reason}};
    }
    if (ec) {
        error err{error_code::transport_error, "read failed: " + ec.message()};
        impl_->record_failure(err);
        return unexpected{err};
    }
    return message;
}

auto websocket_channel::buffered_amount() const -> std::size_t {
    return impl_->buffered.load();
}

auto websocket_channel::close() -> result<void> {
    if (!impl_->open || impl_->close_sent.exchange(true)) {
        return {};
    }

    auto ec = impl_->wait_closed(impl_->request_close(websocket::close_code::normal, {}));
    if (!ec) {
        return unexpected{error{error_code::transport_error, "close handshake timed out"}};
    }
    if (*ec && *ec != websocket::error::closed && *ec != net::error::eof) {
        return unexpected{error{error_code::transport_error, "close failed: " + ec->message()}};
    }
    PORTAL_LOG_DEBUG(log_category::transport, "WebSocket to " + impl_->remote + " closed");
    return {};
}

void websocket_channel::close_with_error(std::string_view reason) {
    if (!impl_->open || impl_->close_sent.exchange(true)) {
        return;
    }

    auto ec = impl_->wait_closed(impl_->request_close(websocket::close_code::protocol_error,
                                                      truncate_reason(reason)));
    if (!ec || (*ec && *ec != websocket::error::closed)) {
        PORTAL_LOG_DEBUG(log_category::transport,
            "Error close to " + impl_->remote + " did not complete cleanly");
    }
}

auto websocket_channel::is_open() const -> bool {
    return impl_->open.load();
}

auto websocket_channel::remote_address() const -> std::string {
    return impl_->remote;
}

void websocket_channel::shutdown() {
    impl_->open = false;
    net::post(impl_->ioc, [state = impl_.get()] {
        beast::error_code ec;
        beast::get_lowest_layer(state->ws).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(state->ws).close();
    });
}

}  // namespace portal
