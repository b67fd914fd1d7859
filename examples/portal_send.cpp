/**
 * @file portal_send.cpp
 * @brief Sends files and directory trees to a portal server
 *
 * Usage: portal_send [--codec gzip|lz4] [--threshold BYTES] host:port paths...
 */

#include <portal/portal.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace portal;

namespace {

struct options {
    endpoint server{"127.0.0.1", 8080};
    std::vector<std::filesystem::path> inputs;
    sender_config sender;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--codec gzip|lz4] [--threshold BYTES] host:port paths..." << std::endl;
}

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_endpoint(std::string_view text) -> std::optional<endpoint> {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    auto port = parse_number<uint16_t>(text.substr(colon + 1));
    if (!port) {
        return std::nullopt;
    }
    return endpoint{std::string(text.substr(0, colon)), *port};
}

auto parse_options(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--codec" && i + 1 < argc) {
            auto codec = parse_codec(argv[++i]);
            if (!codec) {
                std::cerr << "Unknown codec: " << argv[i] << std::endl;
                return std::nullopt;
            }
            opts.sender.codec = *codec;
        } else if (arg == "--threshold" && i + 1 < argc) {
            auto threshold = parse_number<std::size_t>(argv[++i]);
            if (!threshold || *threshold == 0) {
                std::cerr << "Invalid threshold: " << argv[i] << std::endl;
                return std::nullopt;
            }
            opts.sender.buffered_threshold = *threshold;
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        return std::nullopt;
    }
    auto server = parse_endpoint(positional.front());
    if (!server) {
        std::cerr << "Invalid server address: " << positional.front() << std::endl;
        return std::nullopt;
    }
    opts.server = *server;
    for (std::size_t i = 1; i < positional.size(); ++i) {
        opts.inputs.emplace_back(std::string(positional[i]));
    }
    return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    auto entries = collect_transfer_entries(opts->inputs);
    if (!entries.has_value()) {
        std::cerr << "Error: " << entries.error().message << std::endl;
        return 1;
    }
    if (entries.value().empty()) {
        std::cerr << "Nothing to send" << std::endl;
        return 1;
    }

    auto channel = websocket_channel::connect(opts->server, "/ws");
    if (!channel.has_value()) {
        std::cerr << "Failed to connect: " << channel.error().message << std::endl;
        return 1;
    }
    auto& connection = *channel.value();

    sender_engine sender(connection, opts->sender);
    sender.on_progress([](const transfer_progress& progress) {
        if (progress.total_size > 0) {
            auto percent = progress.bytes_read * 100 / static_cast<uint64_t>(progress.total_size);
            std::cout << "\r" << progress.name << ": " << percent << "%" << std::flush;
        }
    });

    for (const auto& entry : entries.value()) {
        auto sent = sender.transmit(entry.source, entry.name);
        if (!sent.has_value()) {
            std::cerr << "\nFailed to send " << entry.name << ": "
                      << sent.error().message << std::endl;
            connection.close_with_error(sent.error().message);
            return 1;
        }
        std::cout << "\r" << entry.name << ": " << sent.value().bytes_read << " bytes ("
                  << sent.value().bytes_sent << " compressed)" << std::endl;
    }

    auto acked = sender.await_acks();
    if (!acked.has_value()) {
        std::cerr << "Transfer not confirmed: " << acked.error().message << std::endl;
        return 1;
    }

    auto ended = sender.end();
    if (!ended.has_value()) {
        std::cerr << "Failed to end session: " << ended.error().message << std::endl;
        return 1;
    }

    auto closed = connection.close();
    if (!closed.has_value()) {
        std::cerr << "Close failed: " << closed.error().message << std::endl;
    }

    std::cout << "Sent " << entries.value().size() << " files" << std::endl;
    return 0;
}
