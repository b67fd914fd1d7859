/**
 * @file portal_server.cpp
 * @brief Drop server: receives files into a directory
 *
 * Usage: portal_server [--port N] [--path DIR] [--host ADDR]
 *                      [--codec gzip|lz4] [--debug] [--json-log]
 */

#include <portal/portal.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace portal;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

namespace {

struct options {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    std::string path = ".";
    codec_type codec = codec_type::gzip;
    bool debug = false;
    bool json_log = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--port N] [--path DIR] [--host ADDR] [--codec gzip|lz4]"
                 " [--debug] [--json-log]" << std::endl;
}

auto parse_options(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--json-log") {
            opts.json_log = true;
        } else if (arg == "--port") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(),
                                             opts.port);
            if (ec != std::errc{} || ptr != value->data() + value->size()) {
                std::cerr << "Invalid port: " << *value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--path") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            opts.path = std::string(*value);
        } else if (arg == "--host") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            opts.host = std::string(*value);
        } else if (arg == "--codec") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            auto codec = parse_codec(*value);
            if (!codec) {
                std::cerr << "Unknown codec: " << *value << std::endl;
                return std::nullopt;
            }
            opts.codec = *codec;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
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

    auto& logger = get_logger();
    logger.set_level(opts->debug ? log_level::debug : log_level::info);
    if (opts->json_log) {
        logger.set_output_format(log_output_format::json);
    }

    auto server_result = portal_server::builder()
        .with_root_directory(opts->path)
        .with_listen_address(endpoint{opts->host, opts->port})
        .with_codec(opts->codec)
        .build();

    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: "
                  << server_result.error().message << std::endl;
        return 1;
    }

    auto& server = server_result.value();

    server.on_file_received([](const received_file& file) {
        std::cout << "[Received] " << file.header.name << " ("
                  << file.bytes_written << " bytes)" << std::endl;
    });

    server.on_session_ended([](const session_info& info) {
        if (info.failure) {
            std::cout << "[Session " << info.id << "] failed: "
                      << info.failure->message << std::endl;
        }
    });

    auto start_result = server.start();
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: "
                  << start_result.error().message << std::endl;
        return 1;
    }

    auto display_host = opts->host == "0.0.0.0" ? primary_ipv4_address() : opts->host;
    std::cout << "Portal available at http://" << display_host << ":" << server.port()
              << std::endl;
    if (opts->host == "0.0.0.0") {
        auto hostname = local_hostname();
        if (!hostname.empty()) {
            std::cout << "                    http://" << hostname << ":" << server.port()
                      << std::endl;
        }
    }
    std::cout << "Writing to " << server.root().string() << std::endl;
    std::cout << "Press Ctrl+C to stop..." << std::endl;

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Stopping server..." << std::endl;
    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: "
                  << stop_result.error().message << std::endl;
    }

    auto stats = server.get_statistics();
    std::cout << "Sessions: " << stats.total_sessions
              << " (failed " << stats.failed_sessions << ")"
              << " | Files: " << stats.files_received
              << " | Bytes: " << stats.bytes_written << std::endl;

    return 0;
}
