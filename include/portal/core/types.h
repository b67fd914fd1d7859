/**
 * @file types.h
 * @brief Core type definitions for portal
 */

#ifndef PORTAL_CORE_TYPES_H
#define PORTAL_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace portal {

/**
 * @brief Error codes for transfer sessions
 *
 * Every code below success is session-fatal.
 */
enum class error_code {
    success = 0,

    // Header errors (-100 to -109)
    header_error = -100,

    // Path errors (-110 to -119)
    path_violation = -110,

    // File I/O errors (-120 to -129)
    io_error = -120,

    // Compression errors (-130 to -139)
    decode_error = -130,
    encode_error = -131,

    // Protocol errors (-140 to -149)
    protocol_error = -140,

    // Transport errors (-160 to -179)
    transport_error = -160,
    connection_closed = -161,
    connection_failed = -162,

    // Configuration errors (-180 to -189)
    invalid_configuration = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::header_error:
            return "header error";
        case error_code::path_violation:
            return "path violation";
        case error_code::io_error:
            return "io error";
        case error_code::decode_error:
            return "decode error";
        case error_code::encode_error:
            return "encode error";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::transport_error:
            return "transport error";
        case error_code::connection_closed:
            return "connection closed";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief True for the transport group (-160 to -179)
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value >= -179;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Host and port pair
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : host("0.0.0.0"), port(0) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}
    explicit endpoint(uint16_t p) : host("0.0.0.0"), port(p) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

}  // namespace portal

#endif  // PORTAL_CORE_TYPES_H
