/**
 * @file protocol.h
 * @brief Wire protocol: file headers and control signals
 *
 * Per file the sender emits one JSON header (text), N payload frames
 * (binary) and the literal EOF. The receiver answers READY once the
 * destination is open and EOF once the file is persisted. EOT ends the
 * session. Any other text from the receiver is an error description.
 */

#ifndef PORTAL_CORE_PROTOCOL_H
#define PORTAL_CORE_PROTOCOL_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <portal/core/types.h>
#include <portal/transport/message_channel.h>

namespace portal {

/**
 * @brief Control tokens exchanged as text messages
 */
enum class control_signal {
    ready,
    eof,
    eot
};

[[nodiscard]] constexpr auto to_string(control_signal signal) -> std::string_view {
    switch (signal) {
        case control_signal::ready: return "READY";
        case control_signal::eof: return "EOF";
        case control_signal::eot: return "EOT";
        default: return "";
    }
}

/**
 * @brief Match text against the control literals (exact, case-sensitive)
 */
[[nodiscard]] auto parse_signal(std::string_view text) -> std::optional<control_signal>;

/**
 * @brief Per-file metadata preceding the payload
 */
struct file_header {
    std::string name;            ///< Relative destination path, '/'-separated
    int64_t size = 0;            ///< Uncompressed length, advisory
    int64_t last_modified = 0;   ///< Epoch milliseconds
    std::string mime;            ///< Advisory content type
};

/**
 * @brief Serialize as {"name":..,"size":..,"lastModified":..,"mime":..}
 */
[[nodiscard]] auto encode_header(const file_header& header) -> std::string;

/**
 * @brief Parse a header message
 *
 * Unknown keys are ignored and absent fields keep their defaults. A missing
 * or empty name, malformed JSON or a non-integer numeric field yields
 * header_error.
 */
[[nodiscard]] auto decode_header(std::string_view json) -> result<file_header>;

/**
 * @brief Text that is not a control literal
 */
struct text_frame {
    std::string text;
};

/**
 * @brief Binary payload bytes
 */
struct payload_frame {
    std::vector<std::byte> data;
};

using inbound_message = std::variant<control_signal, text_frame, payload_frame>;

/**
 * @brief Decode a raw message into a control token, free text or payload
 */
[[nodiscard]] auto classify(channel_message message) -> inbound_message;

}  // namespace portal

#endif  // PORTAL_CORE_PROTOCOL_H
