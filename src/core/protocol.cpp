/**
 * @file protocol.cpp
 * @brief File header codec and control signal classification
 */

#include <portal/core/protocol.h>
#include <portal/core/logging.h>

#include <limits>
#include <sstream>

namespace portal {

namespace {

constexpr int max_nesting_depth = 64;

/**
 * @brief Minimal JSON reader for the flat header object
 *
 * Reads the four known keys and skips anything else, including nested
 * values, so newer clients may add fields.
 */
class header_reader {
public:
    explicit header_reader(std::string_view input) : input_(input) {}

    auto read(file_header& header) -> bool {
        skip_ws();
        if (!consume('{')) {
            return fail("expected '{'");
        }

        skip_ws();
        if (consume('}')) {
            return finish();
        }

        while (true) {
            skip_ws();
            std::string key;
            if (!parse_string(key)) {
                return fail("expected string key");
            }
            skip_ws();
            if (!consume(':')) {
                return fail("expected ':' after key");
            }
            skip_ws();

            if (!read_field(key, header)) {
                return false;
            }

            skip_ws();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return finish();
            }
            return fail("expected ',' or '}'");
        }
    }

    [[nodiscard]] auto error_message() const -> const std::string& { return error_; }

private:
    auto read_field(const std::string& key, file_header& header) -> bool {
        if (key == "name" || key == "mime") {
            auto& target = key == "name" ? header.name : header.mime;
            if (consume_literal("null")) {
                return true;
            }
            if (!parse_string(target)) {
                return fail("field '" + key + "' must be a string");
            }
            return true;
        }

        if (key == "size" || key == "lastModified") {
            auto& target = key == "size" ? header.size : header.last_modified;
            if (consume_literal("null")) {
                return true;
            }
            if (!parse_integer(target)) {
                return fail("field '" + key + "' must be an integer");
            }
            return true;
        }

        if (!skip_value(0)) {
            return fail("malformed value for '" + key + "'");
        }
        return true;
    }

    auto finish() -> bool {
        skip_ws();
        if (pos_ != input_.size()) {
            return fail("trailing characters after object");
        }
        return true;
    }

    auto fail(std::string message) -> bool {
        if (error_.empty()) {
            error_ = std::move(message) + " at offset " + std::to_string(pos_);
        }
        return false;
    }

    void skip_ws() {
        while (pos_ < input_.size() &&
               (input_[pos_] == ' ' || input_[pos_] == '\t' ||
                input_[pos_] == '\n' || input_[pos_] == '\r')) {
            ++pos_;
        }
    }

    auto consume(char c) -> bool {
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    auto parse_hex4(uint32_t& out) -> bool {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char c = input_[pos_++];
            out <<= 4;
            if (c >= '0' && c <= '9') {
                out |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                out |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                out |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return false;
            }
        }
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    auto parse_string(std::string& out) -> bool {
        if (!consume('"')) {
            return false;
        }
        out.clear();

        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return false;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= input_.size()) {
                return false;
            }
            char esc = input_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(cp)) {
                        return false;
                    }
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (!consume('\\') || !consume('u') || !parse_hex4(low) ||
                            low < 0xDC00 || low > 0xDFFF) {
                            return false;
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        return false;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    // JSON number grammar, restricted to integers that fit int64_t.
    auto parse_integer(int64_t& out) -> bool {
        bool negative = consume('-');
        if (pos_ >= input_.size() || input_[pos_] < '0' || input_[pos_] > '9') {
            return false;
        }
        if (input_[pos_] == '0' && pos_ + 1 < input_.size() &&
            input_[pos_ + 1] >= '0' && input_[pos_ + 1] <= '9') {
            return false;
        }

        uint64_t magnitude = 0;
        const uint64_t limit = negative
            ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
            : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

        while (pos_ < input_.size() && input_[pos_] >= '0' && input_[pos_] <= '9') {
            auto digit = static_cast<uint64_t>(input_[pos_] - '0');
            if (magnitude > (limit - digit) / 10) {
                return false;
            }
            magnitude = magnitude * 10 + digit;
            ++pos_;
        }

        if (pos_ < input_.size() &&
            (input_[pos_] == '.' || input_[pos_] == 'e' || input_[pos_] == 'E')) {
            return false;
        }

        if (negative) {
            out = magnitude == limit
                ? std::numeric_limits<int64_t>::min()
                : -static_cast<int64_t>(magnitude);
        } else {
            out = static_cast<int64_t>(magnitude);
        }
        return true;
    }

    auto skip_number() -> bool {
        consume('-');
        auto digits = [this] {
            auto start = pos_;
            while (pos_ < input_.size() && input_[pos_] >= '0' && input_[pos_] <= '9') {
                ++pos_;
            }
            return pos_ > start;
        };
        if (!digits()) {
            return false;
        }
        if (consume('.') && !digits()) {
            return false;
        }
        if (consume('e') || consume('E')) {
            if (!consume('+')) {
                consume('-');
            }
            if (!digits()) {
                return false;
            }
        }
        return true;
    }

    auto skip_value(int depth) -> bool {
        if (depth > max_nesting_depth || pos_ >= input_.size()) {
            return false;
        }

        char c = input_[pos_];
        if (c == '"') {
            std::string ignored;
            return parse_string(ignored);
        }
        if (c == '{' || c == '[') {
            const char close = c == '{' ? '}' : ']';
            ++pos_;
            skip_ws();
            if (consume(close)) {
                return true;
            }
            while (true) {
                skip_ws();
                if (c == '{') {
                    std::string ignored;
                    if (!parse_string(ignored)) {
                        return false;
                    }
                    skip_ws();
                    if (!consume(':')) {
                        return false;
                    }
                    skip_ws();
                }
                if (!skip_value(depth + 1)) {
                    return false;
                }
                skip_ws();
                if (consume(',')) {
                    continue;
                }
                return consume(close);
            }
        }
        if (consume_literal("true") || consume_literal("false") || consume_literal("null")) {
            return true;
        }
        return skip_number();
    }

    std::string_view input_;
    std::size_t pos_ = 0;
    std::string error_;
};

}  // namespace

auto parse_signal(std::string_view text) -> std::optional<control_signal> {
    for (auto signal : {control_signal::ready, control_signal::eof, control_signal::eot}) {
        if (text == to_string(signal)) {
            return signal;
        }
    }
    return std::nullopt;
}

auto encode_header(const file_header& header) -> std::string {
    std::ostringstream oss;
    oss << "{\"name\":\"" << detail::escape_json(header.name) << "\""
        << ",\"size\":" << header.size
        << ",\"lastModified\":" << header.last_modified
        << ",\"mime\":\"" << detail::escape_json(header.mime) << "\"}";
    return oss.str();
}

auto decode_header(std::string_view json) -> result<file_header> {
    file_header header;
    header_reader reader(json);

    if (!reader.read(header)) {
        PORTAL_LOG_DEBUG(log_category::session,
            "Rejected header: " + reader.error_message());
        return unexpected{error{error_code::header_error,
            "invalid header: " + reader.error_message()}};
    }

    if (header.name.empty()) {
        return unexpected{error{error_code::header_error, "invalid header: empty name"}};
    }

    return header;
}

auto classify(channel_message message) -> inbound_message {
    if (message.kind == message_kind::binary) {
        return payload_frame{std::move(message.data)};
    }

    auto text = message.text();
    if (auto signal = parse_signal(text)) {
        return *signal;
    }
    return text_frame{std::move(text)};
}

}  // namespace portal
