/**
 * @file stream_codec.h
 * @brief Streaming compression for file payloads (gzip and LZ4 frame)
 */

#ifndef PORTAL_CORE_STREAM_CODEC_H
#define PORTAL_CORE_STREAM_CODEC_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <portal/core/types.h>

namespace portal {

/**
 * @brief Wire compression format, fixed per server
 */
enum class codec_type {
    gzip,   ///< RFC 1952, what browsers produce with CompressionStream
    lz4     ///< LZ4 frame format with content checksum
};

[[nodiscard]] constexpr auto to_string(codec_type type) -> std::string_view {
    switch (type) {
        case codec_type::gzip: return "gzip";
        case codec_type::lz4: return "lz4";
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_codec(std::string_view name) -> std::optional<codec_type>;

enum class compression_level {
    fast,     ///< zlib level 1, LZ4 fast
    balanced, ///< zlib default, LZ4 fast
    high      ///< zlib level 9, LZ4 HC
};

/**
 * @brief Byte counters of one encoder or decoder
 */
struct codec_stats {
    uint64_t compressed_bytes = 0;
    uint64_t uncompressed_bytes = 0;

    [[nodiscard]] auto compression_ratio() const -> double {
        if (uncompressed_bytes == 0) return 1.0;
        return static_cast<double>(compressed_bytes) /
               static_cast<double>(uncompressed_bytes);
    }
};

/**
 * @brief Incremental compressor for one file
 *
 * @code
 * stream_encoder encoder(codec_type::gzip);
 * while (read(block)) {
 *     auto out = encoder.update(block);      // may be empty
 *     if (!out.value().empty()) send(out.value());
 * }
 * send(encoder.finish().value());           // trailer
 * @endcode
 */
class stream_encoder {
public:
    explicit stream_encoder(codec_type type = codec_type::gzip,
                            compression_level level = compression_level::balanced);
    ~stream_encoder();

    stream_encoder(const stream_encoder&) = delete;
    auto operator=(const stream_encoder&) -> stream_encoder& = delete;
    stream_encoder(stream_encoder&&) noexcept;
    auto operator=(stream_encoder&&) noexcept -> stream_encoder&;

    /**
     * @brief Feed uncompressed bytes
     * @return Compressed bytes produced so far (possibly none)
     */
    [[nodiscard]] auto update(std::span<const std::byte> input) -> result<std::vector<std::byte>>;

    /**
     * @brief Flush and terminate the stream
     * @return The remaining compressed bytes, including the trailer
     */
    [[nodiscard]] auto finish() -> result<std::vector<std::byte>>;

    [[nodiscard]] auto type() const -> codec_type;
    [[nodiscard]] auto stats() const -> codec_stats;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Incremental decompressor for one file
 *
 * Decoded bytes are delivered to the sink as they become available; a
 * failing sink aborts decoding with its error. Concatenated gzip members
 * and LZ4 frames decode as one stream.
 */
class stream_decoder {
public:
    using sink = std::function<result<void>(std::span<const std::byte>)>;

    explicit stream_decoder(codec_type type = codec_type::gzip);
    ~stream_decoder();

    stream_decoder(const stream_decoder&) = delete;
    auto operator=(const stream_decoder&) -> stream_decoder& = delete;
    stream_decoder(stream_decoder&&) noexcept;
    auto operator=(stream_decoder&&) noexcept -> stream_decoder&;

    /**
     * @brief Feed compressed bytes
     * @return decode_error on corrupt input, or the sink's error
     */
    [[nodiscard]] auto update(std::span<const std::byte> input, const sink& output)
        -> result<void>;

    /**
     * @brief Declare end of input
     * @return decode_error when the stream is empty or ends mid-frame
     */
    [[nodiscard]] auto finish() -> result<void>;

    [[nodiscard]] auto type() const -> codec_type;
    [[nodiscard]] auto stats() const -> codec_stats;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace portal

#endif  // PORTAL_CORE_STREAM_CODEC_H
