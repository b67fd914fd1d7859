/**
 * @file stream_codec.cpp
 * @brief gzip (zlib) and LZ4 frame streaming codec implementation
 */

#include <portal/core/stream_codec.h>
#include <portal/core/logging.h>

#include <algorithm>
#include <limits>
#include <string>

#include <zlib.h>

#ifdef PORTAL_ENABLE_LZ4
#include <lz4frame.h>
#include <lz4hc.h>
#endif

namespace portal {

namespace {

// Output scratch size per codec call
constexpr std::size_t scratch_size = 64 * 1024;

// Largest slice handed to zlib in one call (avail_in is 32-bit)
constexpr std::size_t max_zlib_slice = 1u << 30;

// zlib window bits plus 16 selects the gzip wrapper
constexpr int gzip_window_bits = 15 + 16;

auto append(std::vector<std::byte>& out, const std::byte* data, std::size_t size) -> void {
    out.insert(out.end(), data, data + size);
}

class encoder_backend {
public:
    virtual ~encoder_backend() = default;
    virtual auto update(std::span<const std::byte> input, std::vector<std::byte>& out)
        -> result<void> = 0;
    virtual auto finish(std::vector<std::byte>& out) -> result<void> = 0;
};

class decoder_backend {
public:
    virtual ~decoder_backend() = default;
    virtual auto update(std::span<const std::byte> input, const stream_decoder::sink& output,
                        uint64_t& produced) -> result<void> = 0;
    virtual auto finish() -> result<void> = 0;
};

auto zlib_level(compression_level level) -> int {
    switch (level) {
        case compression_level::fast: return Z_BEST_SPEED;
        case compression_level::high: return Z_BEST_COMPRESSION;
        case compression_level::balanced:
        default: return Z_DEFAULT_COMPRESSION;
    }
}

class gzip_encoder final : public encoder_backend {
public:
    explicit gzip_encoder(compression_level level) {
        int ret = deflateInit2(&stream_, zlib_level(level), Z_DEFLATED,
                               gzip_window_bits, 8, Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            init_error_ = error{error_code::encode_error,
                "deflateInit2 failed: " + std::to_string(ret)};
        } else {
            initialized_ = true;
        }
    }

    ~gzip_encoder() override {
        if (initialized_) {
            deflateEnd(&stream_);
        }
    }

    auto update(std::span<const std::byte> input, std::vector<std::byte>& out)
        -> result<void> override {
        while (!input.empty()) {
            auto slice = input.first(std::min(input.size(), max_zlib_slice));
            auto ret = run(slice, Z_NO_FLUSH, out);
            if (!ret) {
                return ret;
            }
            input = input.subspan(slice.size());
        }
        return {};
    }

    auto finish(std::vector<std::byte>& out) -> result<void> override {
        return run({}, Z_FINISH, out);
    }

private:
    auto run(std::span<const std::byte> input, int flush, std::vector<std::byte>& out)
        -> result<void> {
        if (init_error_) {
            return unexpected{*init_error_};
        }

        stream_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
        stream_.avail_in = static_cast<uInt>(input.size());

        std::byte scratch[scratch_size];
        int ret = Z_OK;
        do {
            stream_.next_out = reinterpret_cast<Bytef*>(scratch);
            stream_.avail_out = static_cast<uInt>(scratch_size);

            ret = deflate(&stream_, flush);
            if (ret == Z_STREAM_ERROR) {
                return unexpected{error{error_code::encode_error, "deflate stream error"}};
            }
            append(out, scratch, scratch_size - stream_.avail_out);
        } while (stream_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));

        return {};
    }

    z_stream stream_{};
    bool initialized_ = false;
    std::optional<error> init_error_;
};

class gzip_decoder final : public decoder_backend {
public:
    gzip_decoder() {
        int ret = inflateInit2(&stream_, gzip_window_bits);
        if (ret != Z_OK) {
            init_error_ = error{error_code::decode_error,
                "inflateInit2 failed: " + std::to_string(ret)};
        } else {
            initialized_ = true;
        }
    }

    ~gzip_decoder() override {
        if (initialized_) {
            inflateEnd(&stream_);
        }
    }

    auto update(std::span<const std::byte> input, const stream_decoder::sink& output,
                uint64_t& produced) -> result<void> override {
        if (init_error_) {
            return unexpected{*init_error_};
        }

        while (!input.empty()) {
            auto slice = input.first(std::min(input.size(), max_zlib_slice));
            auto ret = inflate_slice(slice, output, produced);
            if (!ret) {
                return ret;
            }
            input = input.subspan(slice.size());
        }
        return {};
    }

    auto finish() -> result<void> override {
        if (init_error_) {
            return unexpected{*init_error_};
        }
        if (!received_any_) {
            return unexpected{error{error_code::decode_error, "empty compressed stream"}};
        }
        if (!member_complete_) {
            return unexpected{error{error_code::decode_error, "truncated gzip stream"}};
        }
        return {};
    }

private:
    auto inflate_slice(std::span<const std::byte> input, const stream_decoder::sink& output,
                       uint64_t& produced) -> result<void> {
        received_any_ = true;
        stream_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
        stream_.avail_in = static_cast<uInt>(input.size());

        std::byte scratch[scratch_size];
        while (stream_.avail_in > 0) {
            if (member_complete_) {
                // Another gzip member follows the previous trailer.
                inflateReset(&stream_);
                member_complete_ = false;
            }

            do {
                stream_.next_out = reinterpret_cast<Bytef*>(scratch);
                stream_.avail_out = static_cast<uInt>(scratch_size);

                int ret = inflate(&stream_, Z_NO_FLUSH);
                if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                    std::string reason = stream_.msg ? stream_.msg : "inflate failed";
                    return unexpected{error{error_code::decode_error,
                        "corrupt gzip stream: " + reason}};
                }

                auto count = scratch_size - stream_.avail_out;
                if (count > 0) {
                    produced += count;
                    auto written = output(std::span<const std::byte>(scratch, count));
                    if (!written) {
                        return written;
                    }
                }

                if (ret == Z_STREAM_END) {
                    member_complete_ = true;
                    break;
                }
                if (ret == Z_BUF_ERROR && count == 0) {
                    break;
                }
            } while (stream_.avail_out == 0);

            if (!member_complete_ && stream_.avail_in > 0 && stream_.avail_out != 0) {
                // inflate made no progress on the remaining input
                return unexpected{error{error_code::decode_error, "gzip stream stalled"}};
            }
        }
        return {};
    }

    z_stream stream_{};
    bool initialized_ = false;
    bool received_any_ = false;
    bool member_complete_ = false;
    std::optional<error> init_error_;
};

#ifdef PORTAL_ENABLE_LZ4

class lz4_encoder final : public encoder_backend {
public:
    explicit lz4_encoder(compression_level level) {
        auto ret = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
        if (LZ4F_isError(ret)) {
            init_error_ = error{error_code::encode_error,
                std::string("LZ4F_createCompressionContext failed: ") + LZ4F_getErrorName(ret)};
            ctx_ = nullptr;
        }
        prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
        prefs_.compressionLevel = level == compression_level::high ? LZ4HC_CLEVEL_DEFAULT : 0;
    }

    ~lz4_encoder() override {
        if (ctx_) {
            LZ4F_freeCompressionContext(ctx_);
        }
    }

    auto update(std::span<const std::byte> input, std::vector<std::byte>& out)
        -> result<void> override {
        auto begun = begin(out);
        if (!begun) {
            return begun;
        }

        while (!input.empty()) {
            auto slice = input.first(std::min(input.size(), scratch_size));
            std::vector<std::byte> dst(LZ4F_compressBound(slice.size(), &prefs_));

            auto n = LZ4F_compressUpdate(ctx_, dst.data(), dst.size(),
                                         slice.data(), slice.size(), nullptr);
            if (LZ4F_isError(n)) {
                return unexpected{error{error_code::encode_error,
                    std::string("LZ4F_compressUpdate failed: ") + LZ4F_getErrorName(n)}};
            }
            append(out, dst.data(), n);
            input = input.subspan(slice.size());
        }
        return {};
    }

    auto finish(std::vector<std::byte>& out) -> result<void> override {
        auto begun = begin(out);
        if (!begun) {
            return begun;
        }

        std::vector<std::byte> dst(LZ4F_compressBound(0, &prefs_));
        auto n = LZ4F_compressEnd(ctx_, dst.data(), dst.size(), nullptr);
        if (LZ4F_isError(n)) {
            return unexpected{error{error_code::encode_error,
                std::string("LZ4F_compressEnd failed: ") + LZ4F_getErrorName(n)}};
        }
        append(out, dst.data(), n);
        return {};
    }

private:
    auto begin(std::vector<std::byte>& out) -> result<void> {
        if (init_error_) {
            return unexpected{*init_error_};
        }
        if (begun_) {
            return {};
        }

        std::byte header[LZ4F_HEADER_SIZE_MAX];
        auto n = LZ4F_compressBegin(ctx_, header, sizeof(header), &prefs_);
        if (LZ4F_isError(n)) {
            return unexpected{error{error_code::encode_error,
                std::string("LZ4F_compressBegin failed: ") + LZ4F_getErrorName(n)}};
        }
        append(out, header, n);
        begun_ = true;
        return {};
    }

    LZ4F_cctx* ctx_ = nullptr;
    LZ4F_preferences_t prefs_{};
    bool begun_ = false;
    std::optional<error> init_error_;
};

class lz4_decoder final : public decoder_backend {
public:
    lz4_decoder() {
        auto ret = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
        if (LZ4F_isError(ret)) {
            init_error_ = error{error_code::decode_error,
                std::string("LZ4F_createDecompressionContext failed: ") +
                LZ4F_getErrorName(ret)};
            ctx_ = nullptr;
        }
    }

    ~lz4_decoder() override {
        if (ctx_) {
            LZ4F_freeDecompressionContext(ctx_);
        }
    }

    auto update(std::span<const std::byte> input, const stream_decoder::sink& output,
                uint64_t& produced) -> result<void> override {
        if (init_error_) {
            return unexpected{*init_error_};
        }
        if (!input.empty()) {
            received_any_ = true;
        }

        std::byte scratch[scratch_size];
        bool output_full = false;
        while (!input.empty() || output_full) {
            std::size_t dst_size = scratch_size;
            std::size_t src_size = input.size();

            auto hint = LZ4F_decompress(ctx_, scratch, &dst_size,
                                        input.data(), &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                return unexpected{error{error_code::decode_error,
                    std::string("corrupt lz4 stream: ") + LZ4F_getErrorName(hint)}};
            }
            input = input.subspan(src_size);
            frame_remaining_ = hint;

            if (dst_size > 0) {
                produced += dst_size;
                auto written = output(std::span<const std::byte>(scratch, dst_size));
                if (!written) {
                    return written;
                }
            }
            output_full = dst_size == scratch_size;

            if (src_size == 0 && dst_size == 0) {
                break;
            }
        }
        return {};
    }

    auto finish() -> result<void> override {
        if (init_error_) {
            return unexpected{*init_error_};
        }
        if (!received_any_) {
            return unexpected{error{error_code::decode_error, "empty compressed stream"}};
        }
        if (frame_remaining_ != 0) {
            return unexpected{error{error_code::decode_error, "truncated lz4 stream"}};
        }
        return {};
    }

private:
    LZ4F_dctx* ctx_ = nullptr;
    std::size_t frame_remaining_ = 1;
    bool received_any_ = false;
    std::optional<error> init_error_;
};

#endif  // PORTAL_ENABLE_LZ4

// Stands in for a codec the build does not include; every call fails.
class unavailable_backend final : public encoder_backend, public decoder_backend {
public:
    explicit unavailable_backend(codec_type type)
        : reason_(error_code::invalid_configuration,
                  std::string(to_string(type)) + " codec not enabled in this build") {}

    auto update(std::span<const std::byte>, std::vector<std::byte>&) -> result<void> override {
        return unexpected{reason_};
    }
    auto finish(std::vector<std::byte>&) -> result<void> override {
        return unexpected{reason_};
    }
    auto update(std::span<const std::byte>, const stream_decoder::sink&, uint64_t&)
        -> result<void> override {
        return unexpected{reason_};
    }
    auto finish() -> result<void> override {
        return unexpected{reason_};
    }

private:
    error reason_;
};

auto make_encoder(codec_type type, compression_level level) -> std::unique_ptr<encoder_backend> {
    switch (type) {
        case codec_type::gzip:
            return std::make_unique<gzip_encoder>(level);
        case codec_type::lz4:
#ifdef PORTAL_ENABLE_LZ4
            return std::make_unique<lz4_encoder>(level);
#else
            PORTAL_LOG_WARN(log_category::codec, "LZ4 codec not enabled");
            break;
#endif
    }
    return std::make_unique<unavailable_backend>(type);
}

auto make_decoder(codec_type type) -> std::unique_ptr<decoder_backend> {
    switch (type) {
        case codec_type::gzip:
            return std::make_unique<gzip_decoder>();
        case codec_type::lz4:
#ifdef PORTAL_ENABLE_LZ4
            return std::make_unique<lz4_decoder>();
#else
            PORTAL_LOG_WARN(log_category::codec, "LZ4 codec not enabled");
            break;
#endif
    }
    return std::make_unique<unavailable_backend>(type);
}

}  // namespace

auto parse_codec(std::string_view name) -> std::optional<codec_type> {
    for (auto type : {codec_type::gzip, codec_type::lz4}) {
        if (name == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// stream_encoder

class stream_encoder::impl {
public:
    impl(codec_type type, compression_level level)
        : type_(type), backend_(make_encoder(type, level)) {}

    auto update(std::span<const std::byte> input) -> result<std::vector<std::byte>> {
        if (finished_) {
            return unexpected{error{error_code::encode_error, "update after finish"}};
        }

        std::vector<std::byte> out;
        auto ret = backend_->update(input, out);
        if (!ret) {
            PORTAL_LOG_ERROR(log_category::codec,
                std::string(to_string(type_)) + " encode failed: " + ret.error().message);
            return unexpected{ret.error()};
        }
        stats_.uncompressed_bytes += input.size();
        stats_.compressed_bytes += out.size();
        return out;
    }

    auto finish() -> result<std::vector<std::byte>> {
        if (finished_) {
            return std::vector<std::byte>{};
        }

        std::vector<std::byte> out;
        auto ret = backend_->finish(out);
        if (!ret) {
            PORTAL_LOG_ERROR(log_category::codec,
                std::string(to_string(type_)) + " encode finish failed: " + ret.error().message);
            return unexpected{ret.error()};
        }
        finished_ = true;
        stats_.compressed_bytes += out.size();

        PORTAL_LOG_TRACE(log_category::codec,
            "Encoded " + std::to_string(stats_.uncompressed_bytes) + " -> " +
            std::to_string(stats_.compressed_bytes) + " bytes (" +
            std::string(to_string(type_)) + ")");
        return out;
    }

    codec_type type_;
    std::unique_ptr<encoder_backend> backend_;
    codec_stats stats_;
    bool finished_ = false;
};

stream_encoder::stream_encoder(codec_type type, compression_level level)
    : impl_(std::make_unique<impl>(type, level)) {}

stream_encoder::~stream_encoder() = default;

stream_encoder::stream_encoder(stream_encoder&&) noexcept = default;

auto stream_encoder::operator=(stream_encoder&&) noexcept -> stream_encoder& = default;

auto stream_encoder::update(std::span<const std::byte> input)
    -> result<std::vector<std::byte>> {
    return impl_->update(input);
}

auto stream_encoder::finish() -> result<std::vector<std::byte>> {
    return impl_->finish();
}

auto stream_encoder::type() const -> codec_type {
    return impl_->type_;
}

auto stream_encoder::stats() const -> codec_stats {
    return impl_->stats_;
}

// stream_decoder

class stream_decoder::impl {
public:
    explicit impl(codec_type type) : type_(type), backend_(make_decoder(type)) {}

    auto update(std::span<const std::byte> input, const sink& output) -> result<void> {
        uint64_t produced = 0;
        auto ret = backend_->update(input, output, produced);
        stats_.compressed_bytes += input.size();
        stats_.uncompressed_bytes += produced;
        if (!ret) {
            PORTAL_LOG_DEBUG(log_category::codec,
                std::string(to_string(type_)) + " decode failed: " + ret.error().message);
        }
        return ret;
    }

    auto finish() -> result<void> {
        auto ret = backend_->finish();
        if (ret) {
            PORTAL_LOG_TRACE(log_category::codec,
                "Decoded " + std::to_string(stats_.compressed_bytes) + " -> " +
                std::to_string(stats_.uncompressed_bytes) + " bytes (" +
                std::string(to_string(type_)) + ")");
        }
        return ret;
    }

    codec_type type_;
    std::unique_ptr<decoder_backend> backend_;
    codec_stats stats_;
};

stream_decoder::stream_decoder(codec_type type)
    : impl_(std::make_unique<impl>(type)) {}

stream_decoder::~stream_decoder() = default;

stream_decoder::stream_decoder(stream_decoder&&) noexcept = default;

auto stream_decoder::operator=(stream_decoder&&) noexcept -> stream_decoder& = default;

auto stream_decoder::update(std::span<const std::byte> input, const sink& output)
    -> result<void> {
    return impl_->update(input, output);
}

auto stream_decoder::finish() -> result<void> {
    return impl_->finish();
}

auto stream_decoder::type() const -> codec_type {
    return impl_->type_;
}

auto stream_decoder::stats() const -> codec_stats {
    return impl_->stats_;
}

}  // namespace portal
