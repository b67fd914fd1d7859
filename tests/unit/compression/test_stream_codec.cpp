/**
 * @file test_stream_codec.cpp
 * @brief Unit tests for stream_encoder and stream_decoder
 */

#include <gtest/gtest.h>

#include <portal/core/stream_codec.h>

#include <random>
#include <string>
#include <vector>

#include <zlib.h>

namespace portal::test {

namespace {

auto create_text_data(std::size_t size) -> std::vector<std::byte> {
    // Create highly compressible text content
    const std::string pattern = "The quick brown fox jumps over the lazy dog. ";
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(pattern[i % pattern.size()]);
    }
    return data;
}

auto create_random_data(std::size_t size, unsigned int seed = 42) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

auto encode_in_chunks(codec_type type, const std::vector<std::byte>& input,
                      std::size_t chunk_size,
                      compression_level level = compression_level::balanced)
    -> std::vector<std::byte> {
    stream_encoder encoder(type, level);
    std::vector<std::byte> out;
    for (std::size_t offset = 0; offset < input.size(); offset += chunk_size) {
        auto count = std::min(chunk_size, input.size() - offset);
        auto part = encoder.update(std::span<const std::byte>(input.data() + offset, count));
        EXPECT_TRUE(part.has_value());
        if (part.has_value()) {
            out.insert(out.end(), part.value().begin(), part.value().end());
        }
    }
    auto tail = encoder.finish();
    EXPECT_TRUE(tail.has_value());
    if (tail.has_value()) {
        out.insert(out.end(), tail.value().begin(), tail.value().end());
    }
    return out;
}

// Feed the stream in slices of the given size and collect the output.
auto decode_in_slices(codec_type type, const std::vector<std::byte>& input,
                      std::size_t slice_size) -> result<std::vector<std::byte>> {
    stream_decoder decoder(type);
    std::vector<std::byte> out;
    auto sink = [&out](std::span<const std::byte> bytes) -> result<void> {
        out.insert(out.end(), bytes.begin(), bytes.end());
        return {};
    };

    for (std::size_t offset = 0; offset < input.size(); offset += slice_size) {
        auto count = std::min(slice_size, input.size() - offset);
        auto decoded = decoder.update(std::span<const std::byte>(input.data() + offset, count),
                                      sink);
        if (!decoded) {
            return unexpected{decoded.error()};
        }
    }
    auto finished = decoder.finish();
    if (!finished) {
        return unexpected{finished.error()};
    }
    return out;
}

}  // namespace

// =============================================================================
// Codec Name Tests
// =============================================================================

TEST(CodecTypeTest, Names) {
    EXPECT_EQ(to_string(codec_type::gzip), "gzip");
    EXPECT_EQ(to_string(codec_type::lz4), "lz4");
    EXPECT_EQ(parse_codec("gzip"), codec_type::gzip);
    EXPECT_EQ(parse_codec("lz4"), codec_type::lz4);
    EXPECT_FALSE(parse_codec("zstd").has_value());
    EXPECT_FALSE(parse_codec("GZIP").has_value());
}

// =============================================================================
// gzip Tests
// =============================================================================

class GzipCodecTest : public ::testing::Test {};

TEST_F(GzipCodecTest, TextSurvivesChunkedRoundTrip) {
    auto input = create_text_data(300 * 1024);
    auto compressed = encode_in_chunks(codec_type::gzip, input, 64 * 1024);

    EXPECT_LT(compressed.size(), input.size() / 10);

    auto decoded = decode_in_slices(codec_type::gzip, compressed, 1000);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded.value(), input);
}

TEST_F(GzipCodecTest, RandomDataByteAtATime) {
    auto input = create_random_data(4096);
    auto compressed = encode_in_chunks(codec_type::gzip, input, 333, compression_level::high);

    auto decoded = decode_in_slices(codec_type::gzip, compressed, 1);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded.value(), input);
}

TEST_F(GzipCodecTest, OutputIsStandardGzip) {
    auto input = create_text_data(10000);
    auto compressed = encode_in_chunks(codec_type::gzip, input, 4096, compression_level::fast);

    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(compressed[0], std::byte{0x1f});
    EXPECT_EQ(compressed[1], std::byte{0x8b});

    // zlib's own gzip inflater accepts the stream
    std::vector<std::byte> out(input.size());
    z_stream stream{};
    ASSERT_EQ(inflateInit2(&stream, 15 + 16), Z_OK);
    stream.next_in = reinterpret_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(inflate(&stream, Z_FINISH), Z_STREAM_END);
    EXPECT_EQ(stream.total_out, input.size());
    inflateEnd(&stream);
    EXPECT_EQ(out, input);
}

TEST_F(GzipCodecTest, EmptyInputProducesValidStream) {
    auto compressed = encode_in_chunks(codec_type::gzip, {}, 1024);
    EXPECT_FALSE(compressed.empty());

    auto decoded = decode_in_slices(codec_type::gzip, compressed, 7);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(decoded.value().empty());
}

TEST_F(GzipCodecTest, ConcatenatedMembersDecodeAsOne) {
    auto first = create_text_data(5000);
    auto second = create_random_data(3000, 7);
    auto stream = encode_in_chunks(codec_type::gzip, first, 1024);
    auto tail = encode_in_chunks(codec_type::gzip, second, 1024);
    stream.insert(stream.end(), tail.begin(), tail.end());

    auto decoded = decode_in_slices(codec_type::gzip, stream, 512);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

    auto expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(decoded.value(), expected);
}

TEST_F(GzipCodecTest, EmptyStreamIsDecodeError) {
    stream_decoder decoder(codec_type::gzip);
    auto finished = decoder.finish();
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error().code, error_code::decode_error);
}

TEST_F(GzipCodecTest, TruncatedStreamIsDecodeError) {
    auto compressed = encode_in_chunks(codec_type::gzip, create_random_data(8192), 8192);
    compressed.resize(compressed.size() - 6);

    auto decoded = decode_in_slices(codec_type::gzip, compressed, 1024);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::decode_error);
}

TEST_F(GzipCodecTest, GarbageIsDecodeError) {
    std::string junk = "this is not a gzip stream at all";
    std::vector<std::byte> input(reinterpret_cast<const std::byte*>(junk.data()),
                                 reinterpret_cast<const std::byte*>(junk.data()) + junk.size());

    auto decoded = decode_in_slices(codec_type::gzip, input, 16);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::decode_error);
}

TEST_F(GzipCodecTest, SinkErrorStopsDecoding) {
    auto compressed = encode_in_chunks(codec_type::gzip, create_text_data(100000), 100000);

    stream_decoder decoder(codec_type::gzip);
    auto decoded = decoder.update(compressed, [](std::span<const std::byte>) -> result<void> {
        return unexpected{error{error_code::io_error, "disk full"}};
    });

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::io_error);
    EXPECT_EQ(decoded.error().message, "disk full");
}

TEST_F(GzipCodecTest, StatsCountBothSides) {
    auto input = create_text_data(50000);

    stream_encoder encoder(codec_type::gzip);
    auto part = encoder.update(input);
    ASSERT_TRUE(part.has_value());
    auto tail = encoder.finish();
    ASSERT_TRUE(tail.has_value());

    auto stats = encoder.stats();
    EXPECT_EQ(stats.uncompressed_bytes, input.size());
    EXPECT_EQ(stats.compressed_bytes, part.value().size() + tail.value().size());
    EXPECT_LT(stats.compression_ratio(), 0.1);
    EXPECT_EQ(encoder.type(), codec_type::gzip);
}

// =============================================================================
// LZ4 Tests
// =============================================================================

#ifndef PORTAL_ENABLE_LZ4

class Lz4CodecTest : public ::testing::Test {};

TEST_F(Lz4CodecTest, DisabledCodecReportsConfigurationError) {
    stream_encoder encoder(codec_type::lz4);
    auto encoded = encoder.update(create_text_data(100));
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, error_code::invalid_configuration);

    stream_decoder decoder(codec_type::lz4);
    auto decoded = decoder.finish();
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::invalid_configuration);
}

#else

class Lz4CodecTest : public ::testing::Test {};

TEST_F(Lz4CodecTest, TextSurvivesChunkedRoundTrip) {
    auto input = create_text_data(300 * 1024);
    auto compressed = encode_in_chunks(codec_type::lz4, input, 64 * 1024);

    EXPECT_LT(compressed.size(), input.size() / 4);

    auto decoded = decode_in_slices(codec_type::lz4, compressed, 999);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded.value(), input);
}

TEST_F(Lz4CodecTest, HighLevelRoundTrip) {
    auto input = create_random_data(20000);
    auto compressed = encode_in_chunks(codec_type::lz4, input, 4096, compression_level::high);

    auto decoded = decode_in_slices(codec_type::lz4, compressed, 3);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded.value(), input);
}

TEST_F(Lz4CodecTest, FrameMagic) {
    auto compressed = encode_in_chunks(codec_type::lz4, create_text_data(1000), 1000);

    ASSERT_GE(compressed.size(), 4u);
    EXPECT_EQ(compressed[0], std::byte{0x04});
    EXPECT_EQ(compressed[1], std::byte{0x22});
    EXPECT_EQ(compressed[2], std::byte{0x4d});
    EXPECT_EQ(compressed[3], std::byte{0x18});
}

TEST_F(Lz4CodecTest, EmptyInputProducesValidFrame) {
    auto compressed = encode_in_chunks(codec_type::lz4, {}, 1024);
    auto decoded = decode_in_slices(codec_type::lz4, compressed, 5);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(decoded.value().empty());
}

TEST_F(Lz4CodecTest, TruncatedFrameIsDecodeError) {
    auto compressed = encode_in_chunks(codec_type::lz4, create_random_data(10000), 10000);
    compressed.resize(compressed.size() / 2);

    auto decoded = decode_in_slices(codec_type::lz4, compressed, 1024);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::decode_error);
}

TEST_F(Lz4CodecTest, EmptyStreamIsDecodeError) {
    stream_decoder decoder(codec_type::lz4);
    auto finished = decoder.finish();
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error().code, error_code::decode_error);
}

#endif  // PORTAL_ENABLE_LZ4

}  // namespace portal::test
