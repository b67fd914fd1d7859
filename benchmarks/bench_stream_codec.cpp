/**
 * @file bench_stream_codec.cpp
 * @brief Benchmarks for streaming payload compression and decompression
 */

#include <benchmark/benchmark.h>

#include <portal/core/byte_pipe.h>
#include <portal/core/stream_codec.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <random>
#include <string_view>
#include <thread>
#include <vector>

namespace portal::benchmark {

namespace {

constexpr std::size_t block_size = 64 * 1024;

auto generate_text_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    static constexpr std::string_view words[] = {
        "portal ", "transfer ", "session ", "header ", "payload ",
        "receiver ", "sender ", "stream ", "archive ", "document "};

    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> pick(0, std::size(words) - 1);

    std::vector<std::byte> data;
    data.reserve(size);
    while (data.size() < size) {
        for (char c : words[pick(gen)]) {
            if (data.size() == size) break;
            data.push_back(static_cast<std::byte>(c));
        }
    }
    return data;
}

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);

    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

auto encode_all(codec_type type, compression_level level, const std::vector<std::byte>& data)
    -> result<std::vector<std::byte>> {
    stream_encoder encoder(type, level);
    std::vector<std::byte> out;

    for (std::size_t offset = 0; offset < data.size(); offset += block_size) {
        auto len = std::min(block_size, data.size() - offset);
        auto chunk = encoder.update(std::span<const std::byte>(data.data() + offset, len));
        if (!chunk) {
            return unexpected{chunk.error()};
        }
        out.insert(out.end(), chunk.value().begin(), chunk.value().end());
    }

    auto tail = encoder.finish();
    if (!tail) {
        return unexpected{tail.error()};
    }
    out.insert(out.end(), tail.value().begin(), tail.value().end());
    return out;
}

}  // namespace

static void run_encode(::benchmark::State& state, codec_type type,
                       compression_level level, bool compressible) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = compressible ? generate_text_data(data_size, 42)
                             : generate_random_data(data_size, 42);

    std::size_t compressed = 0;
    for (auto _ : state) {
        auto result = encode_all(type, level, data);
        if (!result) {
            state.SkipWithError("Compression failed");
            return;
        }
        compressed = result.value().size();
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["ratio"] = static_cast<double>(compressed) /
                              static_cast<double>(data_size);
}

static void run_decode(::benchmark::State& state, codec_type type) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_text_data(data_size, 42);

    auto compressed = encode_all(type, compression_level::balanced, data);
    if (!compressed) {
        state.SkipWithError("Failed to prepare compressed data");
        return;
    }

    for (auto _ : state) {
        stream_decoder decoder(type);
        std::size_t produced = 0;
        auto sink = [&](std::span<const std::byte> chunk) -> result<void> {
            produced += chunk.size();
            return {};
        };

        const auto& input = compressed.value();
        for (std::size_t offset = 0; offset < input.size(); offset += block_size) {
            auto len = std::min(block_size, input.size() - offset);
            if (!decoder.update(std::span<const std::byte>(input.data() + offset, len), sink)) {
                state.SkipWithError("Decompression failed");
                return;
            }
        }
        if (!decoder.finish() || produced != data_size) {
            state.SkipWithError("Decompression incomplete");
            return;
        }
        ::benchmark::DoNotOptimize(produced);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_Gzip_Encode_Fast(::benchmark::State& state) {
    run_encode(state, codec_type::gzip, compression_level::fast, true);
}

static void BM_Gzip_Encode_Balanced(::benchmark::State& state) {
    run_encode(state, codec_type::gzip, compression_level::balanced, true);
}

static void BM_Gzip_Encode_Incompressible(::benchmark::State& state) {
    run_encode(state, codec_type::gzip, compression_level::balanced, false);
}

static void BM_Gzip_Decode(::benchmark::State& state) {
    run_decode(state, codec_type::gzip);
}

BENCHMARK(BM_Gzip_Encode_Fast)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Gzip_Encode_Balanced)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Gzip_Encode_Incompressible)->Arg(1024 * 1024)
    ->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Gzip_Decode)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

#ifdef PORTAL_ENABLE_LZ4
static void BM_LZ4_Encode_Fast(::benchmark::State& state) {
    run_encode(state, codec_type::lz4, compression_level::fast, true);
}

static void BM_LZ4_Encode_High(::benchmark::State& state) {
    run_encode(state, codec_type::lz4, compression_level::high, true);
}

static void BM_LZ4_Decode(::benchmark::State& state) {
    run_decode(state, codec_type::lz4);
}

BENCHMARK(BM_LZ4_Encode_Fast)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_LZ4_Encode_High)->Arg(1024 * 1024)->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_LZ4_Decode)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);
#endif

/**
 * @brief Producer/consumer throughput of the bounded pipe between socket and decoder
 */
static void BM_BytePipe_Throughput(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto block = generate_random_data(block_size, 7);

    for (auto _ : state) {
        byte_pipe pipe(1024 * 1024);
        std::thread producer([&] {
            for (std::size_t sent = 0; sent < data_size; sent += block.size()) {
                if (!pipe.write(block)) {
                    break;
                }
            }
            pipe.close_write();
        });

        std::size_t received = 0;
        while (true) {
            auto chunk = pipe.read();
            if (!chunk || !chunk.value()) {
                break;
            }
            received += chunk.value()->size();
        }
        producer.join();
        ::benchmark::DoNotOptimize(received);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_BytePipe_Throughput)->Arg(64 * 1024 * 1024)->Unit(::benchmark::kMillisecond);

}  // namespace portal::benchmark

BENCHMARK_MAIN();
