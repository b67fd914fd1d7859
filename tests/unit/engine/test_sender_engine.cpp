/**
 * @file test_sender_engine.cpp
 * @brief Unit tests for sender_engine against a scripted receiver
 */

#include <gtest/gtest.h>

#include <portal/engine/sender_engine.h>

#include "memory_channel.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace portal::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class SenderEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [local, remote] = memory_channel::make_pair();
        local_ = std::move(local);
        peer_ = std::move(remote);
    }

    // Next message seen by the receiving side; fails the test on timeout.
    auto expect_message() -> channel_message {
        auto got = peer_->receive_for(5s);
        EXPECT_TRUE(got.has_value()) << "timed out waiting for a message";
        if (!got || !got->has_value()) {
            return channel_message{};
        }
        return std::move(got->value());
    }

    auto expect_text(const std::string& expected) -> void {
        auto message = expect_message();
        EXPECT_TRUE(message.is_text());
        EXPECT_EQ(message.text(), expected);
    }

    // Collect payload frames up to EOF and decode them.
    auto collect_payload(codec_type codec = codec_type::gzip) -> std::string {
        stream_decoder decoder(codec);
        std::string content;
        auto sink = [&content](std::span<const std::byte> bytes) -> result<void> {
            content.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            return {};
        };

        while (true) {
            auto message = expect_message();
            if (message.is_text()) {
                EXPECT_EQ(message.text(), "EOF");
                break;
            }
            EXPECT_TRUE(decoder.update(message.data, sink).has_value());
        }
        EXPECT_TRUE(decoder.finish().has_value());
        return content;
    }

    static auto make_header(const std::string& name, int64_t size) -> file_header {
        file_header header;
        header.name = name;
        header.size = size;
        header.last_modified = 1700000000000;
        header.mime = "text/plain";
        return header;
    }

    std::unique_ptr<memory_channel> local_;
    std::unique_ptr<memory_channel> peer_;
};

TEST_F(SenderEngineTest, FullCycle) {
    sender_engine sender(*local_);
    std::istringstream content("hello world");

    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("docs/a.txt", 11), content);
    });

    auto header_message = expect_message();
    ASSERT_TRUE(header_message.is_text());
    auto header = decode_header(header_message.text());
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header.value().name, "docs/a.txt");
    EXPECT_EQ(header.value().size, 11);
    EXPECT_EQ(header.value().last_modified, 1700000000000);

    // Nothing but the header is sent before READY
    EXPECT_FALSE(peer_->receive_for(50ms).has_value());
    EXPECT_EQ(sender.state(), sender_state::awaiting_ready);

    ASSERT_TRUE(peer_->send_text("READY").has_value());
    EXPECT_EQ(collect_payload(), "hello world");

    auto sent = transmit.get();
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    EXPECT_EQ(sent.value().bytes_read, 11u);
    EXPECT_GT(sent.value().bytes_sent, 0u);
    EXPECT_EQ(sender.pending_acks(), 1u);
    EXPECT_EQ(sender.state(), sender_state::awaiting_ack);

    ASSERT_TRUE(peer_->send_text("EOF").has_value());
    ASSERT_TRUE(sender.await_acks().has_value());
    EXPECT_EQ(sender.pending_acks(), 0u);
    EXPECT_EQ(sender.state(), sender_state::idle);

    ASSERT_TRUE(sender.end().has_value());
    expect_text("EOT");
}

TEST_F(SenderEngineTest, ZeroByteFile) {
    sender_engine sender(*local_);
    std::istringstream content("");

    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("empty.bin", 0), content);
    });

    expect_message();
    ASSERT_TRUE(peer_->send_text("READY").has_value());
    EXPECT_EQ(collect_payload(), "");

    auto sent = transmit.get();
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    EXPECT_EQ(sent.value().bytes_read, 0u);
}

TEST_F(SenderEngineTest, ErrorTextInsteadOfReadyFails) {
    sender_engine sender(*local_);
    std::istringstream content("data");

    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("../escape.txt", 4), content);
    });

    expect_message();
    ASSERT_TRUE(peer_->send_text("path violation: ../escape.txt").has_value());

    auto sent = transmit.get();
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::protocol_error);
    EXPECT_EQ(sent.error().message, "path violation: ../escape.txt");

    // No payload followed the rejected header
    EXPECT_FALSE(peer_->receive_for(50ms).has_value());
}

TEST_F(SenderEngineTest, UnexpectedControlInsteadOfReadyFails) {
    sender_engine sender(*local_);
    std::istringstream content("data");

    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("a.txt", 4), content);
    });

    expect_message();
    ASSERT_TRUE(peer_->send_text("EOT").has_value());

    auto sent = transmit.get();
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::protocol_error);
}

TEST_F(SenderEngineTest, PeerCloseWhileAwaitingReady) {
    sender_engine sender(*local_);
    std::istringstream content("data");

    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("a.txt", 4), content);
    });

    expect_message();
    peer_->close_with_error("disk full");

    auto sent = transmit.get();
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::connection_closed);
}

TEST_F(SenderEngineTest, PendingAckConsumedByNextTransmit) {
    sender_engine sender(*local_);
    std::istringstream first("first"), second("second");

    auto transmit_both = std::async(std::launch::async, [&]() -> result<void> {
        auto a = sender.transmit(make_header("a.txt", 5), first);
        if (!a) return unexpected{a.error()};
        auto b = sender.transmit(make_header("b.txt", 6), second);
        if (!b) return unexpected{b.error()};
        return {};
    });

    auto header_a = decode_header(expect_message().text());
    ASSERT_TRUE(header_a.has_value());
    EXPECT_EQ(header_a.value().name, "a.txt");
    ASSERT_TRUE(peer_->send_text("READY").has_value());
    EXPECT_EQ(collect_payload(), "first");

    // The second header goes out before the first file is acknowledged
    auto header_b = decode_header(expect_message().text());
    ASSERT_TRUE(header_b.has_value());
    EXPECT_EQ(header_b.value().name, "b.txt");

    ASSERT_TRUE(peer_->send_text("EOF").has_value());
    ASSERT_TRUE(peer_->send_text("READY").has_value());
    EXPECT_EQ(collect_payload(), "second");

    ASSERT_TRUE(transmit_both.get().has_value());
    EXPECT_EQ(sender.pending_acks(), 1u);

    ASSERT_TRUE(peer_->send_text("EOF").has_value());
    ASSERT_TRUE(sender.await_acks().has_value());
    EXPECT_EQ(sender.pending_acks(), 0u);
}

TEST_F(SenderEngineTest, ConcurrentTransmitsAreSerialized) {
    sender_engine sender(*local_);
    std::istringstream first("one"), second("two");

    auto a = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("one.txt", 3), first);
    });
    auto header_1 = decode_header(expect_message().text());
    ASSERT_TRUE(header_1.has_value());
    EXPECT_EQ(header_1.value().name, "one.txt");

    auto b = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("two.txt", 3), second);
    });

    // The second caller waits on the gate while the first awaits READY
    EXPECT_FALSE(peer_->receive_for(100ms).has_value());

    ASSERT_TRUE(peer_->send_text("READY").has_value());
    auto first_content = collect_payload();

    auto header_2 = decode_header(expect_message().text());
    ASSERT_TRUE(header_2.has_value());
    EXPECT_EQ(header_2.value().name, "two.txt");

    ASSERT_TRUE(peer_->send_text("EOF").has_value());
    ASSERT_TRUE(peer_->send_text("READY").has_value());
    auto second_content = collect_payload();

    EXPECT_TRUE(a.get().has_value());
    EXPECT_TRUE(b.get().has_value());
    EXPECT_EQ(first_content, "one");
    EXPECT_EQ(second_content, "two");
}

TEST_F(SenderEngineTest, BackpressureHoldsFramesUntilBufferDrains) {
    sender_config config;
    config.buffered_threshold = 1024;
    config.poll_interval = 5ms;
    sender_engine sender(*local_, config);

    std::istringstream content(std::string(10000, 'x'));
    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("big.txt", 10000), content);
    });

    expect_message();
    local_->set_buffered_amount(4096);
    ASSERT_TRUE(peer_->send_text("READY").has_value());

    // Over the threshold: no payload frame is sent
    EXPECT_FALSE(peer_->receive_for(100ms).has_value());
    EXPECT_EQ(sender.state(), sender_state::streaming);

    local_->set_buffered_amount(0);
    EXPECT_EQ(collect_payload(), std::string(10000, 'x'));
    EXPECT_TRUE(transmit.get().has_value());
}

TEST_F(SenderEngineTest, ProgressIsReported) {
    sender_config config;
    config.read_chunk_size = 4;
    sender_engine sender(*local_, config);

    std::vector<transfer_progress> updates;
    sender.on_progress([&updates](const transfer_progress& progress) {
        updates.push_back(progress);
    });

    std::istringstream content("0123456789");
    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(make_header("digits.txt", 10), content);
    });
    expect_message();
    ASSERT_TRUE(peer_->send_text("READY").has_value());
    collect_payload();
    ASSERT_TRUE(transmit.get().has_value());

    ASSERT_EQ(updates.size(), 3u);
    EXPECT_EQ(updates[0].bytes_read, 4u);
    EXPECT_EQ(updates[2].bytes_read, 10u);
    EXPECT_EQ(updates[2].total_size, 10);
    EXPECT_EQ(updates[2].name, "digits.txt");
}

TEST_F(SenderEngineTest, EndIsSentOnceAndBlocksFurtherTransmits) {
    sender_engine sender(*local_);

    ASSERT_TRUE(sender.end().has_value());
    ASSERT_TRUE(sender.end().has_value());
    expect_text("EOT");
    EXPECT_FALSE(peer_->receive_for(50ms).has_value());

    std::istringstream content("late");
    auto sent = sender.transmit(make_header("late.txt", 4), content);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::protocol_error);
}

TEST_F(SenderEngineTest, LocalFileUsesFileMetadata) {
    auto dir = fs::temp_directory_path() /
               ("portal_sender_test_" + std::to_string(std::random_device{}()));
    fs::create_directories(dir);
    auto file = dir / "notes.md";
    std::ofstream(file) << "# notes";
    fs::last_write_time(file, std::chrono::file_clock::from_sys(
        std::chrono::sys_time<std::chrono::milliseconds>(
            std::chrono::milliseconds(1700000000000))));

    sender_engine sender(*local_);
    auto transmit = std::async(std::launch::async, [&] {
        return sender.transmit(file, std::string("shared/notes.md"));
    });

    auto header = decode_header(expect_message().text());
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header.value().name, "shared/notes.md");
    EXPECT_EQ(header.value().size, 7);
    EXPECT_EQ(header.value().last_modified, 1700000000000);
    EXPECT_EQ(header.value().mime, "text/markdown");

    ASSERT_TRUE(peer_->send_text("READY").has_value());
    EXPECT_EQ(collect_payload(), "# notes");
    EXPECT_TRUE(transmit.get().has_value());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_F(SenderEngineTest, MissingFileFailsBeforeSending) {
    sender_engine sender(*local_);

    auto sent = sender.transmit(fs::path("/nonexistent/portal/file.txt"));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::io_error);
    EXPECT_EQ(peer_->pending(), 0u);
}

TEST(MimeTypeTest, KnownAndUnknownExtensions) {
    EXPECT_EQ(guess_mime_type("a.txt"), "text/plain");
    EXPECT_EQ(guess_mime_type("photo.JPG"), "image/jpeg");
    EXPECT_EQ(guess_mime_type("archive.tar"), "application/x-tar");
    EXPECT_EQ(guess_mime_type("blob.xyz"), "application/octet-stream");
    EXPECT_EQ(guess_mime_type("Makefile"), "application/octet-stream");
}

}  // namespace portal::test
