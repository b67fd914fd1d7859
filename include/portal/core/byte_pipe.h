/**
 * @file byte_pipe.h
 * @brief Bounded byte hand-off between a producer and a consumer thread
 */

#ifndef PORTAL_CORE_BYTE_PIPE_H
#define PORTAL_CORE_BYTE_PIPE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include <portal/core/types.h>

namespace portal {

/**
 * @brief Bounded queue of byte blocks with half-close in both directions
 *
 * The producer calls write() and close_write() once input is complete. The
 * consumer calls read() until it returns std::nullopt (end of input), or
 * abort() to fail the producer's pending and later writes with an error.
 *
 * write() blocks while the buffered byte count would exceed the capacity.
 * A block larger than the capacity is still accepted once the queue is
 * empty, so oversized frames cannot deadlock the pipe.
 */
class byte_pipe {
public:
    static constexpr std::size_t default_capacity = 1024 * 1024;

    explicit byte_pipe(std::size_t capacity = default_capacity);

    byte_pipe(const byte_pipe&) = delete;
    auto operator=(const byte_pipe&) -> byte_pipe& = delete;

    /**
     * @brief Append a block, blocking while the pipe is full
     * @return The abort error once the consumer has aborted, or
     *         internal_error after close_write()
     */
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Take the next block, blocking while the pipe is empty and open
     * @return The block, std::nullopt at end of input, or the abort error
     */
    [[nodiscard]] auto read() -> result<std::optional<std::vector<std::byte>>>;

    /**
     * @brief Producer side: no more input will follow
     */
    void close_write();

    /**
     * @brief Fail both ends with the given error and discard queued data
     */
    void abort(error reason);

    [[nodiscard]] auto buffered() const -> std::size_t;

    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable readable_cv_;
    std::condition_variable writable_cv_;
    std::deque<std::vector<std::byte>> blocks_;
    std::size_t buffered_ = 0;
    bool write_closed_ = false;
    std::optional<error> abort_reason_;
};

}  // namespace portal

#endif  // PORTAL_CORE_BYTE_PIPE_H
