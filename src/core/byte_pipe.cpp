/**
 * @file byte_pipe.cpp
 * @brief Bounded byte pipe implementation
 */

#include <portal/core/byte_pipe.h>

namespace portal {

byte_pipe::byte_pipe(std::size_t capacity)
    : capacity_(capacity == 0 ? default_capacity : capacity) {}

auto byte_pipe::write(std::span<const std::byte> data) -> result<void> {
    std::unique_lock lock(mutex_);

    writable_cv_.wait(lock, [this, &data] {
        return abort_reason_.has_value() || write_closed_ || blocks_.empty() ||
               buffered_ + data.size() <= capacity_;
    });

    if (abort_reason_) {
        return unexpected{*abort_reason_};
    }
    if (write_closed_) {
        return unexpected{error{error_code::internal_error, "write after close"}};
    }
    if (data.empty()) {
        return {};
    }

    blocks_.emplace_back(data.begin(), data.end());
    buffered_ += data.size();
    lock.unlock();

    readable_cv_.notify_one();
    return {};
}

auto byte_pipe::read() -> result<std::optional<std::vector<std::byte>>> {
    std::unique_lock lock(mutex_);

    readable_cv_.wait(lock, [this] {
        return abort_reason_.has_value() || write_closed_ || !blocks_.empty();
    });

    if (abort_reason_) {
        return unexpected{*abort_reason_};
    }
    if (blocks_.empty()) {
        return std::optional<std::vector<std::byte>>{};
    }

    auto block = std::move(blocks_.front());
    blocks_.pop_front();
    buffered_ -= block.size();
    lock.unlock();

    writable_cv_.notify_one();
    return std::optional<std::vector<std::byte>>{std::move(block)};
}

void byte_pipe::close_write() {
    {
        std::lock_guard lock(mutex_);
        write_closed_ = true;
    }
    readable_cv_.notify_all();
    writable_cv_.notify_all();
}

void byte_pipe::abort(error reason) {
    {
        std::lock_guard lock(mutex_);
        if (!abort_reason_) {
            abort_reason_ = std::move(reason);
        }
        blocks_.clear();
        buffered_ = 0;
    }
    readable_cv_.notify_all();
    writable_cv_.notify_all();
}

auto byte_pipe::buffered() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return buffered_;
}

}  // namespace portal
