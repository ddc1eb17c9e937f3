/**
 * @file bounded_channel.h
 * @brief Bounded multi-producer queue with timed and non-blocking operations
 */

#ifndef KCENON_BATCH_IMPORT_CORE_BOUNDED_CHANNEL_H
#define KCENON_BATCH_IMPORT_CORE_BOUNDED_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace kcenon::batch_import {

/**
 * @brief Outcome of a channel operation that may wait
 */
enum class channel_status {
    ok,
    timeout,
    full,
    closed,
    no_receiver,
};

[[nodiscard]] constexpr auto to_string(channel_status status) -> const char* {
    switch (status) {
        case channel_status::ok:
            return "ok";
        case channel_status::timeout:
            return "timeout";
        case channel_status::full:
            return "full";
        case channel_status::closed:
            return "closed";
        case channel_status::no_receiver:
            return "no receiver";
        default:
            return "unknown";
    }
}

template <typename T>
struct receive_result {
    channel_status status = channel_status::timeout;
    std::optional<T> item;

    [[nodiscard]] auto has_item() const noexcept -> bool { return item.has_value(); }
};

/**
 * @brief Bounded FIFO channel
 *
 * Items sent before close() remain receivable. Once the channel is closed
 * and drained, receivers get channel_status::closed immediately and all
 * sends fail. A closed channel is never reopened; owners replace it.
 *
 * @note Thread-safe.
 */
template <typename T>
class bounded_channel {
public:
    explicit bounded_channel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bounded_channel(const bounded_channel&) = delete;
    bounded_channel& operator=(const bounded_channel&) = delete;

    /**
     * @brief Enqueue without waiting
     * @return ok, full, or closed
     */
    auto try_send(T item) -> channel_status {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return channel_status::closed;
            if (items_.size() >= capacity_) return channel_status::full;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Enqueue only if a receiver is blocked waiting for this item
     *
     * Receivers count as waiting from the start of receive_for() or
     * receive_after() until they return.
     * @return ok, no_receiver, full, or closed
     */
    auto try_handoff(T item) -> channel_status {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return channel_status::closed;
            if (items_.size() >= capacity_) return channel_status::full;
            if (waiting_receivers_ <= items_.size()) return channel_status::no_receiver;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Enqueue, waiting up to @p timeout for free space
     * @return ok, timeout, or closed
     */
    template <typename Rep, typename Period>
    auto send_for(T item, std::chrono::duration<Rep, Period> timeout) -> channel_status {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = not_full_.wait_for(lock, timeout, [this] {
                return closed_ || items_.size() < capacity_;
            });
            if (closed_) return channel_status::closed;
            if (!ready) return channel_status::timeout;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Enqueue, dropping the oldest queued item when full
     *
     * Used for items that supersede everything before them, such as the
     * final progress snapshot of a batch.
     * @return ok or closed
     */
    auto send_evicting(T item) -> channel_status {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return channel_status::closed;
            while (items_.size() >= capacity_) {
                items_.pop_front();
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Dequeue without waiting
     */
    auto try_receive() -> std::optional<T> {
        std::optional<T> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) return std::nullopt;
            item = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Dequeue, waiting up to @p timeout for an item
     */
    template <typename Rep, typename Period>
    auto receive_for(std::chrono::duration<Rep, Period> timeout) -> receive_result<T> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++waiting_receivers_;
        }
        return wait_counted(timeout);
    }

    /**
     * @brief Register as waiting, call @p announce, then wait like receive_for()
     *
     * The receiver already counts as waiting while @p announce runs, so a
     * try_handoff() triggered by the announcement cannot miss it. When
     * @p announce returns anything but ok, nothing is received and that
     * status is returned.
     */
    template <typename Announce, typename Rep, typename Period>
    auto receive_after(Announce&& announce, std::chrono::duration<Rep, Period> timeout)
        -> receive_result<T> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++waiting_receivers_;
        }
        channel_status announced = announce();
        if (announced != channel_status::ok) {
            std::lock_guard<std::mutex> lock(mutex_);
            --waiting_receivers_;
            return receive_result<T>{announced, std::nullopt};
        }
        return wait_counted(timeout);
    }

    /**
     * @brief Mark the channel closed and wake every waiter
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * @brief Discard queued items without closing
     */
    void clear() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.clear();
        }
        not_full_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    // Caller has already counted itself in waiting_receivers_.
    template <typename Rep, typename Period>
    auto wait_counted(std::chrono::duration<Rep, Period> timeout) -> receive_result<T> {
        receive_result<T> out;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = not_empty_.wait_for(lock, timeout, [this] {
                return closed_ || !items_.empty();
            });
            --waiting_receivers_;

            if (!items_.empty()) {
                out.item = std::move(items_.front());
                items_.pop_front();
                out.status = channel_status::ok;
            } else {
                out.status = (ready && closed_) ? channel_status::closed
                                                : channel_status::timeout;
                return out;
            }
        }
        not_full_.notify_one();
        return out;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    std::size_t waiting_receivers_ = 0;
    bool closed_ = false;
};

/**
 * @brief Write-only handle to a channel
 */
template <typename T>
class channel_sender {
public:
    channel_sender() = default;
    explicit channel_sender(std::shared_ptr<bounded_channel<T>> channel)
        : channel_(std::move(channel)) {}

    auto try_send(T item) const -> channel_status {
        return channel_ ? channel_->try_send(std::move(item)) : channel_status::closed;
    }

    template <typename Rep, typename Period>
    auto send_for(T item, std::chrono::duration<Rep, Period> timeout) const -> channel_status {
        return channel_ ? channel_->send_for(std::move(item), timeout) : channel_status::closed;
    }

    auto send_evicting(T item) const -> channel_status {
        return channel_ ? channel_->send_evicting(std::move(item)) : channel_status::closed;
    }

    [[nodiscard]] auto is_closed() const -> bool { return !channel_ || channel_->is_closed(); }
    [[nodiscard]] explicit operator bool() const noexcept { return channel_ != nullptr; }

private:
    std::shared_ptr<bounded_channel<T>> channel_;
};

/**
 * @brief Read-only handle to a channel
 */
template <typename T>
class channel_receiver {
public:
    channel_receiver() = default;
    explicit channel_receiver(std::shared_ptr<bounded_channel<T>> channel)
        : channel_(std::move(channel)) {}

    auto try_receive() const -> std::optional<T> {
        return channel_ ? channel_->try_receive() : std::nullopt;
    }

    template <typename Rep, typename Period>
    auto receive_for(std::chrono::duration<Rep, Period> timeout) const -> receive_result<T> {
        if (!channel_) {
            return receive_result<T>{channel_status::closed, std::nullopt};
        }
        return channel_->receive_for(timeout);
    }

    template <typename Announce, typename Rep, typename Period>
    auto receive_after(Announce&& announce, std::chrono::duration<Rep, Period> timeout) const
        -> receive_result<T> {
        if (!channel_) {
            return receive_result<T>{channel_status::closed, std::nullopt};
        }
        return channel_->receive_after(std::forward<Announce>(announce), timeout);
    }

    [[nodiscard]] auto is_closed() const -> bool { return !channel_ || channel_->is_closed(); }
    [[nodiscard]] auto size() const -> std::size_t { return channel_ ? channel_->size() : 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return channel_ != nullptr; }

private:
    std::shared_ptr<bounded_channel<T>> channel_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_BOUNDED_CHANNEL_H
