/*
 * queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Bounded thread-safe queue

**************************************************/

#ifndef MEDIASCAN_ASYNC_QUEUE_HPP
#define MEDIASCAN_ASYNC_QUEUE_HPP

#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <type_traits>
#include <utility>

namespace mediascan::async {

template <typename T>
concept Movable = std::move_constructible<T> && std::is_move_assignable_v<T>;

/**
 * @brief Bounded blocking queue shared by one producer and one consumer.
 *
 * The queue has two ways of ending. close() stops producers and lets the
 * consumer drain what is left; destroy() wakes everybody at once and hands
 * the remaining elements back to the caller.
 */
template <Movable T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(std::size_t capacity = 32)
        : capacity_(capacity == 0 ? 1 : capacity) {}
    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
    ~ThreadSafeQueue() noexcept { static_cast<void>(destroy()); }

    /**
     * @brief Add an element, blocking while the queue is full.
     * @return false if the queue was closed or destroyed before the element
     * could be stored.
     */
    auto put(T element) -> bool {
        {
            std::unique_lock lock(mutex_);
            notFull_.wait(lock, [this] {
                return closed_ || queue_.size() < capacity_;
            });
            if (closed_) {
                return false;
            }
            queue_.push(std::move(element));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Take an element, blocking while the queue is empty.
     * @return The element, or nothing once the queue is closed and drained
     * or destroyed.
     */
    [[nodiscard]] auto take() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] {
            return destroyed_ || closed_ || !queue_.empty();
        });
        return popLocked();
    }

    /**
     * @brief Refuse further puts; take() keeps returning queued elements
     * until the queue is empty.
     */
    void close() noexcept {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    /**
     * @brief Close the queue and discard its content.
     * @return The elements that were still queued.
     */
    [[nodiscard]] auto destroy() noexcept -> std::queue<T> {
        std::queue<T> result;
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            destroyed_ = true;
            std::swap(result, queue_);
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
        return result;
    }

private:
    auto popLocked() -> std::optional<T> {
        if (destroyed_ || queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> ret{std::move(queue_.front())};
        queue_.pop();
        notFull_.notify_one();
        return ret;
    }

    const std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::queue<T> queue_;
    bool closed_{false};
    bool destroyed_{false};
};

}  // namespace mediascan::async

#endif  // MEDIASCAN_ASYNC_QUEUE_HPP
