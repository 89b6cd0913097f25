#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <chrono>

namespace kestrel::utils {

// Fixed-capacity FIFO shared between one producer worker and the step loop.
// push() blocks while the queue is full, so items are never dropped.
// close() wakes every waiter: producers stop, consumers drain what is left.
template<typename T>
class BoundedQueue {
private:
    std::deque<T> buffer_;
    size_t capacity_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false only if the queue was closed before the item fit
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || buffer_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        buffer_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the queue is closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
        return take_locked(lock);
    }

    // Like pop() but gives up after timeout; nullopt means timeout or drained
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !buffer_.empty(); });
        return take_locked(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

private:
    std::optional<T> take_locked(std::unique_lock<std::mutex>& lock) {
        if (buffer_.empty()) {
            return std::nullopt;
        }
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }
};

} // namespace kestrel::utils
