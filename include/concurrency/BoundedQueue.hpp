#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace ci::concurrency {

// Multi-producer / multi-consumer FIFO with a fixed capacity.
// Producers close it, consumers drain what is left and then see nullopt.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(const size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("[BoundedQueue] capacity must be greater than 0");
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while full. Returns false once the queue is closed.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        lock.unlock();
        notEmpty_.notify_one();
        return true;
    }

    // Blocks while empty. nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    // Discards everything still buffered
    size_t clear() {
        size_t dropped;
        {
            std::scoped_lock lock(mutex_);
            dropped = items_.size();
            items_.clear();
        }
        notFull_.notify_all();
        return dropped;
    }

    [[nodiscard]] bool isClosed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_, notFull_;
    std::deque<T> items_;
    bool closed_ = false;
};

}
