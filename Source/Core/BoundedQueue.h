#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

// Producers block while the queue is full; one consumer takes everything at once.
// capacity 0 = unbounded.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity = 0) : capacity_(capacity) {}

    // false once closed; the item is not queued
    bool push(T item) {
        std::unique_lock lock(mutex_);
        spaceAvailable_.wait(lock, [&]{ return closed_ || capacity_ == 0 || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        itemsAvailable_.notify_one();
        return true;
    }

    // Waits for at least one item and moves every queued item into batch, oldest first.
    // Returns false only when closed and nothing is left.
    bool drain(std::vector<T>& batch) {
        batch.clear();
        std::unique_lock lock(mutex_);
        itemsAvailable_.wait(lock, [&]{ return closed_ || !items_.empty(); });
        if (items_.empty()) return false;

        batch.reserve(items_.size());
        for (T& item : items_) batch.push_back(std::move(item));
        items_.clear();
        spaceAvailable_.notify_all();
        return true;
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        itemsAvailable_.notify_all();
        spaceAvailable_.notify_all();
    }

    bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::scoped_lock lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable itemsAvailable_;
    std::condition_variable spaceAvailable_;
    std::deque<T> items_;
    const size_t capacity_;
    bool closed_ = false;
};
