// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_BLOCKING_QUEUE_H
#define HDVAULT_BLOCKING_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#define DEFAULT_CAPACITY 1 << 16

/**
 * Bounded multi-producer multi-consumer queue.
 *
 * Close() ends production: consumers still drain what is queued and
 * then Take returns false. Quit() stops both sides immediately.
 */
template <typename T>
class BlockingQueue {
public:
    BlockingQueue() : BlockingQueue(DEFAULT_CAPACITY) {}

    explicit BlockingQueue(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    bool Put(T&& element) {
        std::unique_lock<std::mutex> lock(mtx_);
        full_.wait(lock, [this] { return (queue_.size() < capacity_ || quit_ || closed_); });
        if (quit_ || closed_) {
            return false;
        }
        queue_.emplace(std::move(element));
        empty_.notify_all();
        return true;
    }

    bool Put(const T& element) {
        T copy = element;
        return Put(std::move(copy));
    }

    bool Take(T& front) {
        std::unique_lock<std::mutex> lock(mtx_);
        empty_.wait(lock, [this] { return !queue_.empty() || quit_ || closed_; });
        if (quit_ || queue_.empty()) {
            return false;
        }
        front = std::move(queue_.front());
        queue_.pop();
        full_.notify_all();
        return true;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.empty();
    }

    size_t GetCapacity() const {
        return capacity_;
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        full_.notify_all();
        empty_.notify_all();
    }

    void Quit() {
        std::lock_guard<std::mutex> lock(mtx_);
        quit_ = true;
        full_.notify_all();
        empty_.notify_all();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::queue<T> empty;
        std::swap(queue_, empty);
        full_.notify_all();
    }

    bool IsQuit() const {
        return quit_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable full_;
    std::condition_variable empty_;
    std::queue<T> queue_;
    const size_t capacity_;
    std::atomic_bool quit_   = false;
    std::atomic_bool closed_ = false;
};

#endif // HDVAULT_BLOCKING_QUEUE_H
