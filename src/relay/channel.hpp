#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

enum class PushStatus { Ok, Full, Closed };

// Multi-producer queue with close semantics. pop() drains what is queued
// before reporting closure, so items arrive in push order. A capacity of 0
// means unbounded; otherwise producers see Full (try_push) or wait for room.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Waits for room. Returns false once the channel is closed.
    bool push(T item) {
        std::unique_lock lock(mu_);
        not_full_.wait(lock, [this] { return closed_ || has_room_locked(); });
        return enqueue_locked(lock, std::move(item)) == PushStatus::Ok;
    }

    // Never waits.
    PushStatus try_push(T item) {
        std::unique_lock lock(mu_);
        return enqueue_locked(lock, std::move(item));
    }

    // Waits for room until the deadline, then reports Full.
    template <typename Clock, typename Duration>
    PushStatus push_until(T item, std::chrono::time_point<Clock, Duration> deadline) {
        std::unique_lock lock(mu_);
        not_full_.wait_until(lock, deadline, [this] { return closed_ || has_room_locked(); });
        return enqueue_locked(lock, std::move(item));
    }

    void close() {
        {
            std::lock_guard lock(mu_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    // Blocks until an item arrives or the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mu_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take_locked(lock);
    }

    // As pop(), but also returns nullopt as soon as stop is requested.
    std::optional<T> pop(std::stop_token stop) {
        std::unique_lock lock(mu_);
        if (!not_empty_.wait(lock, stop, [this] { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

private:
    bool has_room_locked() const { return capacity_ == 0 || items_.size() < capacity_; }

    PushStatus enqueue_locked(std::unique_lock<std::mutex>& lock, T&& item) {
        if (closed_) return PushStatus::Closed;
        if (!has_room_locked()) return PushStatus::Full;
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushStatus::Ok;
    }

    std::optional<T> take_locked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};
