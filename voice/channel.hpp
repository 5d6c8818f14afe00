#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace Voice {

    // ------------------------------------------------------------
    // Channel<T>
    // ------------------------------------------------------------
    // Unbounded thread-safe FIFO with close semantics.
    // - push() after close() is dropped
    // - waitPop() returns nullopt on timeout, or once closed and drained
    template <typename T>
    class Channel {
    public:
        void push(T value) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) return;
                items_.push_back(std::move(value));
            }
            cv_.notify_one();
        }

        std::optional<T> tryPop() {
            std::lock_guard<std::mutex> lock(mutex_);
            return popLocked();
        }

        template <typename Rep, typename Period>
        std::optional<T> waitPop(const std::chrono::duration<Rep, Period>& timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
            return popLocked();
        }

        // Blocks until an item arrives or the channel is closed and drained
        std::optional<T> pop() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !items_.empty() || closed_; });
            return popLocked();
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool isClosed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        // Closed and nothing left to read
        bool drained() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_ && items_.empty();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

    private:
        std::optional<T> popLocked() {
            if (items_.empty()) return std::nullopt;
            T value = std::move(items_.front());
            items_.pop_front();
            return value;
        }

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<T> items_;
        bool closed_ = false;
    };

} // namespace Voice
