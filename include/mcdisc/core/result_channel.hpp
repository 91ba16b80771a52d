/**
 * @file result_channel.hpp
 * @brief One-way channel from a discovery worker to the endpoint's callers.
 *
 * Single producer (the runner's worker thread), any number of consumers.
 * Bounded with drop-oldest semantics: discovery results are cheap to lose,
 * the protocol produces them again on the next matching search.
 *
 * Closing the channel wakes every blocked consumer. Items pushed before the
 * close can still be drained.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace mcdisc {
namespace core {

/**
 * @brief Result of a push.
 */
enum class PushResult {
    PUSHED,             ///< Value queued
    DROPPED_OLDEST,     ///< Value queued, oldest buffered value discarded
    CLOSED              ///< Channel closed, value discarded
};

/**
 * @brief Result of a pop.
 */
enum class PopStatus {
    OK,         ///< Value delivered
    TIMED_OUT,  ///< Deadline elapsed with nothing to deliver
    CLOSED      ///< Channel closed and nothing matching is buffered
};

struct ChannelStats {
    size_t current_depth = 0;
    size_t capacity = 0;
    uint64_t total_pushed = 0;
    uint64_t total_delivered = 0;
    uint64_t dropped_oldest = 0;
    size_t high_watermark = 0;
};

/**
 * @brief Thread-safe bounded FIFO with blocking, filtered receive.
 *
 * @tparam T Value type (DiscoveryResult in practice)
 */
template<typename T>
class ResultChannel {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    /**
     * @param capacity Maximum buffered values (0 = unlimited).
     */
    explicit ResultChannel(size_t capacity = 64)
        : capacity_(capacity)
    {}

    ~ResultChannel() {
        close();
    }

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    /**
     * @brief Queue a value without blocking.
     */
    PushResult push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (closed_.load()) {
            return PushResult::CLOSED;
        }

        PushResult result = PushResult::PUSHED;
        if (capacity_ > 0 && items_.size() >= capacity_) {
            items_.pop_front();
            stats_.dropped_oldest++;
            result = PushResult::DROPPED_OLDEST;
        }

        items_.push_back(std::move(value));
        stats_.total_pushed++;
        if (items_.size() > stats_.high_watermark) {
            stats_.high_watermark = items_.size();
        }

        lock.unlock();
        cv_.notify_all();
        return result;
    }

    /**
     * @brief Take the oldest value, waiting up to @p timeout (nullopt = forever).
     */
    PopStatus pop(T& out, Timeout timeout = std::nullopt) {
        return popIf([](const T&) { return true; }, out, timeout);
    }

    /**
     * @brief Take the oldest value satisfying @p pred.
     *
     * Values that do not match stay buffered, in order, for other consumers.
     */
    template<typename Pred>
    PopStatus popIf(Pred pred, T& out, Timeout timeout = std::nullopt) {
        std::unique_lock<std::mutex> lock(mutex_);

        auto match = items_.end();
        auto ready = [&]() {
            match = findMatch(pred);
            return match != items_.end() || closed_.load();
        };

        if (timeout) {
            if (!cv_.wait_for(lock, *timeout, ready)) {
                return PopStatus::TIMED_OUT;
            }
        } else {
            cv_.wait(lock, ready);
        }

        if (match == items_.end()) {
            return PopStatus::CLOSED;
        }

        out = std::move(*match);
        items_.erase(match);
        stats_.total_delivered++;
        return PopStatus::OK;
    }

    /**
     * @brief Take the oldest value if one is buffered.
     */
    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        stats_.total_delivered++;
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.store(true);
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        return closed_.load();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    ChannelStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ChannelStats result = stats_;
        result.current_depth = items_.size();
        result.capacity = capacity_;
        return result;
    }

private:
    template<typename Pred>
    typename std::deque<T>::iterator findMatch(Pred& pred) {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (pred(*it)) {
                return it;
            }
        }
        return items_.end();
    }

    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::atomic<bool> closed_{false};
    ChannelStats stats_;
};

}  // namespace core
}  // namespace mcdisc
