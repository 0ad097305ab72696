#pragma once

#include "types.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <type_traits>
#include <vector>

namespace s3xfer {

// Capability for tasks that want a scheduling priority (lower runs first)
class HasPriority {
public:
    virtual ~HasPriority() = default;
    virtual int priority() const = 0;
};

// Priority of a task, or nullopt if it does not implement HasPriority
template <typename T>
std::optional<int> priority_of(const T& task) {
    if constexpr (std::is_base_of_v<HasPriority, T>) {
        return static_cast<const HasPriority&>(task).priority();
    } else if constexpr (std::is_polymorphic_v<T>) {
        if (auto* prioritized = dynamic_cast<const HasPriority*>(&task)) {
            return prioritized->priority();
        }
        return std::nullopt;
    } else {
        return std::nullopt;
    }
}

template <typename T>
struct QueueItem {
    int priority;
    uint64_t sequence;
    std::shared_ptr<T> task;

    // std::priority_queue is a max-heap, so "less" means "runs later"
    bool operator<(const QueueItem& other) const {
        if (priority != other.priority) {
            return priority > other.priority;
        }
        return sequence > other.sequence;
    }
};

// Bounded priority queue that is FIFO among tasks of equal priority.
//
// Priorities are clamped to max_priority; tasks without a priority get
// max_priority. put() blocks while the queue holds maxsize tasks (maxsize 0
// means unbounded) and get() blocks while it is empty.
template <typename T>
class StablePriorityQueue {
public:
    explicit StablePriorityQueue(size_t maxsize = 0, int max_priority = DEFAULT_MAX_PRIORITY)
        : maxsize_(maxsize)
        , max_priority_(max_priority)
        , next_sequence_(0)
        , shutdown_flag_(false) {}

    // Blocks while full. Returns false if the queue was shut down.
    bool put(std::shared_ptr<T> task) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return !is_full() || shutdown_flag_; });
        return push_locked(lock, std::move(task));
    }

    // Returns false if the queue is full or shut down
    bool try_put(std::shared_ptr<T> task) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (is_full()) return false;
        return push_locked(lock, std::move(task));
    }

    template <typename Rep, typename Period>
    bool put_for(std::shared_ptr<T> task, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this]() { return !is_full() || shutdown_flag_; })) {
            return false;
        }
        return push_locked(lock, std::move(task));
    }

    // Blocks until a task is available.
    // Returns nullptr once the queue is shut down and drained.
    std::shared_ptr<T> get() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return !queue_.empty() || shutdown_flag_; });
        return pop_locked(lock);
    }

    // Returns nullptr if empty
    std::shared_ptr<T> try_get() {
        std::unique_lock<std::mutex> lock(mutex_);
        return pop_locked(lock);
    }

    template <typename Rep, typename Period>
    std::shared_ptr<T> get_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_flag_; });
        return pop_locked(lock);
    }

    // Wakes every blocked producer and consumer. Pending tasks can still be drained.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_flag_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_shutdown() const { return shutdown_flag_; }

    size_t qsize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_full();
    }

    size_t maxsize() const { return maxsize_; }
    int max_priority() const { return max_priority_; }

private:
    bool is_full() const {
        return maxsize_ > 0 && queue_.size() >= maxsize_;
    }

    // Ceiling only; callers own the lower bound
    int effective_priority(const T& task) const {
        return std::min(priority_of(task).value_or(max_priority_), max_priority_);
    }

    bool push_locked(std::unique_lock<std::mutex>& lock, std::shared_ptr<T> task) {
        if (shutdown_flag_ || !task) return false;

        int priority = effective_priority(*task);
        queue_.push({priority, next_sequence_.fetch_add(1), std::move(task)});

        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::shared_ptr<T> pop_locked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) return nullptr;

        std::shared_ptr<T> task = queue_.top().task;
        queue_.pop();

        lock.unlock();
        not_full_.notify_one();
        return task;
    }

    const size_t maxsize_;
    const int max_priority_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::priority_queue<QueueItem<T>> queue_;
    std::atomic<uint64_t> next_sequence_;
    std::atomic<bool> shutdown_flag_;
};

}  // namespace s3xfer
