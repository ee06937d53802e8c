#pragma once

/**
 * @file writer_inbox.hpp
 * @brief Task queue feeding the fleet controller's single writer thread
 *
 * Thread safety:
 * - push() is called from any thread (store listeners, connection strands,
 *   first-contact workers, HTTP handlers)
 * - pop() is called only by the writer thread
 *
 * Unbounded. Tasks run in push order and are never dropped while open.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace lightfleet {
namespace fleet {

class WriterInbox {
public:
    using Task = std::function<void()>;

    explicit WriterInbox(const std::string &name = "") : name_(name) {}

    /**
     * @brief Queue a task
     *
     * @return false if the inbox is closed (task discarded)
     */
    bool push(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pop next task
     *
     * Blocks until a task is available, the inbox is closed, or timeout_ms
     * expires (0 = non-blocking). Tasks queued before close() are still
     * returned.
     */
    std::optional<Task> pop(int timeout_ms = 0) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        Task task = std::move(queue_.front());
        queue_.pop();
        return task;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    // Rejects further pushes and wakes the consumer
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    const std::string &name() const { return name_; }

private:
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> queue_;
    bool closed_ = false;
};

}  // namespace fleet
}  // namespace lightfleet
