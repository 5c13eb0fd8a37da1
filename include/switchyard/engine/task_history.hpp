#pragma once

#include "../types.hpp"
#include <algorithm>
#include <deque>
#include <mutex>
#include <vector>

namespace switchyard {
namespace engine {

/**
 * @brief Bounded, append-only record of routed results
 *
 * Keeps the most recent `capacity` results; older entries are dropped
 * as new ones arrive. A capacity of 0 keeps nothing.
 *
 * Thread Safety: Internally synchronized via mutex
 */
class TaskHistory {
public:
    explicit TaskHistory(size_t capacity = 100)
        : capacity_(capacity)
    {}

    void record(TaskResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) {
            return;
        }
        entries_.push_back(std::move(result));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    /**
     * @brief Most recent `limit` results, oldest first
     */
    std::vector<TaskResult> recent(size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t count = std::min(limit, entries_.size());
        return std::vector<TaskResult>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
    }

    std::vector<TaskSummary> summaries(size_t limit) const {
        std::vector<TaskSummary> result;
        for (const auto& entry : recent(limit)) {
            result.push_back(TaskSummary{entry.category, entry.success, entry.error});
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    const size_t capacity_;
    std::deque<TaskResult> entries_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace switchyard
