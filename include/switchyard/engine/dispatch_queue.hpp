#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace switchyard {
namespace engine {

/// Callable run for each task of a channel: (command, payload) -> result or Error.
using ChannelHandler = std::function<Expected<Payload>(const std::string&, const Payload&)>;

/**
 * @brief Point-in-time copy of a task
 */
struct TaskSnapshot {
    TaskId id;
    std::string channel;
    std::string command;
    Payload payload;
    Priority priority = Priority::Normal;
    TaskStatus status = TaskStatus::Pending;
    std::optional<Payload> result;
    std::optional<std::string> error;   ///< Last handler error (kept across retries)
    int retry_count = 0;
    int max_retries = 0;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    Payload to_json() const {
        auto since_created = [this](const std::optional<TimePoint>& tp) -> Payload {
            if (!tp) {
                return nullptr;
            }
            return std::chrono::duration_cast<std::chrono::milliseconds>(*tp - created_at).count();
        };

        return Payload{
            {"id", id},
            {"channel", channel},
            {"command", command},
            {"payload", payload},
            {"priority", priority_to_string(priority)},
            {"status", task_status_to_string(status)},
            {"result", result ? *result : Payload(nullptr)},
            {"error", error ? Payload(*error) : Payload(nullptr)},
            {"retry_count", retry_count},
            {"max_retries", max_retries},
            {"started_after_ms", since_created(started_at)},
            {"completed_after_ms", since_created(completed_at)}
        };
    }
};

/**
 * @brief Per-channel, concurrency-bounded, priority-ordered task queue
 *
 * Each registered channel owns one worker thread. The worker starts the
 * highest-priority pending task (FIFO within a priority band) whenever the
 * channel has a free concurrency slot, and hands execution to a shared
 * ThreadPool so it never blocks on a handler.
 *
 * Failed attempts with retries left go back to the front of their band.
 * Handler errors and exceptions are converted into task state; nothing a
 * handler does can stop a worker.
 *
 * Thread Model:
 * - Calling threads: register_channel(), submit(), await_result(), cancel()
 * - Channel workers: one per channel, schedule tasks
 * - Pool threads: run handlers, record outcomes
 *
 * @threadsafety All public methods are thread-safe. Handlers run without
 * the queue lock held.
 */
class DispatchQueue {
public:
    /**
     * @brief Construct a queue that runs handlers on a shared pool
     *
     * @param pool Worker pool for handler execution (must outlive in-flight tasks)
     * @param max_finished_tasks Terminal tasks retained for lookup (0 = unlimited)
     */
    explicit DispatchQueue(std::shared_ptr<ThreadPool> pool, std::size_t max_finished_tasks = 1000)
        : pool_(std::move(pool))
        , max_finished_tasks_(max_finished_tasks)
        , logger_(log::get(log::kQueue))
    {
        if (!pool_) {
            pool_ = std::make_shared<ThreadPool>();
        }
    }

    /**
     * @brief Construct a queue with a private pool
     *
     * @param worker_threads Pool size (0 = hardware concurrency)
     */
    explicit DispatchQueue(std::size_t worker_threads = 0)
        : DispatchQueue(std::make_shared<ThreadPool>(worker_threads))
    {}

    /**
     * @brief Destructor - cancels pending tasks and waits for running ones
     */
    ~DispatchQueue() {
        shutdown();
    }

    // Non-copyable and non-movable (channel workers capture `this`)
    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;
    DispatchQueue(DispatchQueue&&) = delete;
    DispatchQueue& operator=(DispatchQueue&&) = delete;

    /**
     * @brief Register a channel and start its worker
     *
     * Handler and concurrency are fixed for the channel's lifetime.
     *
     * @return Expected<void> ChannelAlreadyRegistered, InvalidChannelConfig or QueueShutdown
     */
    Expected<void> register_channel(const std::string& name, ChannelHandler handler, const ChannelConfig& config) {
        if (auto valid = config.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        if (!handler) {
            return tl::unexpected(Error{ErrorCode::InvalidChannelConfig, "Channel handler must be callable", name});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return tl::unexpected(Error{ErrorCode::QueueShutdown, "Dispatch queue is shut down"});
        }
        if (channels_.count(name) > 0) {
            return tl::unexpected(Error{ErrorCode::ChannelAlreadyRegistered, "Channel already registered: " + name});
        }

        auto channel = std::make_unique<Channel>();
        channel->name = name;
        channel->handler = std::move(handler);
        channel->config = config;
        Channel* raw = channel.get();
        channels_.emplace(name, std::move(channel));
        raw->worker = std::thread([this, raw]() { worker_loop(*raw); });

        logger_->info("Registered channel: {} (concurrency={}, max_retries={})",
                      name, config.concurrency, config.max_retries);
        return {};
    }

    /// Register with default retry settings.
    Expected<void> register_channel(const std::string& name, ChannelHandler handler, int concurrency = 1) {
        ChannelConfig config;
        config.concurrency = concurrency;
        return register_channel(name, std::move(handler), config);
    }

    bool has_channel(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return channels_.count(name) > 0;
    }

    /**
     * @brief Submit a command to a channel (non-blocking)
     *
     * With hold_result set, the finished task survives retention until one
     * await_result() call has collected its outcome.
     *
     * @return Expected<TaskId> New task id, or ChannelNotFound / QueueShutdown
     */
    Expected<TaskId> submit(const std::string& channel_name, const std::string& command,
                            Payload payload = Payload::object(), Priority priority = Priority::Normal,
                            bool hold_result = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return tl::unexpected(Error{ErrorCode::QueueShutdown, "Dispatch queue is shut down"});
        }

        auto it = channels_.find(channel_name);
        if (it == channels_.end()) {
            return tl::unexpected(Error{ErrorCode::ChannelNotFound, "Channel not registered: " + channel_name});
        }
        Channel& channel = *it->second;

        TaskRecord record;
        record.task.id = make_task_id(channel_name);
        record.task.channel = channel_name;
        record.task.command = command;
        record.task.payload = payload.is_null() ? Payload::object() : std::move(payload);
        record.task.priority = priority;
        record.task.max_retries = channel.config.max_retries;
        record.task.created_at = steady_now();
        record.eligible_at = record.task.created_at;
        record.held = hold_result;

        TaskId id = record.task.id;
        tasks_.emplace(id, std::move(record));
        band(channel, priority).push_back(id);

        logger_->debug("Enqueued: {} ({}, priority={})", id, command, priority_to_string(priority));
        channel.cv.notify_one();
        return id;
    }

    /**
     * @brief Block until a task is terminal or the timeout expires
     *
     * A timeout only affects the caller; the task keeps running and may
     * still complete later. Retention never evicts a task while a caller
     * is waiting on it.
     *
     * @return Expected<Payload> Handler result, or TaskTimeout, TaskRetryExhausted,
     *         TaskCancelled, TaskNotFound
     */
    template<typename Rep, typename Period>
    Expected<Payload> await_result(const TaskId& id, const std::chrono::duration<Rep, Period>& timeout) {
        const auto deadline = steady_now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
        std::unique_lock<std::mutex> lock(mutex_);

        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return tl::unexpected(Error{ErrorCode::TaskNotFound, "Task not found: " + id});
        }

        TaskRecord& record = it->second;
        ++record.waiters;
        Expected<Payload> outcome = wait_for_outcome(record, deadline, lock);
        --record.waiters;
        record.held = false;
        prune_finished();
        return outcome;
    }

    Expected<Payload> await_result(const TaskId& id) {
        return await_result(id, std::chrono::seconds(300));
    }

    /**
     * @brief Cancel a task that has not started yet
     *
     * Running and terminal tasks are left alone.
     *
     * @return true if the task moved to Cancelled
     */
    bool cancel(const TaskId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.task.status != TaskStatus::Pending) {
            return false;
        }

        auto channel_it = channels_.find(it->second.task.channel);
        if (channel_it != channels_.end()) {
            auto& pending = band(*channel_it->second, it->second.task.priority);
            pending.erase(std::remove(pending.begin(), pending.end(), id), pending.end());
        }

        mark_terminal(it->second, TaskStatus::Cancelled);
        logger_->debug("Cancelled: {}", id);
        done_cv_.notify_all();
        return true;
    }

    /**
     * @brief Stop starting new tasks on a channel; running tasks finish
     */
    Expected<void> pause(const std::string& channel_name) {
        return set_paused(channel_name, true);
    }

    /**
     * @brief Resume starting tasks on a paused channel
     */
    Expected<void> resume(const std::string& channel_name) {
        return set_paused(channel_name, false);
    }

    /**
     * @brief Look up a task by id
     *
     * @return Expected<TaskSnapshot> Copy of the task, or TaskNotFound
     */
    Expected<TaskSnapshot> get_task(const TaskId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return tl::unexpected(Error{ErrorCode::TaskNotFound, "Task not found: " + id});
        }
        return it->second.task;
    }

    /**
     * @brief Pending/running/concurrency per channel
     */
    std::map<std::string, ChannelStatus> get_queue_status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, ChannelStatus> status;
        for (const auto& [name, channel] : channels_) {
            ChannelStatus entry;
            for (const auto& pending : channel->bands) {
                entry.pending += pending.size();
            }
            entry.running = channel->in_flight;
            entry.concurrency = channel->config.concurrency;
            entry.paused = channel->paused;
            status.emplace(name, entry);
        }
        return status;
    }

    /**
     * @brief Stop the queue
     *
     * Rejects further submissions, cancels every pending task, waits for
     * running tasks to finish and joins channel workers. Safe to call more
     * than once.
     */
    void shutdown() {
        std::vector<std::thread> workers;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!stopping_) {
                stopping_ = true;

                std::size_t cancelled = 0;
                for (auto& [name, channel] : channels_) {
                    for (auto& pending : channel->bands) {
                        for (const auto& id : pending) {
                            auto it = tasks_.find(id);
                            if (it != tasks_.end()) {
                                it->second.task.error = "Dispatch queue shut down";
                                mark_terminal(it->second, TaskStatus::Cancelled);
                                ++cancelled;
                            }
                        }
                        pending.clear();
                    }
                    channel->cv.notify_all();
                }
                if (cancelled > 0) {
                    logger_->warn("Shutdown cancelled {} pending task(s)", cancelled);
                }
                done_cv_.notify_all();
            }

            for (auto& [name, channel] : channels_) {
                if (channel->worker.joinable()) {
                    workers.push_back(std::move(channel->worker));
                }
            }
        }

        for (auto& worker : workers) {
            worker.join();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this] { return total_in_flight() == 0; });
    }

    /// True until shutdown() has been called.
    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !stopping_;
    }

private:
    struct TaskRecord {
        TaskSnapshot task;
        TimePoint eligible_at;   ///< Earliest start time (retry backoff)
        int waiters = 0;         ///< Callers blocked in await_result()
        bool held = false;       ///< Kept past retention until first collected

        bool pinned() const { return waiters > 0 || held; }
    };

    struct Channel {
        std::string name;
        ChannelHandler handler;
        ChannelConfig config;
        int in_flight = 0;
        bool paused = false;
        std::array<std::deque<TaskId>, kPriorityLevels> bands;  ///< Indexed by Priority
        std::condition_variable cv;
        std::thread worker;
    };

    static std::deque<TaskId>& band(Channel& channel, Priority priority) {
        return channel.bands[static_cast<std::size_t>(priority)];
    }

    std::string make_task_id(const std::string& channel_name) {
        char sequence[16];
        std::snprintf(sequence, sizeof(sequence), "%06llu",
                      static_cast<unsigned long long>(++task_counter_));
        return channel_name + "-" + sequence;
    }

    Expected<void> set_paused(const std::string& channel_name, bool paused) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(channel_name);
        if (it == channels_.end()) {
            return tl::unexpected(Error{ErrorCode::ChannelNotFound, "Channel not registered: " + channel_name});
        }
        it->second->paused = paused;
        it->second->cv.notify_all();
        logger_->info("Channel {} {}", channel_name, paused ? "paused" : "resumed");
        return {};
    }

    int total_in_flight() const {
        int total = 0;
        for (const auto& [name, channel] : channels_) {
            total += channel->in_flight;
        }
        return total;
    }

    /**
     * @brief Pick the next task to start, highest band first
     *
     * Within a band the first eligible task wins. Tasks waiting out a retry
     * backoff are skipped; @p wake_at receives the earliest time one of them
     * becomes eligible.
     *
     * Must be called with mutex_ held.
     */
    std::optional<TaskId> take_next(Channel& channel, TimePoint now, std::optional<TimePoint>& wake_at) {
        for (auto band_it = channel.bands.rbegin(); band_it != channel.bands.rend(); ++band_it) {
            auto& pending = *band_it;
            for (auto it = pending.begin(); it != pending.end(); ++it) {
                auto task_it = tasks_.find(*it);
                if (task_it == tasks_.end() || task_it->second.task.status != TaskStatus::Pending) {
                    continue;
                }
                if (task_it->second.eligible_at > now) {
                    if (!wake_at || task_it->second.eligible_at < *wake_at) {
                        wake_at = task_it->second.eligible_at;
                    }
                    continue;
                }
                TaskId id = *it;
                pending.erase(it);
                return id;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Channel worker loop
     *
     * Starts tasks while the channel has free slots; sleeps on the channel
     * condition variable otherwise. Exits when the queue shuts down.
     */
    void worker_loop(Channel& channel) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (channel.paused || channel.in_flight >= channel.config.concurrency) {
                channel.cv.wait(lock);
                continue;
            }

            std::optional<TimePoint> wake_at;
            auto next = take_next(channel, steady_now(), wake_at);
            if (!next) {
                if (wake_at) {
                    channel.cv.wait_until(lock, *wake_at);
                } else {
                    channel.cv.wait(lock);
                }
                continue;
            }

            TaskRecord& record = tasks_.at(*next);
            record.task.status = TaskStatus::Running;
            record.task.started_at = steady_now();
            ++channel.in_flight;

            TaskId id = *next;
            std::string command = record.task.command;
            Payload payload = record.task.payload;
            logger_->debug("Starting: {} ({}) attempt {}", id, command, record.task.retry_count + 1);

            Channel* target = &channel;
            bool posted = pool_->post([this, target, id, command = std::move(command), payload = std::move(payload)]() {
                execute(*target, id, command, payload);
            });
            if (!posted) {
                --channel.in_flight;
                record.task.error = "Worker pool unavailable";
                mark_terminal(record, TaskStatus::Failed);
                logger_->error("Failed: {} - worker pool unavailable", id);
                done_cv_.notify_all();
            }
        }
    }

    /**
     * @brief Run one attempt of a task on a pool thread and record the outcome
     */
    void execute(Channel& channel, const TaskId& id, const std::string& command, const Payload& payload) {
        Expected<Payload> outcome = invoke_handler(channel.handler, command, payload);

        std::lock_guard<std::mutex> lock(mutex_);
        --channel.in_flight;

        auto it = tasks_.find(id);
        if (it != tasks_.end()) {
            TaskRecord& record = it->second;
            if (outcome) {
                record.task.result = std::move(*outcome);
                mark_terminal(record, TaskStatus::Completed);
                logger_->debug("Completed: {}", id);
            } else {
                handle_failure(channel, record, outcome.error());
            }
        }

        channel.cv.notify_one();
        done_cv_.notify_all();
    }

    static Expected<Payload> invoke_handler(const ChannelHandler& handler, const std::string& command,
                                            const Payload& payload) {
        try {
            return handler(command, payload);
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::HandlerFailed, std::string("Handler threw: ") + e.what()});
        }
    }

    /// Must be called with mutex_ held.
    void handle_failure(Channel& channel, TaskRecord& record, const Error& error) {
        TaskSnapshot& task = record.task;
        task.error = error.message;

        if (task.retry_count < task.max_retries && !stopping_) {
            ++task.retry_count;
            task.status = TaskStatus::Pending;
            record.eligible_at = steady_now() + backoff_for(channel.config, task.retry_count);
            band(channel, task.priority).push_front(task.id);
            logger_->warn("Retrying: {} ({}/{}) - {}", task.id, task.retry_count, task.max_retries, error.message);
            return;
        }

        if (stopping_ && task.retry_count < task.max_retries) {
            mark_terminal(record, TaskStatus::Cancelled);
            logger_->warn("Dropped retry of {} during shutdown - {}", task.id, error.message);
            return;
        }

        mark_terminal(record, TaskStatus::Failed);
        logger_->error("Failed: {} after {} attempt(s) - {}", task.id, task.retry_count + 1, error.message);
    }

    /// Must be called with mutex_ held through lock; record must be pinned.
    Expected<Payload> wait_for_outcome(const TaskRecord& record, TimePoint deadline,
                                       std::unique_lock<std::mutex>& lock) {
        const TaskSnapshot& task = record.task;
        const TaskId& id = task.id;
        while (true) {
            switch (task.status) {
                case TaskStatus::Completed:
                    return task.result.value_or(Payload(nullptr));
                case TaskStatus::Failed:
                    return tl::unexpected(Error{
                        ErrorCode::TaskRetryExhausted,
                        "Task " + id + " failed after " + std::to_string(task.retry_count + 1) + " attempt(s)",
                        task.error
                    });
                case TaskStatus::Cancelled:
                    return tl::unexpected(Error{ErrorCode::TaskCancelled, "Task cancelled: " + id, task.error});
                case TaskStatus::Pending:
                case TaskStatus::Running:
                    break;
            }

            if (steady_now() >= deadline) {
                return tl::unexpected(Error{ErrorCode::TaskTimeout, "Task " + id + " timed out"});
            }
            done_cv_.wait_until(lock, deadline);
        }
    }

    static std::chrono::milliseconds backoff_for(const ChannelConfig& config, int retry_count) {
        if (config.retry_backoff.count() == 0 || retry_count <= 0) {
            return std::chrono::milliseconds(0);
        }
        const int shift = std::min(retry_count - 1, 16);
        return config.retry_backoff * (1LL << shift);
    }

    /// Must be called with mutex_ held.
    void mark_terminal(TaskRecord& record, TaskStatus status) {
        record.task.status = status;
        record.task.completed_at = steady_now();
        finished_order_.push_back(record.task.id);
        prune_finished();
    }

    /// Evicts the oldest unpinned terminal tasks beyond the retention limit.
    /// The newest terminal task is always kept. Must be called with mutex_ held.
    void prune_finished() {
        if (max_finished_tasks_ == 0 || finished_order_.empty()) {
            return;
        }
        const TaskId newest = finished_order_.back();
        auto it = finished_order_.begin();
        while (finished_order_.size() > max_finished_tasks_ && *it != newest) {
            auto record = tasks_.find(*it);
            if (record != tasks_.end() && record->second.pinned()) {
                ++it;
                continue;
            }
            if (record != tasks_.end()) {
                tasks_.erase(record);
            }
            it = finished_order_.erase(it);
        }
    }

    std::shared_ptr<ThreadPool> pool_;
    std::size_t max_finished_tasks_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;          ///< Signalled on every task outcome
    std::unordered_map<std::string, std::unique_ptr<Channel>> channels_;
    std::unordered_map<TaskId, TaskRecord> tasks_;
    std::deque<TaskId> finished_order_;        ///< Terminal tasks, oldest first
    std::uint64_t task_counter_ = 0;
    bool stopping_ = false;
};

} // namespace engine
} // namespace switchyard
