#pragma once

#include "types.hpp"
#include "log.hpp"
#include "engine/dispatch_queue.hpp"
#include "engine/handler_registry.hpp"
#include "engine/intent_classifier.hpp"
#include "engine/task_history.hpp"
#include "engine/text.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace switchyard {

/**
 * @brief Orchestrator settings
 */
struct OrchestratorConfig {
    std::size_t history_limit = 100;                        ///< Results retained for get_task_history()
    std::chrono::milliseconds route_timeout{300000};        ///< Wait limit for channel-bound handlers
    std::string default_category = engine::kGeneralCategory;
    std::string reviewer_category = "inspector";

    Expected<void> validate() const {
        if (route_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "route_timeout must be positive"});
        }
        if (default_category.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "default_category cannot be empty"});
        }
        return {};
    }
};

/**
 * @brief Routes requests to category handlers and records the outcomes
 *
 * route() runs the full request path:
 * 1. Explicit category, else keyword intent classification
 * 2. Fallback to the default category when the chosen one has no handler
 * 3. Handler execution, inline or through a Dispatch Queue channel
 * 4. Optional review of a successful result
 * 5. Bounded history
 *
 * Handler failures never escape route(); they come back as a TaskResult
 * with success=false.
 *
 * Example Usage:
 * @code
 * engine::DispatchQueue queue;
 * Orchestrator orchestrator({}, engine::IntentClassifier{}, &queue);
 *
 * orchestrator.register_handler("trading", [](const std::string& message, const Payload&) {
 *     return Payload{{"bias", "bullish"}, {"echo", message}};
 * });
 * orchestrator.register_handler("cad", run_solidworks, "solidworks");
 *
 * TaskResult result = orchestrator.route(RouteRequest("GBP/USD setup for London"));
 * @endcode
 *
 * Thread Model:
 * - route() may be called from any number of threads at once
 * - Channel-bound handlers run on the Dispatch Queue's pool
 * - Inline handlers and the reviewer run on the calling thread
 *
 * @threadsafety All public methods are thread-safe. The Dispatch Queue must
 * be shut down before an Orchestrator that registered channels on it is
 * destroyed.
 */
class Orchestrator {
public:
    /**
     * @param config Routing settings
     * @param classifier Keyword intent classifier
     * @param queue Dispatch Queue for channel-bound handlers (optional, not owned)
     */
    explicit Orchestrator(OrchestratorConfig config = {},
                          engine::IntentClassifier classifier = engine::IntentClassifier{},
                          engine::DispatchQueue* queue = nullptr)
        : config_(std::move(config))
        , classifier_(std::move(classifier))
        , queue_(queue)
        , history_(config_.history_limit)
        , logger_(log::get(log::kOrchestrator))
    {}

    // Non-copyable and non-movable (channel dispatchers capture `this`)
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    /**
     * @brief Register an inline handler for a category
     *
     * @param func Callable (message, context) returning Expected<Payload> or
     *        a json-convertible value
     */
    template<typename Func>
    void register_handler(const std::string& category, Func func) {
        handlers_.register_handler(category, std::move(func));
        logger_->info("Registered agent: {}", category);
    }

    /**
     * @brief Register a handler that runs on a Dispatch Queue channel
     *
     * The channel is created on first use with @p channel_config; several
     * categories may share one channel.
     *
     * @return Expected<void> InvalidConfig without a queue, ChannelAlreadyRegistered
     *         if the channel exists but was not created here, or the queue's
     *         registration error
     */
    template<typename Func>
    Expected<void> register_handler(const std::string& category, Func func, const std::string& channel,
                                    const ChannelConfig& channel_config = ChannelConfig{}) {
        if (!queue_) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig,
                                        "Channel-bound handler requires a dispatch queue", category});
        }

        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            if (owned_channels_.count(channel) == 0) {
                if (queue_->has_channel(channel)) {
                    return tl::unexpected(Error{ErrorCode::ChannelAlreadyRegistered,
                                                "Channel registered outside the orchestrator: " + channel});
                }
                auto registered = queue_->register_channel(
                    channel,
                    [this](const std::string& command, const Payload& payload) {
                        return dispatch(command, payload);
                    },
                    channel_config);
                if (!registered) {
                    return tl::unexpected(registered.error());
                }
                owned_channels_.insert(channel);
            }
        }

        handlers_.register_handler(category, std::move(func), channel);
        logger_->info("Registered agent: {} (channel {})", category, channel);
        return {};
    }

    /**
     * @brief Register the reviewer used for require_review requests
     *
     * @param func Callable (output, context) returning Expected<Payload> or
     *        a json-convertible value
     */
    template<typename Func>
    void register_reviewer(Func func) {
        engine::ReviewHandler reviewer = [f = std::move(func)](const Payload& output,
                                                               const Payload& context) -> Expected<Payload> {
            return engine::detail::invoke_normalized(f, ErrorCode::ReviewFailed, output, context);
        };
        std::lock_guard<std::mutex> lock(reviewer_mutex_);
        reviewer_ = std::move(reviewer);
        logger_->info("Registered reviewer ({})", config_.reviewer_category);
    }

    /**
     * @brief Classify, execute, optionally review and record one request
     *
     * @return TaskResult Never throws for handler or reviewer failures
     */
    TaskResult route(const RouteRequest& request) {
        const auto started = std::chrono::steady_clock::now();
        Payload metadata = Payload::object();

        std::string category;
        if (request.preferred_category && !request.preferred_category->empty()) {
            category = *request.preferred_category;
            metadata["routing"] = "explicit";
        } else {
            engine::IntentMatch match = classifier_.classify(request.message);
            category = match.defaulted ? config_.default_category : match.category;
            metadata["routing"] = match.defaulted ? "default" : "keyword";
            metadata["scores"] = match.scores;
        }
        logger_->info("Routing to agent: {}", category);

        std::optional<engine::HandlerEntry> entry = handlers_.find(category);
        if (!entry && category != config_.default_category) {
            if (auto fallback = handlers_.find(config_.default_category)) {
                logger_->warn("Agent {} not registered, falling back to {}", category, config_.default_category);
                metadata["requested_category"] = category;
                metadata["routing"] = "fallback";
                category = config_.default_category;
                entry = std::move(fallback);
            }
        }

        TaskResult result = entry ? execute(*entry, request, metadata) : unhandled(category, request);

        if (request.require_review && result.success) {
            review(result, request);
        }

        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            result.metadata[it.key()] = it.value();
        }
        result.metadata["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        if (!result.success) {
            logger_->warn("Task for {} failed: {}", result.category, result.error.value_or("unknown error"));
        }
        history_.record(result);
        return result;
    }

    /**
     * @brief Registration state of every known category
     *
     * Known categories are those in the keyword table, the default
     * category, the reviewer category and any category with a handler.
     */
    std::map<std::string, std::string> get_agent_status() const {
        std::map<std::string, std::string> status;
        for (const auto& category : classifier_.categories()) {
            status[category] = "not_registered";
        }
        status[config_.default_category] = "not_registered";
        status[config_.reviewer_category] = has_reviewer() ? "registered" : "not_registered";
        for (const auto& category : handlers_.get_categories()) {
            status[category] = "registered";
        }
        return status;
    }

    /**
     * @brief Summaries of the most recent results, oldest first
     */
    std::vector<TaskSummary> get_task_history(std::size_t limit = 10) const {
        return history_.summaries(limit);
    }

    /// Full results for the most recent routes, oldest first.
    std::vector<TaskResult> get_recent_results(std::size_t limit = 10) const {
        return history_.recent(limit);
    }

    bool has_handler(const std::string& category) const {
        return handlers_.has_handler(category);
    }

    bool has_reviewer() const {
        std::lock_guard<std::mutex> lock(reviewer_mutex_);
        return static_cast<bool>(reviewer_);
    }

    const OrchestratorConfig& get_config() const { return config_; }
    const engine::IntentClassifier& classifier() const { return classifier_; }

private:
    TaskResult execute(const engine::HandlerEntry& entry, const RouteRequest& request, Payload& metadata) {
        if (!entry.channel) {
            auto output = entry.handler(request.message, request.context);
            if (!output) {
                return TaskResult::failed(entry.category, output.error().message);
            }
            return TaskResult::succeeded(entry.category, std::move(*output));
        }

        const std::string& channel = *entry.channel;
        metadata["channel"] = channel;

        Payload payload{{"message", request.message}, {"context", request.context}};
        auto task_id = queue_->submit(channel, entry.category, std::move(payload), request.priority, true);
        if (!task_id) {
            return TaskResult::failed(entry.category, describe(task_id.error()));
        }
        metadata["task_id"] = *task_id;

        auto output = queue_->await_result(*task_id, config_.route_timeout);
        if (!output) {
            return TaskResult::failed(entry.category, describe(output.error()));
        }
        return TaskResult::succeeded(entry.category, std::move(*output));
    }

    /// No handler for the category and no fallback handler either.
    TaskResult unhandled(const std::string& category, const RouteRequest& request) const {
        if (category == config_.default_category) {
            return TaskResult::succeeded(category,
                                         "Processing general request: " +
                                             engine::text::utf8_prefix(request.message, 100));
        }
        return TaskResult::failed(category, "Agent category '" + category + "' is offline.");
    }

    void review(TaskResult& result, const RouteRequest& request) {
        engine::ReviewHandler reviewer;
        {
            std::lock_guard<std::mutex> lock(reviewer_mutex_);
            reviewer = reviewer_;
        }
        if (!reviewer) {
            logger_->warn("Inspector not available for review");
            result.metadata["reviewed"] = false;
            return;
        }

        auto verdict = reviewer(result.output, request.context);
        if (!verdict) {
            logger_->error("Review failed: {}", verdict.error().message);
            result.metadata["reviewed"] = false;
            result.metadata["review_error"] = verdict.error().message;
            return;
        }
        result.metadata["reviewed"] = true;
        result.metadata["review_result"] = std::move(*verdict);
    }

    /// Runs on a pool thread for every task on an orchestrator-owned channel.
    Expected<Payload> dispatch(const std::string& category, const Payload& payload) const {
        auto entry = handlers_.find(category);
        if (!entry) {
            return tl::unexpected(Error{ErrorCode::AgentOffline,
                                        "Agent category '" + category + "' is offline."});
        }
        const std::string message = payload.value("message", std::string());
        const Payload context = payload.contains("context") ? payload.at("context") : Payload::object();
        return entry->handler(message, context);
    }

    static std::string describe(const Error& error) {
        if (error.context) {
            return error.message + ": " + *error.context;
        }
        return error.message;
    }

    OrchestratorConfig config_;
    engine::IntentClassifier classifier_;
    engine::DispatchQueue* queue_;
    engine::HandlerRegistry handlers_;
    engine::TaskHistory history_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex reviewer_mutex_;
    engine::ReviewHandler reviewer_;

    std::mutex channels_mutex_;
    std::set<std::string> owned_channels_;
};

} // namespace switchyard
