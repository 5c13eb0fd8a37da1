#pragma once

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "engine/circuit_breaker.hpp"
#include "engine/compute_router.hpp"
#include "engine/dispatch_queue.hpp"
#include "engine/thread_pool.hpp"
#include <memory>
#include <string>

namespace switchyard {

/**
 * @brief Owns one instance of every dispatch component
 *
 * Construct one per process and pass it by reference. Components are
 * wired from a single Settings value:
 * - ThreadPool sized by worker_threads
 * - CircuitBreakerRegistry with the configured circuits
 * - DispatchQueue on the shared pool
 * - ComputeTierSelector from the classifier and profiles
 * - Orchestrator bound to the queue
 *
 * Example Usage:
 * @code
 * auto settings = load_settings_file("switchyard.json");
 * auto context = Context::create(*settings);
 * if (!context) {
 *     std::cerr << context.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto& orchestrator = (*context)->orchestrator();
 * @endcode
 *
 * @threadsafety Accessors are thread-safe; each component synchronizes itself
 */
class Context {
public:
    /**
     * @brief Validate settings and build all components
     *
     * @param settings Runtime configuration
     * @param now Clock for the circuit breakers (injected in tests)
     * @return Expected<std::unique_ptr<Context>> Ready context or the first
     *         configuration error
     */
    static Expected<std::unique_ptr<Context>> create(const Settings& settings, NowFn now = steady_now) {
        if (auto result = settings.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (auto result = log::set_level(settings.log_level); !result) {
            return tl::unexpected(result.error());
        }

        std::unique_ptr<Context> context(new Context(settings, std::move(now)));
        for (const auto& [name, config] : settings.circuits) {
            if (auto result = context->circuits_->register_circuit(name, config); !result) {
                return tl::unexpected(result.error());
            }
        }

        context->logger_->info("Context ready: {} pool threads, {} circuits, history_limit={}",
                               context->pool_->size(), settings.circuits.size(), settings.history_limit);
        return context;
    }

    /**
     * @brief Destructor - stops the queue before the orchestrator goes away
     */
    ~Context() {
        shutdown();
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;

    Orchestrator& orchestrator() { return *orchestrator_; }
    engine::DispatchQueue& queue() { return *queue_; }
    engine::CircuitBreakerRegistry& circuits() { return *circuits_; }
    const engine::ComputeTierSelector& router() const { return *router_; }
    const Settings& settings() const { return settings_; }

    /**
     * @brief Register a category handler on a channel using the configured channel settings
     */
    template<typename Func>
    Expected<void> register_channel_handler(const std::string& category, Func func, const std::string& channel) {
        return orchestrator_->register_handler(category, std::move(func), channel,
                                               settings_.channel_config(channel));
    }

    /**
     * @brief Agents, recent history, queues and circuits as one JSON document
     */
    Payload status_json(std::size_t history_limit = 10) const {
        Payload agents = Payload::object();
        for (const auto& [category, state] : orchestrator_->get_agent_status()) {
            agents[category] = state;
        }

        Payload history = Payload::array();
        for (const auto& summary : orchestrator_->get_task_history(history_limit)) {
            history.push_back(Payload{
                {"category", summary.category},
                {"success", summary.success},
                {"error", summary.error ? Payload(*summary.error) : Payload(nullptr)}
            });
        }

        Payload queues = Payload::object();
        for (const auto& [name, status] : queue_->get_queue_status()) {
            queues[name] = Payload{
                {"pending", status.pending},
                {"running", status.running},
                {"concurrency", status.concurrency},
                {"paused", status.paused}
            };
        }

        Payload circuits = Payload::object();
        for (const auto& [name, status] : circuits_->get_circuit_status()) {
            circuits[name] = Payload{
                {"state", circuit_state_to_string(status.state)},
                {"failures", status.failures},
                {"total_calls", status.total_calls}
            };
        }

        return Payload{
            {"agents", agents},
            {"history", history},
            {"queues", queues},
            {"circuits", circuits}
        };
    }

    /**
     * @brief Stop the queue, then the pool. Safe to call more than once.
     */
    void shutdown() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        queue_->shutdown();
        pool_->shutdown();
        logger_->info("Context shut down");
    }

private:
    Context(const Settings& settings, NowFn now)
        : settings_(settings)
        , logger_(log::get(log::kContext))
        , pool_(std::make_shared<engine::ThreadPool>(settings.worker_threads))
        , circuits_(std::make_unique<engine::CircuitBreakerRegistry>(settings.default_circuit, std::move(now)))
        , queue_(std::make_unique<engine::DispatchQueue>(pool_, settings.max_finished_tasks))
        , router_(std::make_unique<engine::ComputeTierSelector>(settings.classifier, settings.profiles))
        , orchestrator_(std::make_unique<Orchestrator>(settings.orchestrator_config(),
                                                       engine::IntentClassifier(settings.intent_keywords),
                                                       queue_.get()))
    {}

    Settings settings_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<engine::ThreadPool> pool_;
    std::unique_ptr<engine::CircuitBreakerRegistry> circuits_;
    std::unique_ptr<engine::DispatchQueue> queue_;
    std::unique_ptr<engine::ComputeTierSelector> router_;
    std::unique_ptr<Orchestrator> orchestrator_;
    bool stopped_ = false;
};

} // namespace switchyard
