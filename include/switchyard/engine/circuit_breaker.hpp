#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include <algorithm>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace switchyard {
namespace engine {

/**
 * @brief Full point-in-time view of one circuit
 */
struct CircuitSnapshot {
    std::string name;
    CircuitState state = CircuitState::Closed;
    CircuitConfig config;
    int consecutive_failures = 0;
    int consecutive_successes = 0;
    std::uint64_t total_calls = 0;        ///< Calls that reached the operation
    std::uint64_t rejected_calls = 0;     ///< Calls refused while open
    std::uint64_t rate_limited_calls = 0; ///< Calls refused by the per-minute cap
    std::size_t calls_in_window = 0;      ///< Admitted calls in the last minute
    std::optional<TimePoint> last_failure;
    std::optional<TimePoint> last_success;
    std::optional<TimePoint> opened_at;

    Payload to_json() const {
        return Payload{
            {"name", name},
            {"state", circuit_state_to_string(state)},
            {"consecutive_failures", consecutive_failures},
            {"consecutive_successes", consecutive_successes},
            {"total_calls", total_calls},
            {"rejected_calls", rejected_calls},
            {"rate_limited_calls", rate_limited_calls},
            {"calls_in_window", calls_in_window},
            {"failure_threshold", config.failure_threshold},
            {"success_threshold", config.success_threshold},
            {"cool_down_ms", config.cool_down.count()},
            {"calls_per_minute_limit", config.calls_per_minute_limit}
        };
    }
};

namespace detail {

template<typename T>
struct is_expected : std::false_type {};

template<typename T>
struct is_expected<tl::expected<T, Error>> : std::true_type {};

} // namespace detail

/**
 * @brief Named, independent circuit breakers for unreliable dependencies
 *
 * Each circuit is a closed / open / half-open state machine:
 * - closed -> open when consecutive failures reach failure_threshold
 * - open -> half-open on the first call at or after opened_at + cool_down
 * - half-open -> closed after success_threshold consecutive successes
 * - half-open -> open on any failure
 *
 * Every call first passes a sliding one-minute rate limit, which is
 * independent of the state machine and never touches its counters.
 *
 * Admission and outcome recording are separate critical sections; the
 * protected operation runs with no lock held, so concurrent calls against
 * one circuit never interleave inside a transition. Each admission carries
 * the circuit's generation, which changes on every transition; an outcome
 * from an older generation is counted but moves no state.
 *
 * @threadsafety All public methods are thread-safe
 */
class CircuitBreakerRegistry {
public:
    /**
     * @param default_config Config for circuits created implicitly on first use
     * @param now Clock used for cool-down and rate-limit windows
     */
    explicit CircuitBreakerRegistry(CircuitConfig default_config = {}, NowFn now = steady_now)
        : default_config_(default_config)
        , now_(now ? std::move(now) : NowFn(steady_now))
        , logger_(log::get(log::kCircuit))
    {}

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /**
     * @brief Register (or re-register) a circuit in the closed state
     *
     * @return Expected<void> InvalidCircuitConfig if thresholds are invalid
     */
    Expected<void> register_circuit(const std::string& name, const CircuitConfig& config) {
        if (auto valid = config.validate(); !valid) {
            return tl::unexpected(Error{valid.error().code, valid.error().message, name});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        Circuit circuit;
        circuit.config = config;
        circuit.generation = ++generations_;
        circuits_.insert_or_assign(name, std::move(circuit));
        logger_->info("Registered circuit: {} (failure_threshold={}, cool_down={}ms, calls_per_minute={})",
                      name, config.failure_threshold, config.cool_down.count(), config.calls_per_minute_limit);
        return {};
    }

    Expected<void> register_circuit(const std::string& name, int failure_threshold, int success_threshold,
                                    int cool_down_seconds, int calls_per_minute) {
        return register_circuit(name, CircuitConfig::with(failure_threshold, success_threshold,
                                                          cool_down_seconds, calls_per_minute));
    }

    bool has_circuit(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return circuits_.count(name) > 0;
    }

    /**
     * @brief Run an operation under a circuit's protection
     *
     * The operation returns Expected<T>; an exception it throws is reported
     * as OperationFailed. Unknown circuits are registered with the default
     * config on first use.
     *
     * @return The operation's result, or RateLimitExceeded, CircuitOpen, or
     *         the operation's own error
     */
    template<typename Op>
    auto call(const std::string& name, Op&& operation) -> std::invoke_result_t<Op&> {
        using R = std::invoke_result_t<Op&>;
        static_assert(detail::is_expected<R>::value,
                      "Protected operations must return switchyard::Expected<T>");

        auto generation = admit(name);
        if (!generation) {
            return tl::unexpected(generation.error());
        }

        R outcome = invoke_guarded<R>(operation);
        if (outcome) {
            record_success(name, *generation);
        } else {
            record_failure(name, *generation, outcome.error());
        }
        return outcome;
    }

    /**
     * @brief Run an operation, substituting the fallback on any failure
     *
     * The fallback is invoked when the circuit is open, the call is rate
     * limited, or the operation fails. It may take the Error or nothing.
     * An exception thrown by the fallback itself propagates.
     *
     * @return The operation's value or the fallback's value
     */
    template<typename Op, typename Fallback>
    auto call_with_fallback(const std::string& name, Op&& operation, Fallback&& fallback)
        -> typename std::invoke_result_t<Op&>::value_type {
        using T = typename std::invoke_result_t<Op&>::value_type;

        auto result = call(name, operation);
        if (result) {
            if constexpr (std::is_void_v<T>) {
                return;
            } else {
                return std::move(*result);
            }
        }

        logger_->warn("Circuit {} interrupted/failed: {}. Executing fallback.", name, result.error().message);
        if constexpr (std::is_invocable_v<Fallback&, const Error&>) {
            return fallback(result.error());
        } else {
            return fallback();
        }
    }

    /**
     * @brief Wrap a callable so every invocation runs through call()
     *
     * The registry must outlive the returned callable.
     */
    template<typename Func>
    auto protect(std::string name, Func func) {
        return [this, name = std::move(name), func = std::move(func)](auto&&... args) {
            return call(name, [&]() { return func(std::forward<decltype(args)>(args)...); });
        };
    }

    /**
     * @brief Return a circuit to a fresh closed state
     *
     * @return Expected<void> InvalidCircuitConfig if the circuit is unknown
     */
    Expected<void> reset(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = circuits_.find(name);
        if (it == circuits_.end()) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "Circuit not registered: " + name});
        }
        Circuit fresh;
        fresh.config = it->second.config;
        fresh.generation = ++generations_;
        it->second = std::move(fresh);
        logger_->info("Circuit {} manually reset", name);
        return {};
    }

    /**
     * @brief State, consecutive failures and total calls per circuit
     *
     * Read-only: never advances a circuit's state.
     */
    std::map<std::string, CircuitStatus> get_circuit_status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, CircuitStatus> status;
        for (const auto& [name, circuit] : circuits_) {
            status.emplace(name, CircuitStatus{circuit.state, circuit.consecutive_failures, circuit.total_calls});
        }
        return status;
    }

    /**
     * @brief Full snapshot of one circuit
     */
    Expected<CircuitSnapshot> get_circuit(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = circuits_.find(name);
        if (it == circuits_.end()) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "Circuit not registered: " + name});
        }

        const Circuit& c = it->second;
        const TimePoint window_start = now_() - kRateWindow;
        CircuitSnapshot snapshot;
        snapshot.name = name;
        snapshot.state = c.state;
        snapshot.config = c.config;
        snapshot.consecutive_failures = c.consecutive_failures;
        snapshot.consecutive_successes = c.consecutive_successes;
        snapshot.total_calls = c.total_calls;
        snapshot.rejected_calls = c.rejected_calls;
        snapshot.rate_limited_calls = c.rate_limited_calls;
        snapshot.calls_in_window = static_cast<std::size_t>(std::count_if(
            c.window.begin(), c.window.end(), [&](TimePoint t) { return t > window_start; }));
        snapshot.last_failure = c.last_failure;
        snapshot.last_success = c.last_success;
        snapshot.opened_at = c.opened_at;
        return snapshot;
    }

private:
    static constexpr std::chrono::minutes kRateWindow{1};

    struct Circuit {
        CircuitConfig config;
        CircuitState state = CircuitState::Closed;
        int consecutive_failures = 0;
        int consecutive_successes = 0;
        std::uint64_t total_calls = 0;
        std::uint64_t rejected_calls = 0;
        std::uint64_t rate_limited_calls = 0;
        std::deque<TimePoint> window;   ///< Admission times within the last minute
        std::optional<TimePoint> last_failure;
        std::optional<TimePoint> last_success;
        std::optional<TimePoint> opened_at;
        std::uint64_t generation = 0;   ///< Changes on every state transition
    };

    template<typename R, typename Op>
    static R invoke_guarded(Op& operation) {
        try {
            return operation();
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::OperationFailed, e.what()});
        }
    }

    /// Must be called with mutex_ held.
    Circuit& find_or_create(const std::string& name) {
        auto it = circuits_.find(name);
        if (it != circuits_.end()) {
            return it->second;
        }
        Circuit circuit;
        circuit.config = default_config_;
        circuit.generation = ++generations_;
        logger_->info("Registered circuit: {} (implicit, default config)", name);
        return circuits_.emplace(name, std::move(circuit)).first->second;
    }

    /// Must be called with mutex_ held.
    void transition(Circuit& circuit, CircuitState state) {
        circuit.state = state;
        circuit.generation = ++generations_;
    }

    /**
     * @brief Rate-limit check, then state check (open -> half-open after cool-down)
     *
     * @return Expected<std::uint64_t> Generation the call was admitted under
     */
    Expected<std::uint64_t> admit(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        Circuit& circuit = find_or_create(name);
        const TimePoint now = now_();

        while (!circuit.window.empty() && circuit.window.front() <= now - kRateWindow) {
            circuit.window.pop_front();
        }
        const int limit = circuit.config.calls_per_minute_limit;
        if (limit > 0 && static_cast<int>(circuit.window.size()) >= limit) {
            ++circuit.rate_limited_calls;
            logger_->warn("Rate limit exceeded for {} ({}/min)", name, limit);
            return tl::unexpected(Error{
                ErrorCode::RateLimitExceeded,
                "Rate limit exceeded for " + name,
                std::to_string(limit) + " calls per minute"
            });
        }
        circuit.window.push_back(now);

        if (circuit.state == CircuitState::Open) {
            const TimePoint retry_at = circuit.opened_at.value_or(now) + circuit.config.cool_down;
            if (now < retry_at) {
                ++circuit.rejected_calls;
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(retry_at - now);
                return tl::unexpected(Error{
                    ErrorCode::CircuitOpen,
                    "Circuit " + name + " is OPEN",
                    "retry in " + std::to_string(remaining.count()) + "ms"
                });
            }
            transition(circuit, CircuitState::HalfOpen);
            circuit.consecutive_successes = 0;
            logger_->info("Circuit {} entering half-open state", name);
        }
        return circuit.generation;
    }

    void record_success(const std::string& name, std::uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        Circuit& circuit = find_or_create(name);
        const TimePoint now = now_();

        ++circuit.total_calls;
        circuit.last_success = now;
        if (generation != circuit.generation) {
            logger_->debug("Circuit {}: ignoring success admitted before the last transition", name);
            return;
        }

        ++circuit.consecutive_successes;
        circuit.consecutive_failures = 0;

        if (circuit.state == CircuitState::HalfOpen &&
            circuit.consecutive_successes >= circuit.config.success_threshold) {
            transition(circuit, CircuitState::Closed);
            circuit.opened_at.reset();
            logger_->info("Circuit {} CLOSED (recovered)", name);
        }
    }

    void record_failure(const std::string& name, std::uint64_t generation, const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        Circuit& circuit = find_or_create(name);
        const TimePoint now = now_();

        ++circuit.total_calls;
        circuit.last_failure = now;
        if (generation != circuit.generation) {
            logger_->debug("Circuit {}: ignoring failure admitted before the last transition - {}",
                           name, error.message);
            return;
        }

        ++circuit.consecutive_failures;
        circuit.consecutive_successes = 0;

        if (circuit.state == CircuitState::HalfOpen) {
            transition(circuit, CircuitState::Open);
            circuit.opened_at = now;
            logger_->warn("Circuit {} re-OPENED: trial call failed - {}", name, error.message);
        } else if (circuit.state == CircuitState::Closed &&
                   circuit.consecutive_failures >= circuit.config.failure_threshold) {
            transition(circuit, CircuitState::Open);
            circuit.opened_at = now;
            logger_->warn("Circuit {} OPENED after {} failures - {}", name, circuit.consecutive_failures, error.message);
        }
    }

    CircuitConfig default_config_;
    NowFn now_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::map<std::string, Circuit> circuits_;
    std::uint64_t generations_ = 0;
};

} // namespace engine
} // namespace switchyard
