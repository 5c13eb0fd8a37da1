#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace switchyard {

/// Opaque structured data exchanged with handlers and channels.
using Payload = nlohmann::json;

using TimePoint = std::chrono::steady_clock::time_point;

/// Source of "now" for components with time-driven state. Injected in tests.
using NowFn = std::function<TimePoint()>;

inline TimePoint steady_now() {
    return std::chrono::steady_clock::now();
}

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Dispatch queue errors
 * - 300-399: Circuit breaker errors
 * - 400-499: Orchestration errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidChannelConfig = 101,
    InvalidCircuitConfig = 102,
    ConfigFileUnreadable = 103,
    ConfigParseFailed = 104,

    // Dispatch errors (200-299)
    ChannelNotFound = 200,
    ChannelAlreadyRegistered = 201,
    TaskNotFound = 202,
    TaskRetryExhausted = 203,
    TaskCancelled = 204,
    TaskTimeout = 205,
    QueueShutdown = 206,

    // Circuit errors (300-399)
    CircuitOpen = 300,
    RateLimitExceeded = 301,
    OperationFailed = 302,

    // Orchestration errors (400-499)
    HandlerFailed = 400,
    AgentOffline = 401,
    ReviewFailed = 402,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type carried by Expected<T>. Failures inside the core are reported
 * through this type rather than through exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (task id, circuit name, underlying error)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Dispatch Types
// ============================================================================

/// Unique task identifier, formatted "<channel>-<sequence>".
using TaskId = std::string;

/**
 * @brief Task priority; higher values are started first within a channel
 */
enum class Priority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

inline constexpr std::size_t kPriorityLevels = 4;

[[nodiscard]] inline const char* priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Normal: return "normal";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

inline std::optional<Priority> priority_from_string(const std::string& name) {
    if (name == "low") return Priority::Low;
    if (name == "normal") return Priority::Normal;
    if (name == "high") return Priority::High;
    if (name == "critical") return Priority::Critical;
    return std::nullopt;
}

/**
 * @brief Task lifecycle: Pending -> Running -> {Completed | Failed | Cancelled}
 *
 * A failed attempt with retries left moves Running back to Pending.
 * Completed, Failed and Cancelled are terminal.
 */
enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] inline const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

/**
 * @brief Per-channel execution settings
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ChannelConfig {
    int concurrency = 1;                          ///< Maximum tasks running at once (> 0)
    int max_retries = 3;                          ///< Re-attempts after the first failure (>= 0)
    std::chrono::milliseconds retry_backoff{0};   ///< Base delay before a retry becomes eligible (0 = immediate)

    Expected<void> validate() const {
        if (concurrency <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidChannelConfig, "Channel concurrency must be positive"});
        }
        if (max_retries < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidChannelConfig, "max_retries must be >= 0"});
        }
        if (retry_backoff.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidChannelConfig, "retry_backoff must be >= 0"});
        }
        return {};
    }

    bool operator==(const ChannelConfig& other) const {
        return concurrency == other.concurrency &&
               max_retries == other.max_retries &&
               retry_backoff == other.retry_backoff;
    }

    bool operator!=(const ChannelConfig& other) const {
        return !(*this == other);
    }
};

/// Introspection view of one channel.
struct ChannelStatus {
    std::size_t pending = 0;
    int running = 0;
    int concurrency = 0;
    bool paused = false;

    bool operator==(const ChannelStatus& other) const {
        return pending == other.pending &&
               running == other.running &&
               concurrency == other.concurrency &&
               paused == other.paused;
    }

    bool operator!=(const ChannelStatus& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Circuit Types
// ============================================================================

enum class CircuitState {
    Closed,    ///< Calls pass through
    Open,      ///< Calls are rejected without running
    HalfOpen   ///< Trial calls test for recovery
};

[[nodiscard]] inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

/**
 * @brief Thresholds and limits for one circuit
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct CircuitConfig {
    int failure_threshold = 3;                  ///< Consecutive failures that open the circuit
    int success_threshold = 2;                  ///< Consecutive half-open successes that close it
    std::chrono::milliseconds cool_down{60000}; ///< Time spent open before a trial call is allowed
    int calls_per_minute_limit = 10;            ///< Sliding one-minute cap (0 = unlimited)

    static CircuitConfig with(int failure_threshold, int success_threshold,
                              int cool_down_seconds, int calls_per_minute) {
        CircuitConfig config;
        config.failure_threshold = failure_threshold;
        config.success_threshold = success_threshold;
        config.cool_down = std::chrono::seconds(cool_down_seconds);
        config.calls_per_minute_limit = calls_per_minute;
        return config;
    }

    Expected<void> validate() const {
        if (failure_threshold <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "failure_threshold must be positive"});
        }
        if (success_threshold <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "success_threshold must be positive"});
        }
        if (cool_down.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "cool_down must be >= 0"});
        }
        if (calls_per_minute_limit < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidCircuitConfig, "calls_per_minute_limit must be >= 0"});
        }
        return {};
    }

    bool operator==(const CircuitConfig& other) const {
        return failure_threshold == other.failure_threshold &&
               success_threshold == other.success_threshold &&
               cool_down == other.cool_down &&
               calls_per_minute_limit == other.calls_per_minute_limit;
    }

    bool operator!=(const CircuitConfig& other) const {
        return !(*this == other);
    }
};

/// Introspection view of one circuit.
struct CircuitStatus {
    CircuitState state = CircuitState::Closed;
    int failures = 0;              ///< Consecutive failures
    std::uint64_t total_calls = 0; ///< Calls that reached the operation

    bool operator==(const CircuitStatus& other) const {
        return state == other.state &&
               failures == other.failures &&
               total_calls == other.total_calls;
    }

    bool operator!=(const CircuitStatus& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Compute Tier Types
// ============================================================================

enum class Tier {
    Simple,
    Moderate,
    Complex
};

[[nodiscard]] inline const char* tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::Simple: return "simple";
        case Tier::Moderate: return "moderate";
        case Tier::Complex: return "complex";
    }
    return "unknown";
}

/**
 * @brief Generation settings for one compute tier
 */
struct ComputeProfile {
    std::string model;          ///< Model identifier passed to the provider
    int max_tokens = 1024;      ///< Output token budget
    float temperature = 0.7f;   ///< Sampling temperature
    std::string cost_tier;      ///< "low", "medium" or "high"

    bool operator==(const ComputeProfile& other) const {
        return model == other.model &&
               max_tokens == other.max_tokens &&
               temperature == other.temperature &&
               cost_tier == other.cost_tier;
    }

    bool operator!=(const ComputeProfile& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Outcome of compute tier selection for one request
 *
 * Immutable value; produced per request and discarded after use.
 */
struct RoutingDecision {
    std::string domain;       ///< Caller-declared domain the decision was made for
    Tier tier = Tier::Moderate;
    int score = 0;            ///< Combined complexity score
    ComputeProfile profile;
    std::string reason;       ///< Human-readable justification
};

// ============================================================================
// Orchestration Types
// ============================================================================

/**
 * @brief Inbound request to the Orchestrator
 */
struct RouteRequest {
    std::string message;                            ///< Free-text request
    Payload context = Payload::object();            ///< Caller-supplied context map
    std::optional<std::string> preferred_category;  ///< Explicit handler category override
    bool require_review = false;                    ///< Run the reviewer on a successful result
    Priority priority = Priority::Normal;           ///< Priority when the handler runs on a channel

    RouteRequest() = default;

    explicit RouteRequest(std::string message, Payload context = Payload::object())
        : message(std::move(message))
        , context(std::move(context))
    {}
};

/**
 * @brief Result of one routed request
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct TaskResult {
    std::string category;                ///< Handler category that produced the result
    bool success = false;
    Payload output;                      ///< Handler output (null on failure)
    std::optional<std::string> error;    ///< Failure description
    Payload metadata = Payload::object();

    static TaskResult succeeded(std::string category, Payload output) {
        TaskResult result;
        result.category = std::move(category);
        result.success = true;
        result.output = std::move(output);
        return result;
    }

    static TaskResult failed(std::string category, std::string error) {
        TaskResult result;
        result.category = std::move(category);
        result.success = false;
        result.error = std::move(error);
        return result;
    }
};

/// Condensed history entry returned by Orchestrator::get_task_history().
struct TaskSummary {
    std::string category;
    bool success = false;
    std::optional<std::string> error;

    bool operator==(const TaskSummary& other) const {
        return category == other.category &&
               success == other.success &&
               error == other.error;
    }

    bool operator!=(const TaskSummary& other) const {
        return !(*this == other);
    }
};

} // namespace switchyard
