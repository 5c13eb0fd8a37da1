#pragma once

#include "types.hpp"
#include "orchestrator.hpp"
#include "engine/complexity_classifier.hpp"
#include "engine/compute_router.hpp"
#include "engine/intent_classifier.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace switchyard {

/// Circuits every deployment starts with: trading, cad and desktop automation.
std::map<std::string, CircuitConfig> default_circuits();

/**
 * @brief Complete runtime configuration for a Context
 *
 * Built from defaults, then overlaid by a JSON file and by environment
 * variables (see load_settings_file() and apply_env_overrides()).
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Settings {
    std::size_t history_limit = 100;                  ///< Routed results kept in history
    std::size_t worker_threads = 0;                   ///< Handler pool size (0 = hardware concurrency)
    std::chrono::milliseconds route_timeout{300000};  ///< Orchestrator wait for queued handlers
    std::string log_level = "info";                   ///< spdlog level name
    std::size_t max_finished_tasks = 1000;            ///< Terminal tasks kept for lookup (0 = unlimited)

    std::map<std::string, ChannelConfig> channels;    ///< Per-channel overrides
    ChannelConfig default_channel;                    ///< Channels without an override
    std::map<std::string, CircuitConfig> circuits = default_circuits();
    CircuitConfig default_circuit;                    ///< Circuits created implicitly on first use

    engine::ComplexityConfig classifier;
    engine::TierProfiles profiles;
    engine::KeywordTable intent_keywords = engine::default_intent_keywords();

    static Settings defaults() { return Settings{}; }

    /**
     * @brief Validate every section
     *
     * @return Expected<void> First error found, with the offending section as context
     */
    Expected<void> validate() const;

    /// Config for a channel: its override, else default_channel.
    ChannelConfig channel_config(const std::string& name) const;

    OrchestratorConfig orchestrator_config() const;

    /// Serialize back to the JSON file format.
    Payload to_json() const;
};

/**
 * @brief Overlay JSON settings on a base
 *
 * Recognized keys: history_limit, worker_threads, route_timeout_ms,
 * log_level, max_finished_tasks, channels, default_channel, circuits,
 * default_circuit, classifier, profiles, intent_keywords. Entries under
 * channels and circuits overlay the base entry of the same name.
 * intent_keywords replaces the whole table.
 *
 * @return Expected<Settings> Merged settings, or ConfigParseFailed on a type
 *         mismatch; the result is not validated
 */
Expected<Settings> settings_from_json(const Payload& json, Settings base = Settings::defaults());

/**
 * @brief Read and parse a JSON settings file, then validate the result
 *
 * @return Expected<Settings> ConfigFileUnreadable, ConfigParseFailed or a
 *         validation error
 */
Expected<Settings> load_settings_file(const std::string& path, Settings base = Settings::defaults());

/// Environment variable lookup; returns nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment.
std::optional<std::string> system_env(const std::string& name);

/// Upper-case a channel or circuit name and map '-' and '.' to '_'.
std::string env_name(const std::string& name);

/**
 * @brief Apply SWITCHYARD_* environment overrides
 *
 * Global: SWITCHYARD_HISTORY_LIMIT, SWITCHYARD_WORKER_THREADS,
 * SWITCHYARD_LOG_LEVEL, SWITCHYARD_ROUTE_TIMEOUT_MS.
 *
 * Per channel: SWITCHYARD_CHANNEL_<NAME>_CONCURRENCY, _MAX_RETRIES,
 * _RETRY_BACKOFF_MS. Per circuit: SWITCHYARD_CIRCUIT_<NAME>_FAILURE_THRESHOLD,
 * _SUCCESS_THRESHOLD, _COOL_DOWN_SECONDS, _CALLS_PER_MINUTE. Names come
 * from the settings plus the comma-separated SWITCHYARD_CHANNELS and
 * SWITCHYARD_CIRCUITS lists.
 *
 * Classifier: SWITCHYARD_CLASSIFIER_COMPLEX_KEYWORDS and
 * SWITCHYARD_CLASSIFIER_SIMPLE_KEYWORDS (comma-separated, replace the lists).
 *
 * @return Expected<void> InvalidConfig naming the variable with a malformed value
 */
Expected<void> apply_env_overrides(Settings& settings, const EnvLookup& env = system_env);

} // namespace switchyard
