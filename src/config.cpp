#include "switchyard/config.hpp"
#include "switchyard/engine/text.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>

namespace switchyard {

namespace {

const std::set<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

Error parse_error(const std::string& message, const std::string& where) {
    return Error{ErrorCode::ConfigParseFailed, message, where};
}

// ============================================================================
// JSON -> Settings
// ============================================================================

void read_channel(const Payload& json, ChannelConfig& config) {
    if (json.contains("concurrency")) config.concurrency = json.at("concurrency").get<int>();
    if (json.contains("max_retries")) config.max_retries = json.at("max_retries").get<int>();
    if (json.contains("retry_backoff_ms")) {
        config.retry_backoff = std::chrono::milliseconds(json.at("retry_backoff_ms").get<long long>());
    }
}

void read_circuit(const Payload& json, CircuitConfig& config) {
    if (json.contains("failure_threshold")) config.failure_threshold = json.at("failure_threshold").get<int>();
    if (json.contains("success_threshold")) config.success_threshold = json.at("success_threshold").get<int>();
    if (json.contains("cool_down_ms")) {
        config.cool_down = std::chrono::milliseconds(json.at("cool_down_ms").get<long long>());
    } else if (json.contains("cool_down_seconds")) {
        config.cool_down = std::chrono::milliseconds(
            static_cast<long long>(json.at("cool_down_seconds").get<double>() * 1000.0));
    }
    if (json.contains("calls_per_minute_limit")) {
        config.calls_per_minute_limit = json.at("calls_per_minute_limit").get<int>();
    }
}

void read_profile(const Payload& json, ComputeProfile& profile) {
    if (json.contains("model")) profile.model = json.at("model").get<std::string>();
    if (json.contains("max_tokens")) profile.max_tokens = json.at("max_tokens").get<int>();
    if (json.contains("temperature")) profile.temperature = json.at("temperature").get<float>();
    if (json.contains("cost_tier")) profile.cost_tier = json.at("cost_tier").get<std::string>();
}

void read_classifier(const Payload& json, engine::ComplexityConfig& config) {
    using Patterns = std::vector<std::string>;
    if (json.contains("simple_patterns")) config.simple_patterns = json.at("simple_patterns").get<Patterns>();
    if (json.contains("complex_patterns")) config.complex_patterns = json.at("complex_patterns").get<Patterns>();
    if (json.contains("booster_phrases")) config.booster_phrases = json.at("booster_phrases").get<Patterns>();
    if (json.contains("length_threshold_words")) {
        config.length_threshold_words = json.at("length_threshold_words").get<int>();
    }
    if (json.contains("forced_complex_domains")) {
        config.forced_complex_domains = json.at("forced_complex_domains").get<Patterns>();
    }
}

void read_profiles(const Payload& json, engine::TierProfiles& profiles) {
    if (json.contains("simple")) read_profile(json.at("simple"), profiles.simple);
    if (json.contains("moderate")) read_profile(json.at("moderate"), profiles.moderate);
    if (json.contains("complex")) read_profile(json.at("complex"), profiles.complex);
    if (json.contains("domain_temperature")) {
        profiles.domain_temperature = json.at("domain_temperature").get<std::map<std::string, float>>();
    }
}

Payload profile_to_json(const ComputeProfile& profile) {
    return Payload{
        {"model", profile.model},
        {"max_tokens", profile.max_tokens},
        {"temperature", profile.temperature},
        {"cost_tier", profile.cost_tier}
    };
}

Payload channel_to_json(const ChannelConfig& config) {
    return Payload{
        {"concurrency", config.concurrency},
        {"max_retries", config.max_retries},
        {"retry_backoff_ms", config.retry_backoff.count()}
    };
}

Payload circuit_to_json(const CircuitConfig& config) {
    return Payload{
        {"failure_threshold", config.failure_threshold},
        {"success_threshold", config.success_threshold},
        {"cool_down_ms", config.cool_down.count()},
        {"calls_per_minute_limit", config.calls_per_minute_limit}
    };
}

// ============================================================================
// Environment parsing
// ============================================================================

Expected<long long> parse_integer(const std::string& variable, const std::string& value) {
    long long parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || value.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig,
                                    "Expected an integer for " + variable, value});
    }
    return parsed;
}

Expected<long long> parse_non_negative(const std::string& variable, const std::string& value) {
    auto parsed = parse_integer(variable, value);
    if (parsed && *parsed < 0) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig,
                                    "Expected a non-negative integer for " + variable, value});
    }
    return parsed;
}

/// Apply @p apply when @p variable is set; values outside int range are rejected.
template<typename Apply>
Expected<void> with_integer(const EnvLookup& env, const std::string& variable, Apply apply) {
    auto raw = env(variable);
    if (!raw) {
        return {};
    }
    auto value = parse_integer(variable, *raw);
    if (!value) {
        return tl::unexpected(value.error());
    }
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig,
                                    "Expected an integer in int range for " + variable, *raw});
    }
    apply(static_cast<int>(*value));
    return {};
}

std::set<std::string> names_from(const EnvLookup& env, const std::string& list_variable) {
    std::set<std::string> names;
    if (auto raw = env(list_variable)) {
        for (auto& name : engine::text::split_list(*raw)) {
            names.insert(std::move(name));
        }
    }
    return names;
}

} // namespace

// ============================================================================
// Settings
// ============================================================================

std::map<std::string, CircuitConfig> default_circuits() {
    return {
        {"trading", CircuitConfig::with(3, 2, 60, 5)},
        {"cad", CircuitConfig::with(5, 2, 60, 10)},
        {"desktop", CircuitConfig::with(10, 2, 60, 60)},
    };
}

Expected<void> Settings::validate() const {
    if (route_timeout.count() <= 0) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "route_timeout must be positive"});
    }
    if (kLogLevels.count(log_level) == 0) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level: " + log_level});
    }
    if (auto result = default_channel.validate(); !result) {
        return tl::unexpected(Error{result.error().code, result.error().message, "default_channel"});
    }
    for (const auto& [name, config] : channels) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(Error{result.error().code, result.error().message, "channel " + name});
        }
    }
    if (auto result = default_circuit.validate(); !result) {
        return tl::unexpected(Error{result.error().code, result.error().message, "default_circuit"});
    }
    for (const auto& [name, config] : circuits) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(Error{result.error().code, result.error().message, "circuit " + name});
        }
    }
    if (auto result = classifier.validate(); !result) {
        return tl::unexpected(Error{result.error().code, result.error().message, "classifier"});
    }
    if (auto result = profiles.validate(); !result) {
        return tl::unexpected(result.error());
    }
    for (const auto& [category, keywords] : intent_keywords) {
        if (category.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Intent category name cannot be empty"});
        }
    }
    return {};
}

ChannelConfig Settings::channel_config(const std::string& name) const {
    auto it = channels.find(name);
    return it != channels.end() ? it->second : default_channel;
}

OrchestratorConfig Settings::orchestrator_config() const {
    OrchestratorConfig config;
    config.history_limit = history_limit;
    config.route_timeout = route_timeout;
    return config;
}

Payload Settings::to_json() const {
    Payload channel_json = Payload::object();
    for (const auto& [name, config] : channels) {
        channel_json[name] = channel_to_json(config);
    }
    Payload circuit_json = Payload::object();
    for (const auto& [name, config] : circuits) {
        circuit_json[name] = circuit_to_json(config);
    }

    return Payload{
        {"history_limit", history_limit},
        {"worker_threads", worker_threads},
        {"route_timeout_ms", route_timeout.count()},
        {"log_level", log_level},
        {"max_finished_tasks", max_finished_tasks},
        {"channels", channel_json},
        {"default_channel", channel_to_json(default_channel)},
        {"circuits", circuit_json},
        {"default_circuit", circuit_to_json(default_circuit)},
        {"classifier", {
            {"simple_patterns", classifier.simple_patterns},
            {"complex_patterns", classifier.complex_patterns},
            {"booster_phrases", classifier.booster_phrases},
            {"length_threshold_words", classifier.length_threshold_words},
            {"forced_complex_domains", classifier.forced_complex_domains}
        }},
        {"profiles", {
            {"simple", profile_to_json(profiles.simple)},
            {"moderate", profile_to_json(profiles.moderate)},
            {"complex", profile_to_json(profiles.complex)},
            {"domain_temperature", profiles.domain_temperature}
        }},
        {"intent_keywords", intent_keywords}
    };
}

// ============================================================================
// Loading
// ============================================================================

Expected<Settings> settings_from_json(const Payload& json, Settings base) {
    if (!json.is_object()) {
        return tl::unexpected(parse_error("Settings must be a JSON object", json.type_name()));
    }

    std::string section = "settings";
    try {
        if (json.contains("history_limit")) base.history_limit = json.at("history_limit").get<std::size_t>();
        if (json.contains("worker_threads")) base.worker_threads = json.at("worker_threads").get<std::size_t>();
        if (json.contains("route_timeout_ms")) {
            base.route_timeout = std::chrono::milliseconds(json.at("route_timeout_ms").get<long long>());
        }
        if (json.contains("log_level")) base.log_level = json.at("log_level").get<std::string>();
        if (json.contains("max_finished_tasks")) {
            base.max_finished_tasks = json.at("max_finished_tasks").get<std::size_t>();
        }

        if (json.contains("default_channel")) {
            section = "default_channel";
            read_channel(json.at("default_channel"), base.default_channel);
        }
        if (json.contains("channels")) {
            const Payload& entries = json.at("channels");
            for (auto it = entries.begin(); it != entries.end(); ++it) {
                const std::string& name = it.key();
                const Payload& entry = it.value();
                section = "channel " + name;
                auto existing = base.channels.find(name);
                ChannelConfig config = existing != base.channels.end() ? existing->second : base.default_channel;
                read_channel(entry, config);
                base.channels[name] = config;
            }
        }

        if (json.contains("default_circuit")) {
            section = "default_circuit";
            read_circuit(json.at("default_circuit"), base.default_circuit);
        }
        if (json.contains("circuits")) {
            const Payload& entries = json.at("circuits");
            for (auto it = entries.begin(); it != entries.end(); ++it) {
                const std::string& name = it.key();
                const Payload& entry = it.value();
                section = "circuit " + name;
                auto existing = base.circuits.find(name);
                CircuitConfig config = existing != base.circuits.end() ? existing->second : base.default_circuit;
                read_circuit(entry, config);
                base.circuits[name] = config;
            }
        }

        if (json.contains("classifier")) {
            section = "classifier";
            read_classifier(json.at("classifier"), base.classifier);
        }
        if (json.contains("profiles")) {
            section = "profiles";
            read_profiles(json.at("profiles"), base.profiles);
        }
        if (json.contains("intent_keywords")) {
            section = "intent_keywords";
            base.intent_keywords = json.at("intent_keywords").get<engine::KeywordTable>();
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(parse_error(std::string("Invalid settings value: ") + e.what(), section));
    }
    return base;
}

Expected<Settings> load_settings_file(const std::string& path, Settings base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Cannot open settings file", path});
    }

    Payload json;
    try {
        json = Payload::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return tl::unexpected(parse_error(std::string("Malformed settings file: ") + e.what(), path));
    }

    auto settings = settings_from_json(json, std::move(base));
    if (!settings) {
        return settings;
    }
    if (auto valid = settings->validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return settings;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string env_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '-' || c == '.' || c == ' ') {
            result.push_back('_');
        } else {
            result.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return result;
}

Expected<void> apply_env_overrides(Settings& settings, const EnvLookup& env) {
    const std::string prefix = "SWITCHYARD_";

    if (auto raw = env(prefix + "HISTORY_LIMIT")) {
        auto value = parse_non_negative(prefix + "HISTORY_LIMIT", *raw);
        if (!value) return tl::unexpected(value.error());
        settings.history_limit = static_cast<std::size_t>(*value);
    }
    if (auto raw = env(prefix + "WORKER_THREADS")) {
        auto value = parse_non_negative(prefix + "WORKER_THREADS", *raw);
        if (!value) return tl::unexpected(value.error());
        settings.worker_threads = static_cast<std::size_t>(*value);
    }
    if (auto raw = env(prefix + "ROUTE_TIMEOUT_MS")) {
        auto value = parse_non_negative(prefix + "ROUTE_TIMEOUT_MS", *raw);
        if (!value) return tl::unexpected(value.error());
        settings.route_timeout = std::chrono::milliseconds(*value);
    }
    if (auto raw = env(prefix + "LOG_LEVEL")) {
        std::string level = engine::text::to_lower(*raw);
        if (kLogLevels.count(level) == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level in " + prefix + "LOG_LEVEL", *raw});
        }
        settings.log_level = level;
    }

    std::set<std::string> channel_names = names_from(env, prefix + "CHANNELS");
    for (const auto& [name, _] : settings.channels) {
        channel_names.insert(name);
    }
    for (const auto& name : channel_names) {
        const std::string base = prefix + "CHANNEL_" + env_name(name) + "_";
        ChannelConfig config = settings.channel_config(name);

        auto result = with_integer(env, base + "CONCURRENCY", [&](int v) { config.concurrency = v; });
        if (result) result = with_integer(env, base + "MAX_RETRIES", [&](int v) { config.max_retries = v; });
        if (result) result = with_integer(env, base + "RETRY_BACKOFF_MS", [&](int v) {
            config.retry_backoff = std::chrono::milliseconds(v);
        });
        if (!result) {
            return result;
        }
        settings.channels[name] = config;
    }

    std::set<std::string> circuit_names = names_from(env, prefix + "CIRCUITS");
    for (const auto& [name, _] : settings.circuits) {
        circuit_names.insert(name);
    }
    for (const auto& name : circuit_names) {
        const std::string base = prefix + "CIRCUIT_" + env_name(name) + "_";
        auto existing = settings.circuits.find(name);
        CircuitConfig config = existing != settings.circuits.end() ? existing->second : settings.default_circuit;

        auto result = with_integer(env, base + "FAILURE_THRESHOLD", [&](int v) {
            config.failure_threshold = v;
        });
        if (result) result = with_integer(env, base + "SUCCESS_THRESHOLD", [&](int v) {
            config.success_threshold = v;
        });
        if (result) result = with_integer(env, base + "COOL_DOWN_SECONDS", [&](int v) {
            config.cool_down = std::chrono::seconds(v);
        });
        if (result) result = with_integer(env, base + "CALLS_PER_MINUTE", [&](int v) {
            config.calls_per_minute_limit = v;
        });
        if (!result) {
            return result;
        }
        settings.circuits[name] = config;
    }

    if (auto raw = env(prefix + "CLASSIFIER_COMPLEX_KEYWORDS")) {
        settings.classifier.complex_patterns = engine::text::split_list(*raw);
    }
    if (auto raw = env(prefix + "CLASSIFIER_SIMPLE_KEYWORDS")) {
        settings.classifier.simple_patterns = engine::text::split_list(*raw);
    }
    return {};
}

} // namespace switchyard
