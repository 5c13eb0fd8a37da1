#pragma once

#include "../types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace switchyard {
namespace engine {

// ============================================================================
// Handler Types
// ============================================================================

/** @brief Category handler; takes the request message and context, returns output or Error. */
using Handler = std::function<Expected<Payload>(const std::string&, const Payload&)>;

/** @brief Reviewer; takes a successful handler output and the request context. */
using ReviewHandler = std::function<Expected<Payload>(const Payload&, const Payload&)>;

namespace detail {

template<typename T>
struct is_expected_payload : std::false_type {};

template<>
struct is_expected_payload<Expected<Payload>> : std::true_type {};

// Calls func and normalizes its result into Expected<Payload>. Anything
// a json value can be built from is accepted as a plain success.
template<typename Func, typename... Args>
Expected<Payload> invoke_normalized(const Func& func, ErrorCode code, const Args&... args) {
    using result_type = std::decay_t<std::invoke_result_t<const Func&, const Args&...>>;
    try {
        if constexpr (is_expected_payload<result_type>::value) {
            return func(args...);
        } else {
            static_assert(std::is_constructible_v<Payload, result_type>,
                          "Handler must return Expected<Payload> or a json-convertible value");
            return Payload(func(args...));
        }
    } catch (const std::exception& e) {
        return tl::unexpected(Error{code, std::string("Handler threw: ") + e.what()});
    }
}

} // namespace detail

// ============================================================================
// Handler Registration Entry
// ============================================================================

/** @brief One registered category handler. */
struct HandlerEntry {
    std::string category;
    Handler handler;
    std::optional<std::string> channel;   ///< Dispatch channel; empty means run inline
};

// ============================================================================
// HandlerRegistry
// ============================================================================

/**
 * @brief Category -> handler map used by the Orchestrator
 *
 * Handlers registered through the template overload are wrapped so that a
 * thrown std::exception becomes a HandlerFailed error.
 *
 * @threadsafety All public methods are thread-safe. Lookups take a shared
 * lock; registration takes an exclusive lock. Handlers are copied out of
 * the registry before being invoked.
 */
class HandlerRegistry {
public:
    /**
     * @brief Register a callable for a category, replacing any previous one
     *
     * @param category Category name
     * @param func Callable (message, context) returning Expected<Payload> or
     *        any value convertible to Payload
     * @param channel Optional dispatch channel the handler runs on
     */
    template<typename Func>
    void register_handler(const std::string& category, Func func,
                          std::optional<std::string> channel = std::nullopt) {
        Handler handler = [f = std::move(func)](const std::string& message,
                                                const Payload& context) -> Expected<Payload> {
            return detail::invoke_normalized(f, ErrorCode::HandlerFailed, message, context);
        };
        std::unique_lock lock(mutex_);
        handlers_.insert_or_assign(category, HandlerEntry{category, std::move(handler), std::move(channel)});
    }

    /** @brief Look up a handler entry; returns a copy so it can be run without the lock. */
    std::optional<HandlerEntry> find(const std::string& category) const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(category);
        if (it == handlers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has_handler(const std::string& category) const {
        std::shared_lock lock(mutex_);
        return handlers_.find(category) != handlers_.end();
    }

    /** @brief Invoke the handler for a category directly. */
    Expected<Payload> invoke(const std::string& category, const std::string& message,
                             const Payload& context) const {
        auto entry = find(category);
        if (!entry) {
            return tl::unexpected(Error{ErrorCode::AgentOffline,
                                        "Agent category '" + category + "' is offline."});
        }
        return entry->handler(message, context);
    }

    std::vector<std::string> get_categories() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(handlers_.size());
        for (const auto& [name, _] : handlers_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return handlers_.size();
    }

private:
    std::unordered_map<std::string, HandlerEntry> handlers_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace switchyard
