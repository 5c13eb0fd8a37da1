#pragma once

/**
 * @file switchyard.hpp
 * @brief Main convenience header for Switchyard
 *
 * Include this single header to get access to all public Switchyard APIs.
 *
 * Switchyard is an in-process dispatch and resilience layer: it routes
 * requests to category handlers, serializes work against slow external
 * systems through bounded channel queues, isolates failing dependencies
 * behind circuit breakers, and picks a compute tier for generative calls.
 *
 * Quick Start:
 * @code
 * #include <switchyard/switchyard.hpp>
 *
 * int main() {
 *     auto context = switchyard::Context::create(switchyard::Settings::defaults());
 *     if (!context) {
 *         std::cerr << "Error: " << context.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto& orchestrator = (*context)->orchestrator();
 *     orchestrator.register_handler("trading", [](const std::string& message, const switchyard::Payload&) {
 *         return switchyard::Payload{{"analysis", message}};
 *     });
 *
 *     auto result = orchestrator.route(switchyard::RouteRequest("GBP/USD setup"));
 *     std::cout << result.output.dump() << std::endl;
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - switchyard::Context: Owns every component; one per process
 * - switchyard::Orchestrator: Intent routing, fallback, review, history
 * - switchyard::engine::DispatchQueue: Per-channel bounded priority queues with retries
 * - switchyard::engine::CircuitBreakerRegistry: Named breakers with rate limits
 * - switchyard::engine::ComputeTierSelector: Complexity tier to compute profile
 * - switchyard::Error: Structured error handling
 *
 * Thread Safety:
 * - Every component synchronizes itself with one mutex
 * - Handlers and protected operations run with no lock held
 */

// Core types
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"

// Public API
#include "context.hpp"
#include "orchestrator.hpp"

// Engine components
#include "engine/circuit_breaker.hpp"
#include "engine/complexity_classifier.hpp"
#include "engine/compute_router.hpp"
#include "engine/dispatch_queue.hpp"
#include "engine/handler_registry.hpp"
#include "engine/intent_classifier.hpp"
#include "engine/task_history.hpp"
#include "engine/thread_pool.hpp"

/**
 * @namespace switchyard
 * @brief Main namespace for Switchyard
 *
 * Internal building blocks live in switchyard::engine; logging helpers in
 * switchyard::log.
 */
