/**
 * Switchyard Demo Dispatch Application
 *
 * Interactive CLI that routes typed requests through a Switchyard context
 * with simulated trading, CAD and general handlers.
 *
 * Usage:
 *   ./demo_dispatch [options]
 *
 * Options:
 *   --config <file>      JSON settings file (SWITCHYARD_* variables still apply)
 *   --review             Send successful results to the inspector
 *   --cad-failure-rate <0-100>  Percent of simulated CAD calls that fail (default: 0)
 *   --help               Show this help message
 */

#include "switchyard/switchyard.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <random>
#include <string>
#include <thread>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
        std::cout << "\n\nInterrupted. Press Enter to exit.\n";
    }
}

struct CLIArgs {
    std::string config_path;
    bool review = false;
    int cad_failure_rate = 0;
    bool help = false;
    bool error = false;
};

void print_usage(const char* program_name) {
    std::cout << "Switchyard Demo Dispatch Application\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>             JSON settings file\n";
    std::cout << "  --review                    Send successful results to the inspector\n";
    std::cout << "  --cad-failure-rate <0-100>  Percent of simulated CAD calls that fail (default: 0)\n";
    std::cout << "  --help                      Show this help message\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /status         Agents, queues and circuits as JSON\n";
    std::cout << "  /history        Last 10 routed requests\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /help           Show available commands\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--review") {
            args.review = true;
        }
        else if (arg == "--cad-failure-rate" && i + 1 < argc) {
            args.cad_failure_rate = std::stoi(argv[++i]);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.error = true;
            return args;
        }
    }

    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

switchyard::Expected<switchyard::Settings> build_settings(const CLIArgs& args) {
    switchyard::Settings settings = switchyard::Settings::defaults();
    if (!args.config_path.empty()) {
        auto loaded = switchyard::load_settings_file(args.config_path, settings);
        if (!loaded) {
            return loaded;
        }
        settings = std::move(*loaded);
    }
    if (auto result = switchyard::apply_env_overrides(settings); !result) {
        return tl::unexpected(result.error());
    }
    return settings;
}

/**
 * @brief Register simulated handlers
 *
 * trading runs inline behind the "trading" circuit; cad runs on the
 * single-slot "solidworks" channel behind the "cad" circuit; general and
 * the inspector run inline.
 */
switchyard::Expected<void> register_handlers(switchyard::Context& context, int cad_failure_rate) {
    using switchyard::Payload;
    using switchyard::Expected;
    auto& circuits = context.circuits();
    const auto& router = context.router();
    auto& orchestrator = context.orchestrator();

    orchestrator.register_handler("trading", [&circuits, &router](const std::string& message, const Payload& request_context) {
        return circuits.call("trading", [&]() -> Expected<Payload> {
            auto decision = router.route(message, "trading");
            return Payload{
                {"pair", request_context.value("pair", "GBP/USD")},
                {"model", decision.profile.model},
                {"tier", switchyard::tier_to_string(decision.tier)},
                {"summary", "Simulated analysis of: " + message}
            };
        });
    });

    auto rng = std::make_shared<std::mt19937>(std::random_device{}());
    auto cad = [&circuits, rng, cad_failure_rate](const std::string& message, const Payload&) {
        return circuits.call_with_fallback(
            "cad",
            [&]() -> Expected<Payload> {
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
                std::uniform_int_distribution<int> roll(0, 99);
                if (roll(*rng) < cad_failure_rate) {
                    return tl::unexpected(switchyard::Error{switchyard::ErrorCode::OperationFailed,
                                                            "SolidWorks did not respond"});
                }
                return Payload{{"action", "rebuild"}, {"request", message}, {"status", "done"}};
            },
            [](const switchyard::Error& error) -> Payload {
                return Payload{{"status", "deferred"}, {"reason", error.message}};
            });
    };
    if (auto result = context.register_channel_handler("cad", cad, "solidworks"); !result) {
        return result;
    }

    orchestrator.register_handler("general", [](const std::string& message, const Payload&) {
        return Payload{{"reply", "Noted: " + message}};
    });

    orchestrator.register_reviewer([](const Payload& output, const Payload&) {
        const bool complete = output.is_object() && !output.empty();
        return Payload{{"grade", complete ? "A" : "C"}, {"checked_fields", output.size()}};
    });
    return {};
}

void print_result(const switchyard::TaskResult& result, const switchyard::RoutingDecision& decision) {
    print_separator();
    std::cout << "Category: " << result.category << (result.success ? " (ok)" : " (failed)") << "\n";
    if (result.success) {
        std::cout << "Output: " << result.output.dump() << "\n";
    } else {
        std::cout << "Error: " << result.error.value_or("unknown") << "\n";
    }
    std::cout << "Metadata: " << result.metadata.dump() << "\n";
    std::cout << "Compute: " << decision.reason << "\n";
    print_separator();
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help || args.error) {
        print_usage(argv[0]);
        return args.error ? 1 : 0;
    }

    std::signal(SIGINT, signal_handler);

    auto settings = build_settings(args);
    if (!settings) {
        std::cerr << "Configuration error: " << settings.error().to_string() << "\n";
        return 1;
    }

    auto context_result = switchyard::Context::create(*settings);
    if (!context_result) {
        std::cerr << "Failed to create context: " << context_result.error().to_string() << "\n";
        return 1;
    }
    auto context = std::move(*context_result);

    if (auto result = register_handlers(*context, args.cad_failure_rate); !result) {
        std::cerr << "Failed to register handlers: " << result.error().to_string() << "\n";
        return 1;
    }

    std::cout << "\n";
    print_separator();
    std::cout << "Switchyard Demo Dispatch\n";
    print_separator();
    std::cout << "Review: " << (args.review ? "enabled" : "disabled") << "\n";
    std::cout << "Route timeout: " << context->settings().route_timeout.count() << " ms\n";
    print_separator();
    std::cout << "\nType a request and press Enter. Type '/quit' to exit.\n\n";

    std::string line;
    while (!g_interrupted) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }

        if (line == "/quit" || line == "/exit") {
            break;
        }
        if (line == "/help") {
            print_usage(argv[0]);
            continue;
        }
        if (line == "/status") {
            std::cout << context->status_json().dump(2) << "\n";
            continue;
        }
        if (line == "/history") {
            for (const auto& entry : context->orchestrator().get_task_history()) {
                std::cout << "  " << entry.category << " " << (entry.success ? "ok" : "failed");
                if (entry.error) {
                    std::cout << " - " << *entry.error;
                }
                std::cout << "\n";
            }
            continue;
        }

        switchyard::RouteRequest request(line);
        request.require_review = args.review;
        auto result = context->orchestrator().route(request);
        auto decision = context->router().route(line, result.category);
        print_result(result, decision);
    }

    context->shutdown();
    std::cout << "Goodbye.\n";
    return 0;
}
