#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "switchyard/engine/handler_registry.hpp"

using namespace switchyard;
using namespace switchyard::engine;

class HandlerRegistryTest : public ::testing::Test {
protected:
    HandlerRegistry registry;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(HandlerRegistryTest, RegisterAndInvoke) {
    registry.register_handler("trading", [](const std::string& message, const Payload&) -> Expected<Payload> {
        return Payload{{"echo", message}};
    });

    EXPECT_TRUE(registry.has_handler("trading"));
    EXPECT_EQ(registry.size(), 1u);

    auto result = registry.invoke("trading", "GBP/USD bias?", Payload::object());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["echo"], "GBP/USD bias?");
}

TEST_F(HandlerRegistryTest, PlainReturnValuesAreWrapped) {
    registry.register_handler("general", [](const std::string& message, const Payload&) {
        return "ack: " + message;
    });
    registry.register_handler("system", [](const std::string&, const Payload& context) {
        return Payload{{"seen", context.size()}};
    });

    auto text = registry.invoke("general", "ping", Payload::object());
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "ack: ping");

    auto object = registry.invoke("system", "", Payload{{"a", 1}, {"b", 2}});
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ((*object)["seen"], 2);
}

TEST_F(HandlerRegistryTest, ReRegisterReplaces) {
    registry.register_handler("cad", [](const std::string&, const Payload&) { return 1; });
    registry.register_handler("cad", [](const std::string&, const Payload&) { return 2; });

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(*registry.invoke("cad", "", Payload::object()), 2);
}

TEST_F(HandlerRegistryTest, ChannelIsStored) {
    registry.register_handler("cad", [](const std::string&, const Payload&) { return 1; },
                              std::string("solidworks"));
    registry.register_handler("general", [](const std::string&, const Payload&) { return 1; });

    auto cad = registry.find("cad");
    ASSERT_TRUE(cad.has_value());
    ASSERT_TRUE(cad->channel.has_value());
    EXPECT_EQ(*cad->channel, "solidworks");

    auto general = registry.find("general");
    ASSERT_TRUE(general.has_value());
    EXPECT_FALSE(general->channel.has_value());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(HandlerRegistryTest, MissingCategoryIsOffline) {
    auto result = registry.invoke("sketch", "napkin drawing", Payload::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AgentOffline);
    EXPECT_EQ(result.error().message, "Agent category 'sketch' is offline.");
    EXPECT_FALSE(registry.find("sketch").has_value());
}

TEST_F(HandlerRegistryTest, ReturnedErrorPassesThrough) {
    registry.register_handler("cad", [](const std::string&, const Payload&) -> Expected<Payload> {
        return tl::unexpected(Error{ErrorCode::HandlerFailed, "SolidWorks is not running"});
    });

    auto result = registry.invoke("cad", "rebuild", Payload::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "SolidWorks is not running");
}

TEST_F(HandlerRegistryTest, ThrownExceptionBecomesHandlerFailed) {
    registry.register_handler("trading", [](const std::string&, const Payload&) -> Expected<Payload> {
        throw std::runtime_error("feed disconnected");
    });

    auto result = registry.invoke("trading", "bias?", Payload::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::HandlerFailed);
    EXPECT_EQ(result.error().message, "Handler threw: feed disconnected");
}

// ============================================================================
// Introspection and Concurrency
// ============================================================================

TEST_F(HandlerRegistryTest, GetCategories) {
    registry.register_handler("a", [](const std::string&, const Payload&) { return 1; });
    registry.register_handler("b", [](const std::string&, const Payload&) { return 2; });

    auto categories = registry.get_categories();
    EXPECT_EQ(categories.size(), 2u);
    EXPECT_NE(std::find(categories.begin(), categories.end(), "a"), categories.end());
    EXPECT_NE(std::find(categories.begin(), categories.end(), "b"), categories.end());
}

TEST_F(HandlerRegistryTest, ConcurrentInvokeAndRegister) {
    std::atomic<int> calls{0};
    registry.register_handler("general", [&calls](const std::string&, const Payload&) {
        calls.fetch_add(1);
        return 0;
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 100; ++i) {
                auto result = registry.invoke("general", "hi", Payload::object());
                EXPECT_TRUE(result.has_value());
            }
        });
    }
    threads.emplace_back([this]() {
        for (int i = 0; i < 50; ++i) {
            registry.register_handler("extra" + std::to_string(i),
                                      [i](const std::string&, const Payload&) { return i; });
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 400);
    EXPECT_EQ(registry.size(), 51u);
}
