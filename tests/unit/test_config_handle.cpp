#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "config/config_handle.hpp"
#include "config/gateway_config.hpp"

namespace {

using evo::config::ConfigHandle;
using evo::config::GatewayConfig;
using evo::config::ProviderConfig;

GatewayConfig config_with_port(std::uint16_t port) {
    GatewayConfig config;
    config.server.host = "0.0.0.0";
    config.server.port = port;
    return config;
}

}  // namespace

TEST(ConfigHandleTest, SnapshotReflectsInitialValue) {
    ConfigHandle<GatewayConfig> handle(config_with_port(8080), "gateway config");

    EXPECT_EQ(handle.snapshot()->server.port, 8080);
    EXPECT_EQ(handle.generation(), 0u);
}

TEST(ConfigHandleTest, ReaderKeepsItsSnapshotAfterReplace) {
    ConfigHandle<GatewayConfig> handle(config_with_port(8080));
    const auto before = handle.snapshot();

    GatewayConfig next = config_with_port(9090);
    ProviderConfig provider;
    provider.name = "openai";
    provider.enabled = true;
    next.providers.push_back(provider);
    const auto generation = handle.replace(next);

    EXPECT_EQ(generation, 1u);
    EXPECT_EQ(handle.generation(), 1u);
    EXPECT_EQ(before->server.port, 8080);
    EXPECT_TRUE(before->providers.empty());
    EXPECT_EQ(*handle.snapshot(), next);
}

TEST(ConfigHandleTest, ConcurrentReadersSeeWholeConfigs) {
    ConfigHandle<GatewayConfig> handle(config_with_port(1));
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto snapshot = handle.snapshot();
                // Every published config has as many providers as its port number - 1.
                if (snapshot->providers.size() + 1 != snapshot->server.port) {
                    ++torn;
                }
            }
        });
    }
    for (std::uint16_t port = 2; port < 50; ++port) {
        GatewayConfig next = config_with_port(port);
        next.providers.resize(port - 1);
        handle.replace(next);
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(handle.generation(), 48u);
}
