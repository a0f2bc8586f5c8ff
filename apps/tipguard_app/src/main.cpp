/**
 * @file main.cpp
 * @brief tipguard_app: wires config → registry → health loop + drop listener.
 *
 * **Bootstrap**
 * - Load config (JSON file or named defaults); register one node per endpoint.
 *
 * **Health**
 * - HealthMonitor on its own thread; DropHandler on another when every node
 *   has a WS endpoint.
 *
 * **Invariants**
 * - RCU: readers ACQUIRE, writers RELEASE.
 * - Pool mutations never wait on the network.
 *
 * Transport-backed clients belong to the request-serving layer, which is not
 * part of this binary; endpoints are backed by SimulatedNodeClient so the
 * arbitration can be watched end to end. The last endpoint lags behind and
 * catches up halfway through the run.
 */

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include "tipguard/config/config_loader.hpp"
#include "tipguard/config/constants.hpp"
#include "tipguard/health/collaborators.hpp"
#include "tipguard/health/drop_handler.hpp"
#include "tipguard/health/health_monitor.hpp"
#include "tipguard/health/node_registry.hpp"
#include "tipguard/health/sim_node_client.hpp"
#include "tipguard/version.hpp"

using namespace tipguard;

namespace {

/// Stand-in for the finalized-block tracker: reports what it would refresh.
class LoggingRefresher final : public health::SafeBlockRefresher {
public:
    tipguard_detail::expected<void, health::HealthError>
    refresh(const health::NodeRegistry& registry, std::chrono::milliseconds budget) override {
        spdlog::debug("safe block refresh over {} active nodes (budget {} ms)",
                      registry.active_size(), budget.count());
        return {};
    }
};

/// Stand-in for the subscription dispatcher.
class LoggingMover final : public health::SubscriptionMover {
public:
    tipguard_detail::expected<void, health::MigrationError>
    move_subscriptions(std::size_t dropped_index) override {
        spdlog::info("moving subscriptions away from WS connection #{}", dropped_index);
        return {};
    }
};

config::MonitorConfig demo_config() {
    auto c = config::Loader::defaults();
    c.health.interval = std::chrono::milliseconds(500);
    c.rpc = {
        {"https://node-a.invalid", "wss://node-a.invalid"},
        {"https://node-b.invalid", "wss://node-b.invalid"},
        {"https://node-c.invalid", "wss://node-c.invalid"},
    };
    c.is_ws = true;
    return c;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels(); // SPDLOG_LEVEL=debug
    spdlog::info("tipguard {} starting", tipguard::version_string);

    config::MonitorConfig cfg = demo_config();
    if (argc > 1) {
        auto loaded = config::Loader::load_from_file(argv[1]);
        if (!loaded) {
            spdlog::critical("cannot load {}: {}", argv[1], config::to_string(loaded.error()));
            return EXIT_FAILURE;
        }
        cfg = std::move(*loaded);
    }
    int cycles = 6;
    if (argc > 2) {
        auto n = config::parse_uint(argv[2]);
        if (!n || *n == 0 || *n > 100000) {
            spdlog::critical("invalid cycle count '{}': expected 1..100000", argv[2]);
            return EXIT_FAILURE;
        }
        cycles = static_cast<int>(*n);
    }

    health::NodeRegistry registry;
    std::vector<std::shared_ptr<health::SimulatedNodeClient>> clients;
    constexpr health::BlockNumber kStartHead = 18193012;
    for (const auto& ep : cfg.rpc) {
        auto client = std::make_shared<health::SimulatedNodeClient>(kStartHead);
        if (auto id = registry.add_node(ep.url, ep.ws_url, client); !id) {
            spdlog::error("skipping endpoint {}", ep.url);
            continue;
        }
        clients.push_back(std::move(client));
    }
    if (clients.empty()) {
        spdlog::critical("no usable RPC endpoints configured");
        return EXIT_FAILURE;
    }
    if (clients.size() > 1) clients.back()->set_head(kStartHead - 16); // laggard

    if (!cfg.health_check) {
        spdlog::warn("health checking disabled; {} nodes stay active", registry.active_size());
        return EXIT_SUCCESS;
    }

    auto commands_exp = health::CommandChannel::with_capacity(config::constants::RECONNECT_QUEUE_CAPACITY);
    if (!commands_exp) {
        spdlog::critical("cannot create reconnect queue");
        return EXIT_FAILURE;
    }
    auto commands = std::move(*commands_exp);

    LoggingRefresher refresher;
    health::HealthMonitor monitor(registry, refresher, cfg.health);
    std::thread health_thread([&] {
        if (auto r = monitor.run(); !r) spdlog::critical("health monitoring terminated: {}", health::to_string(r.error()));
    });

    LoggingMover mover;
    auto failures = health::FailureChannel::unbounded();
    health::DropHandler dropper(registry, mover, failures, commands);
    std::thread drop_thread;
    if (cfg.is_ws) {
        drop_thread = std::thread([&] {
            if (auto r = dropper.run(); !r) spdlog::info("drop listener stopped: {}", health::to_string(r.error()));
        });
    }

    for (int i = 0; i < cycles; ++i) {
        std::this_thread::sleep_for(cfg.health.interval);
        for (auto& c : clients) c->advance();
        if (i == cycles / 2 && clients.size() > 1) {
            clients.back()->set_head(clients.front()->block_number(cfg.health.ttl).value_or(kStartHead));
            if (cfg.is_ws) (void)failures->try_send(health::TransportFailure{0});
        }
    }

    monitor.request_stop();
    health_thread.join();
    if (drop_thread.joinable()) {
        failures->close(); // ends the listener (reported as a protocol violation)
        drop_thread.join();
    }

    health::WsCommand cmd{};
    std::size_t reconnects = 0;
    while (commands->recv_until(cmd, std::chrono::steady_clock::now()) == mem::RecvStatus::Value) ++reconnects;

    auto snap = registry.snapshot();
    spdlog::info("done after {} cycles: {} active, {} in poverty, {} reconnect requests",
                 monitor.cycles(), snap->active.size(), snap->poverty.size(), reconnects);
    return EXIT_SUCCESS;
}
