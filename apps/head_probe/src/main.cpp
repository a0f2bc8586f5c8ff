// apps/head_probe/src/main.cpp
// tipguard: head_probe
// Purpose: Standalone helper that runs one head poll + arbitration pass over a
// set of simulated nodes and prints the outcome. Not part of the balancer.
//
// Usage:
//   ./head_probe <head> [<head> ...]     (use "x" for an unresponsive node)
//   ./head_probe 18177557 18193012 x

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "tipguard/config/config_loader.hpp"
#include "tipguard/config/constants.hpp"
#include "tipguard/health/arbiter.hpp"
#include "tipguard/health/head_poller.hpp"
#include "tipguard/health/node_registry.hpp"
#include "tipguard/health/sim_node_client.hpp"

using namespace tipguard;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <head|x> [<head|x> ...]" << std::endl;
        return EXIT_FAILURE;
    }

    health::NodeRegistry registry;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto client = std::make_shared<health::SimulatedNodeClient>();
        if (arg == "x") {
            client->fail_with(health::FetchError::Timeout);
        } else if (auto head = config::parse_uint(arg)) {
            client->set_head(*head);
        } else {
            std::cerr << "invalid head '" << arg << "': expected a block number or x" << std::endl;
            return EXIT_FAILURE;
        }
        auto id = registry.add_node("sim://node-" + std::to_string(i - 1), "", client);
        if (!id) {
            std::cerr << "cannot register node " << i - 1 << std::endl;
            return EXIT_FAILURE;
        }
    }

    const std::chrono::milliseconds ttl(config::constants::HEAD_QUERY_TTL_MS);
    const auto pool = registry.active();
    auto heads = health::poll_heads(pool, ttl);
    if (!heads) {
        std::cerr << "poll failed: " << health::to_string(heads.error()) << std::endl;
        return EXIT_FAILURE;
    }
    for (const auto& r : *heads) {
        std::cout << pool[r.index].url << "  ";
        if (r.responsive()) std::cout << *r.head << std::endl;
        else std::cout << "unresponsive (" << health::to_string(r.error.value_or(health::FetchError::Timeout)) << ")" << std::endl;
    }

    auto agreed = health::make_poverty(registry, *heads);
    if (!agreed) return EXIT_FAILURE;
    std::cout << "agreed head: " << *agreed
              << "  active: " << registry.active_size()
              << "  poverty: " << registry.poverty_size() << std::endl;
    return EXIT_SUCCESS;
}
