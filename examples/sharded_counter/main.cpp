/**
 * @file main.cpp
 * @brief Sharded counter example
 *
 * One coordinator and two regions on an in-process transport. Counters are
 * spread over ten shards; the second region joins later and receives part
 * of the shards through rebalancing. The first region then shuts down
 * gracefully and its shards move to the second one.
 */

#include "tessera/tessera.h"
#include <iostream>
#include <map>

using namespace tessera;
using namespace tessera::sharding;

namespace {

class Counter : public IEntity {
public:
    void on_message(IEntityContext& context, const Payload& message, const Address& sender) override {
        const auto* command = std::any_cast<std::string>(&message);
        if (!command) {
            return;
        }
        if (*command == "inc") {
            ++value_;
        } else if (*command == "get" && !sender.empty()) {
            context.reply(sender, context.entity_key() + "=" + std::to_string(value_));
        }
    }

private:
    Int64 value_{0};
};

class Printer : public IMessageHandler {
public:
    void receive(const Address& /*from*/, const ClusterMessage& message) override {
        if (const auto* user = std::get_if<UserMessage>(&message)) {
            if (const auto* text = std::any_cast<std::string>(&user->payload)) {
                std::cout << "  " << *text << "\n";
            }
        }
    }
};

void print_allocations(const ShardCoordinator& coordinator) {
    std::map<RegionId, std::vector<ShardKey>> by_region;
    for (const auto& [shard, region] : coordinator.get_current_allocations()) {
        by_region[region].push_back(shard);
    }
    for (const auto& [region, shards] : by_region) {
        std::cout << "  " << region << ":";
        for (const auto& shard : shards) {
            std::cout << " " << shard;
        }
        std::cout << "\n";
    }
}

} // namespace

int main() {
    std::cout << "Tessera Sharded Counter Example\n";
    std::cout << "Version: " << GetVersionString() << "\n\n";

    config::ShardingSettings settings = config::ShardingSettings::small_cluster();
    settings.logging.level = "warn";
    core::configure_logging(settings.logging);

    auto clock = std::make_shared<core::ManualClock>();
    std::shared_ptr<LocalTransport> transport = create_local_transport();
    auto extractor = std::make_shared<HashCodeMessageExtractor>(10);

    auto coordinator = create_shard_coordinator(settings, settings.coordinator_address, transport,
                                                create_memory_allocation_log(), clock);
    transport->register_endpoint(settings.coordinator_address, coordinator.get());
    if (coordinator->start() != ShardingResult::Success) {
        std::cerr << "Failed to start coordinator\n";
        return 1;
    }

    Printer printer;
    transport->register_endpoint("client", &printer);

    std::map<RegionId, std::unique_ptr<ShardRegion>> nodes;
    auto add_region = [&](const RegionId& id) -> ShardRegion* {
        ShardRegionOptions options;
        options.address = id;
        options.extractor = extractor;
        options.clock = clock;
        options.entity_host = create_local_entity_host(id, transport, [](const ShardKey&, const EntityKey&) {
            return std::make_unique<Counter>();
        });

        auto& region = nodes[id];
        region = create_shard_region(settings, std::move(options), transport);
        region->set_dead_letter_callback([id](const DeadLetter& letter) {
            std::cerr << "  dead letter at " << id << ": " << letter.entity_key << " ("
                      << sharding_result_to_string(letter.reason) << ")\n";
        });
        transport->register_endpoint(id, region.get());
        if (region->start() != ShardingResult::Success) {
            return nullptr;
        }
        return region.get();
    };

    auto run = [&](Duration total) {
        const Duration step = std::chrono::milliseconds(100);
        transport->run_until_idle();
        for (Duration elapsed{0}; elapsed < total; elapsed += step) {
            clock->advance(step);
            coordinator->update();
            for (auto& [id, region] : nodes) {
                region->update();
            }
            transport->run_until_idle();
        }
    };

    ShardRegion* first = add_region("node-1");
    if (!first) {
        std::cerr << "Failed to start node-1\n";
        return 1;
    }
    run(Duration{0});

    // Twenty counters, each incremented once per index
    for (int i = 0; i < 20; ++i) {
        const EntityKey key = "counter-" + std::to_string(i);
        for (int n = 0; n <= i; ++n) {
            first->tell(EntityEnvelope{key, std::string("inc")});
        }
    }
    run(Duration{0});

    std::cout << "Allocations with one region:\n";
    print_allocations(*coordinator);

    ShardRegion* second = add_region("node-2");
    if (!second) {
        std::cerr << "Failed to start node-2\n";
        return 1;
    }
    run(settings.rebalance_interval * 4);

    std::cout << "\nAllocations after node-2 joined:\n";
    print_allocations(*coordinator);

    std::cout << "\nGraceful shutdown of node-1\n";
    if (first->graceful_shutdown() != ShardingResult::Success) {
        std::cerr << "node-1 refused to shut down\n";
        return 1;
    }
    run(settings.handoff_timeout);

    std::cout << "node-1 state: " << region_state_to_string(first->get_state()) << "\n";
    std::cout << "\nAllocations after shutdown:\n";
    print_allocations(*coordinator);

    // Counters keep no state of their own, so a moved counter restarts at zero
    std::cout << "\nCounter values:\n";
    for (int i = 0; i < 5; ++i) {
        second->tell(EntityEnvelope{"counter-" + std::to_string(i), std::string("get")}, "client");
    }
    run(Duration{0});

    auto stats = coordinator->get_stats();
    std::cout << "\nAllocations: " << stats.allocations
              << ", rebalances completed: " << stats.rebalances_completed << "\n";

    transport->unregister_endpoint("client");
    for (const auto& [id, region] : nodes) {
        transport->unregister_endpoint(id);
    }
    transport->unregister_endpoint(settings.coordinator_address);
    return 0;
}
