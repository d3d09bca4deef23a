#pragma once
/**
 * @file shard_coordinator.h
 * @brief Authoritative shard allocator
 *
 * The coordinator owns the shard -> region table. It processes one event at
 * a time, persists every ownership change before acting on it, and drives
 * rebalancing through a two-phase handoff:
 *
 *   1. ShardHandOffStarted is persisted and BeginHandOff is broadcast to
 *      every region and proxy; each drops its cache entry and acks.
 *   2. The owner is told to HandOff; once it answers ShardStopped (or the
 *      handoff timeout passes) ShardHomeDeallocated is persisted and any
 *      GetShardHome requests held for the shard are answered.
 *
 * Exactly-one placement cluster-wide is the job of an external singleton
 * manager, which calls start() and stop(). Every decision is idempotent
 * and persisted first, so two instances overlapping briefly during
 * failover do not grant conflicting owners from the same log.
 */

#include "tessera/config/settings.h"
#include "tessera/core/time.h"
#include "tessera/sharding/allocation_log.h"
#include "tessera/sharding/allocation_strategy.h"
#include "tessera/sharding/transport.h"
#include <memory>
#include <optional>

namespace tessera::sharding {

/**
 * @brief Coordinator lifecycle state
 */
enum class CoordinatorStatus : UInt8 {
    WaitingForState,  ///< Not recovered yet; inbound messages are stashed
    Active,
    Stopped           ///< Terminal; after a fatal error or stop()
};

/**
 * @brief Convert CoordinatorStatus to string
 */
inline const char* coordinator_status_to_string(CoordinatorStatus status) {
    switch (status) {
        case CoordinatorStatus::WaitingForState: return "WaitingForState";
        case CoordinatorStatus::Active: return "Active";
        case CoordinatorStatus::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

/**
 * @brief Coordinator statistics
 */
struct CoordinatorStats {
    UInt32 regions{0};
    UInt32 proxies{0};
    UInt32 allocated_shards{0};
    UInt32 rebalances_in_progress{0};
    UInt32 pending_requests{0};
    UInt64 allocations{0};
    UInt64 rebalances_completed{0};
    UInt64 handoff_timeouts{0};
    UInt64 events_persisted{0};
    UInt64 snapshots_saved{0};
};

/**
 * @brief Cluster-wide shard allocator
 *
 * Thread-safe; every entry point takes the coordinator's lock. The fatal
 * error callback runs after the lock is released.
 */
class ShardCoordinator : public IMessageHandler {
public:
    ShardCoordinator(const config::ShardingSettings& settings,
                     Address address,
                     std::shared_ptr<ITransport> transport,
                     std::shared_ptr<IAllocationLog> log,
                     std::shared_ptr<IShardAllocationStrategy> strategy = nullptr,
                     std::shared_ptr<core::IClock> clock = nullptr);
    ~ShardCoordinator() override;

    // Non-copyable, movable
    ShardCoordinator(const ShardCoordinator&) = delete;
    ShardCoordinator& operator=(const ShardCoordinator&) = delete;
    ShardCoordinator(ShardCoordinator&&) noexcept;
    ShardCoordinator& operator=(ShardCoordinator&&) noexcept;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Recover state from the log and become Active
     *
     * Shards that were being handed off when the previous instance died are
     * deallocated. Stashed messages are processed afterwards.
     * @return Success, AlreadyInitialized, or the recovery error (the
     *         coordinator is then Stopped)
     */
    ShardingResult start();

    /**
     * @brief Stop processing (singleton moved elsewhere)
     */
    void stop();

    /**
     * @brief Evaluate timers: rebalance interval, handoff and start timeouts
     */
    void update();

    /**
     * @brief Run one rebalance round now
     */
    ShardingResult rebalance_tick();

    void receive(const Address& from, const ClusterMessage& message) override;

    /**
     * @brief Called once when the coordinator stops on a fatal error
     */
    void set_fatal_error_callback(FatalErrorCallback callback);

    // ========================================================================
    // Queries
    // ========================================================================

    const Address& address() const noexcept;
    CoordinatorStatus get_status() const;
    ShardAllocationMap get_current_allocations() const;
    std::optional<RegionId> get_shard_home(const ShardKey& shard) const;
    std::set<RegionId> get_regions() const;
    std::set<ShardKey> get_rebalance_in_progress() const;
    CoordinatorStats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create a coordinator with the least-shard strategy from settings
 */
std::unique_ptr<ShardCoordinator> create_shard_coordinator(const config::ShardingSettings& settings,
                                                           const Address& address,
                                                           std::shared_ptr<ITransport> transport,
                                                           std::shared_ptr<IAllocationLog> log,
                                                           std::shared_ptr<core::IClock> clock = nullptr);

} // namespace tessera::sharding
