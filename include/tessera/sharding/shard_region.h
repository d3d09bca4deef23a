#pragma once
/**
 * @file shard_region.h
 * @brief Per-node router, shard location cache and local shard host
 *
 * A region resolves every inbound message to a shard once, then either
 * hands it to a locally hosted Shard, forwards it to the region that owns
 * the shard, or buffers it while the owner is being resolved with the
 * coordinator. Buffered messages are flushed in arrival order.
 *
 * Per shard the region tracks: Unknown -> Resolving -> Known(region), and
 * Known entries are invalidated on delivery failure, BeginHandOff or
 * membership changes.
 *
 * A proxy region routes and caches but never hosts shards.
 */

#include "tessera/config/settings.h"
#include "tessera/core/time.h"
#include "tessera/sharding/entity_host.h"
#include "tessera/sharding/message.h"
#include "tessera/sharding/remember_entities.h"
#include "tessera/sharding/shard.h"
#include "tessera/sharding/transport.h"
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace tessera::sharding {

/**
 * @brief Region lifecycle state
 */
enum class RegionState : UInt8 {
    Idle,          ///< Constructed, start() not called
    Registering,   ///< Waiting for RegisterAck
    Active,
    ShuttingDown,  ///< Graceful shutdown requested, shards moving away
    Stopped        ///< Hosts nothing; still forwards
};

/**
 * @brief Convert RegionState to string
 */
inline const char* region_state_to_string(RegionState state) {
    switch (state) {
        case RegionState::Idle: return "Idle";
        case RegionState::Registering: return "Registering";
        case RegionState::Active: return "Active";
        case RegionState::ShuttingDown: return "ShuttingDown";
        case RegionState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

/**
 * @brief Construction parameters of a region
 */
struct ShardRegionOptions {
    RegionId address;                                   ///< This region's transport address
    bool proxy{false};                                  ///< Route only, never host
    Payload handoff_stop_message;                       ///< Sent to entities on handoff (empty = plain stop)
    std::shared_ptr<IMessageExtractor> extractor;       ///< Required
    std::shared_ptr<IEntityHost> entity_host;           ///< Required unless proxy
    std::shared_ptr<IRememberEntitiesStore> remember_store; ///< nullptr = remember-entities off
    std::shared_ptr<core::IClock> clock;                ///< nullptr = steady clock
};

/**
 * @brief Region statistics
 */
struct RegionStats {
    UInt32 hosted_shards{0};
    UInt32 active_entities{0};
    UInt32 buffered_messages{0};
    UInt32 cached_locations{0};
    UInt64 delivered_local{0};
    UInt64 forwarded{0};
    UInt64 shard_home_requests{0};
    UInt64 dead_letters{0};
};

/**
 * @brief Node-level router and host for shards of one entity type
 *
 * Thread-safe: every entry point takes the region's lock, so events are
 * processed one at a time. Dead letter callbacks run after the lock is
 * released. The transport holds the address of this object as its message
 * handler; register it again after a move.
 */
class ShardRegion : public IMessageHandler {
public:
    ShardRegion(const config::ShardingSettings& settings,
                ShardRegionOptions options,
                std::shared_ptr<ITransport> transport);
    ~ShardRegion() override;

    // Non-copyable, movable
    ShardRegion(const ShardRegion&) = delete;
    ShardRegion& operator=(const ShardRegion&) = delete;
    ShardRegion(ShardRegion&&) noexcept;
    ShardRegion& operator=(ShardRegion&&) noexcept;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Validate options and register with the coordinator
     * @return InvalidConfiguration, AlreadyInitialized or Success
     */
    ShardingResult start();

    /**
     * @brief Ask the coordinator to move every local shard away
     *
     * The region reaches Stopped once it hosts no shards and holds no
     * buffered messages.
     */
    ShardingResult graceful_shutdown();

    /**
     * @brief Evaluate timers (retries, shard timers, reports)
     */
    void update();

    // ========================================================================
    // Messaging
    // ========================================================================

    /**
     * @brief Route a user message
     * @return UnknownPartition if the extractor rejects it (also reported
     *         as a dead letter), Success otherwise
     */
    ShardingResult tell(Payload message, const Address& sender = {});

    /**
     * @brief Start an entity without a message; the sender gets StartEntityAck
     */
    ShardingResult start_entity(const EntityKey& entity, const Address& sender = {});

    void receive(const Address& from, const ClusterMessage& message) override;

    /**
     * @brief Register a callback for undeliverable messages
     */
    void set_dead_letter_callback(DeadLetterCallback callback);

    // ========================================================================
    // Queries
    // ========================================================================

    const RegionId& address() const noexcept;
    bool is_proxy() const noexcept;
    RegionState get_state() const;

    std::vector<ShardKey> get_hosted_shards() const;
    std::optional<ShardState> get_shard_state(const ShardKey& shard) const;
    std::set<EntityKey> get_shard_entities(const ShardKey& shard) const;
    std::optional<RegionId> get_cached_location(const ShardKey& shard) const;
    bool is_resolving(const ShardKey& shard) const;
    RegionStats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create a region
 */
std::unique_ptr<ShardRegion> create_shard_region(const config::ShardingSettings& settings,
                                                 ShardRegionOptions options,
                                                 std::shared_ptr<ITransport> transport);

} // namespace tessera::sharding
