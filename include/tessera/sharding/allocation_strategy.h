#pragma once
/**
 * @file allocation_strategy.h
 * @brief Shard placement and rebalance decisions
 *
 * Strategies are pure: no I/O, no hidden state. The coordinator calls them
 * with a full description of the cluster and applies the answer itself.
 * Identical inputs always produce identical outputs, which keeps decisions
 * reproducible across coordinator restarts.
 */

#include "tessera/sharding/sharding_types.h"
#include <map>
#include <memory>
#include <optional>
#include <set>

namespace tessera::sharding {

/// Authoritative shard -> owner table
using ShardAllocationMap = std::map<ShardKey, RegionId>;

/// Entity count per shard as last reported by the owners
using ShardSizeMap = std::map<ShardKey, UInt32>;

// ============================================================================
// Allocation Strategy Interface
// ============================================================================

/**
 * @brief Shard placement policy
 */
class IShardAllocationStrategy {
public:
    virtual ~IShardAllocationStrategy() = default;

    /**
     * @brief Choose the owner of an unallocated shard
     * @param shard Shard to place
     * @param requester Region that asked
     * @param candidates Regions eligible to host
     * @param current Current allocations (may include non-candidates)
     * @return Chosen region, or nullopt if there is no candidate
     */
    virtual std::optional<RegionId> allocate_shard(const ShardKey& shard,
                                                   const RegionId& requester,
                                                   const std::set<RegionId>& candidates,
                                                   const ShardAllocationMap& current) const = 0;

    /**
     * @brief Choose shards to move this round
     * @param current Current allocations
     * @param candidates Regions eligible to host
     * @param shard_sizes Reported entity counts (missing = 0)
     * @param in_progress Shards already being handed off
     * @return Shards to hand off; never contains an in-progress shard
     */
    virtual std::set<ShardKey> rebalance_shards(const ShardAllocationMap& current,
                                                const std::set<RegionId>& candidates,
                                                const ShardSizeMap& shard_sizes,
                                                const std::set<ShardKey>& in_progress) const = 0;
};

// ============================================================================
// Least Shard Strategy
// ============================================================================

/**
 * @brief Places shards on the least loaded region and evens out counts
 *
 * Allocation picks the candidate owning the fewest shards, ties broken by
 * RegionId ordering. Rebalance repeatedly moves one shard from the most
 * loaded to the least loaded candidate while their difference is at least
 * the threshold and a move still reduces it, up to max_simultaneous
 * shards in flight (counting those already in progress). Within a region,
 * smaller shards move first, ties broken by ShardKey.
 */
class LeastShardAllocationStrategy : public IShardAllocationStrategy {
public:
    LeastShardAllocationStrategy(UInt32 rebalance_threshold, UInt32 max_simultaneous_rebalance);

    std::optional<RegionId> allocate_shard(const ShardKey& shard,
                                           const RegionId& requester,
                                           const std::set<RegionId>& candidates,
                                           const ShardAllocationMap& current) const override;

    std::set<ShardKey> rebalance_shards(const ShardAllocationMap& current,
                                        const std::set<RegionId>& candidates,
                                        const ShardSizeMap& shard_sizes,
                                        const std::set<ShardKey>& in_progress) const override;

    UInt32 rebalance_threshold() const noexcept { return rebalance_threshold_; }
    UInt32 max_simultaneous_rebalance() const noexcept { return max_simultaneous_rebalance_; }

private:
    UInt32 rebalance_threshold_;
    UInt32 max_simultaneous_rebalance_;
};

/**
 * @brief Create the default allocation strategy
 */
std::unique_ptr<IShardAllocationStrategy> create_least_shard_strategy(
    UInt32 rebalance_threshold, UInt32 max_simultaneous_rebalance);

} // namespace tessera::sharding
