/**
 * @file allocation_strategy.cpp
 * @brief Least-shard allocation strategy
 */

#include "tessera/sharding/allocation_strategy.h"
#include <algorithm>
#include <vector>

namespace tessera::sharding {

namespace {

std::map<RegionId, std::vector<ShardKey>> shards_by_region(const ShardAllocationMap& current,
                                                           const std::set<RegionId>& candidates) {
    std::map<RegionId, std::vector<ShardKey>> result;
    for (const auto& region : candidates) {
        result[region];
    }
    for (const auto& [shard, region] : current) {
        auto it = result.find(region);
        if (it != result.end()) {
            it->second.push_back(shard);
        }
    }
    return result;
}

} // anonymous namespace

LeastShardAllocationStrategy::LeastShardAllocationStrategy(UInt32 rebalance_threshold,
                                                           UInt32 max_simultaneous_rebalance)
    : rebalance_threshold_(std::max<UInt32>(1, rebalance_threshold))
    , max_simultaneous_rebalance_(max_simultaneous_rebalance) {}

std::optional<RegionId> LeastShardAllocationStrategy::allocate_shard(
    const ShardKey& /*shard*/,
    const RegionId& /*requester*/,
    const std::set<RegionId>& candidates,
    const ShardAllocationMap& current) const {

    if (candidates.empty()) {
        return std::nullopt;
    }

    auto by_region = shards_by_region(current, candidates);

    // std::map iterates in RegionId order, so strict < keeps the first on ties
    const RegionId* best = nullptr;
    SizeT best_count = 0;
    for (const auto& [region, shards] : by_region) {
        if (best == nullptr || shards.size() < best_count) {
            best = &region;
            best_count = shards.size();
        }
    }

    return *best;
}

std::set<ShardKey> LeastShardAllocationStrategy::rebalance_shards(
    const ShardAllocationMap& current,
    const std::set<RegionId>& candidates,
    const ShardSizeMap& shard_sizes,
    const std::set<ShardKey>& in_progress) const {

    std::set<ShardKey> selected;

    if (candidates.size() < 2 || in_progress.size() >= max_simultaneous_rebalance_) {
        return selected;
    }
    SizeT slots = max_simultaneous_rebalance_ - in_progress.size();

    auto by_region = shards_by_region(current, candidates);

    // Movable shards per region, in the order they would be picked
    std::map<RegionId, std::vector<ShardKey>> movable;
    for (const auto& [region, shards] : by_region) {
        auto& list = movable[region];
        for (const auto& shard : shards) {
            if (in_progress.count(shard) == 0) {
                list.push_back(shard);
            }
        }
        std::sort(list.begin(), list.end(), [&shard_sizes](const ShardKey& a, const ShardKey& b) {
            auto size_of = [&shard_sizes](const ShardKey& key) -> UInt32 {
                auto it = shard_sizes.find(key);
                return it != shard_sizes.end() ? it->second : 0;
            };
            UInt32 size_a = size_of(a);
            UInt32 size_b = size_of(b);
            if (size_a != size_b) {
                return size_a < size_b;
            }
            return a < b;
        });
        std::reverse(list.begin(), list.end());  // pop_back yields the next pick
    }

    std::map<RegionId, SizeT> counts;
    for (const auto& [region, shards] : by_region) {
        counts[region] = shards.size();
    }

    while (selected.size() < slots) {
        auto most = counts.begin();
        auto least = counts.begin();
        for (auto it = counts.begin(); it != counts.end(); ++it) {
            if (it->second > most->second) most = it;
            if (it->second < least->second) least = it;
        }

        SizeT difference = most->second - least->second;
        if (difference < rebalance_threshold_ || difference < 2) {
            break;
        }

        auto& candidates_to_move = movable[most->first];
        if (candidates_to_move.empty()) {
            break;
        }

        selected.insert(candidates_to_move.back());
        candidates_to_move.pop_back();
        --most->second;
        ++least->second;
    }

    return selected;
}

std::unique_ptr<IShardAllocationStrategy> create_least_shard_strategy(
    UInt32 rebalance_threshold, UInt32 max_simultaneous_rebalance) {
    return std::make_unique<LeastShardAllocationStrategy>(rebalance_threshold, max_simultaneous_rebalance);
}

} // namespace tessera::sharding
