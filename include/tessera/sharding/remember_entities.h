#pragma once
/**
 * @file remember_entities.h
 * @brief Durable record of which entities exist in each shard
 *
 * With remember-entities enabled a shard records every entity it starts and
 * forgets it only when the entity is passivated. A restarted shard loads
 * the record and recreates those entities before it accepts traffic.
 */

#include "tessera/config/settings.h"
#include "tessera/sharding/sharding_types.h"
#include <memory>
#include <set>
#include <string>

namespace tessera::sharding {

/**
 * @brief Storage interface for remembered entity keys
 */
class IRememberEntitiesStore {
public:
    virtual ~IRememberEntitiesStore() = default;

    /**
     * @brief Load the remembered entities of a shard
     * @param shard Shard to load
     * @param entities Receives the keys (cleared first)
     * @return Success or StorageError
     */
    virtual ShardingResult load(const ShardKey& shard, std::set<EntityKey>& entities) const = 0;

    /**
     * @brief Remember an entity (idempotent)
     */
    virtual ShardingResult add(const ShardKey& shard, const EntityKey& entity) = 0;

    /**
     * @brief Forget an entity (idempotent)
     */
    virtual ShardingResult remove(const ShardKey& shard, const EntityKey& entity) = 0;
};

/**
 * @brief Create an in-memory store
 */
std::shared_ptr<IRememberEntitiesStore> create_memory_remember_store();

/**
 * @brief Create an append-only file store
 */
std::shared_ptr<IRememberEntitiesStore> create_file_remember_store(const std::string& path);

/**
 * @brief Create the store selected by the settings
 * @return nullptr if remember_entities is disabled
 */
std::shared_ptr<IRememberEntitiesStore> create_remember_store(const config::ShardingSettings& settings);

} // namespace tessera::sharding
