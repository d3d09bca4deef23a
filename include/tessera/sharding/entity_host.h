#pragma once
/**
 * @file entity_host.h
 * @brief Actor runtime boundary: creating, messaging and stopping entities
 *
 * A shard never touches entity objects directly. It asks its IEntityHost to
 * start, deliver to and stop entities by key. Stop completion is reported
 * back asynchronously as an EntityTerminated message sent to the owning
 * region, and an entity's own passivation request arrives there as a
 * SystemControl message.
 */

#include "tessera/sharding/transport.h"
#include <functional>
#include <memory>

namespace tessera::sharding {

// ============================================================================
// Entity Host Interface
// ============================================================================

/**
 * @brief Runtime that hosts entity instances
 */
class IEntityHost {
public:
    virtual ~IEntityHost() = default;

    /**
     * @brief Create the entity if it is not running
     */
    virtual ShardingResult start_entity(const ShardKey& shard, const EntityKey& entity) = 0;

    /**
     * @brief Deliver one message to a running entity
     * @return EntityNotFound if the entity is not running
     */
    virtual ShardingResult deliver(const ShardKey& shard, const EntityKey& entity,
                                   const Payload& message, const Address& sender) = 0;

    /**
     * @brief Ask an entity to stop
     *
     * Completion is signalled by an EntityTerminated message to the region.
     * @param stop_message Delivered to the entity before it stops (may be empty)
     */
    virtual void stop_entity(const ShardKey& shard, const EntityKey& entity, const Payload& stop_message) = 0;

    /**
     * @brief Destroy the entity at once
     *
     * No EntityTerminated is reported, and a stop still in progress is
     * abandoned. Used when a handoff times out.
     */
    virtual void kill_entity(const ShardKey& shard, const EntityKey& entity) = 0;
};

// ============================================================================
// Local Entity Host
// ============================================================================

/**
 * @brief Handle an entity uses to talk to the rest of the system
 */
class IEntityContext {
public:
    virtual ~IEntityContext() = default;

    virtual const ShardKey& shard_key() const = 0;
    virtual const EntityKey& entity_key() const = 0;

    /**
     * @brief Send a reply to an address
     */
    virtual void reply(const Address& to, Payload message) = 0;

    /**
     * @brief Ask the shard to passivate this entity
     * @param stop_message Delivered back to the entity when the shard stops it
     */
    virtual void passivate(Payload stop_message = {}) = 0;

    /**
     * @brief Stop this entity once the current message is processed
     */
    virtual void stop() = 0;
};

/**
 * @brief Application entity
 */
class IEntity {
public:
    virtual ~IEntity() = default;

    virtual void on_start(IEntityContext& /*context*/) {}

    virtual void on_message(IEntityContext& context, const Payload& message, const Address& sender) = 0;

    /**
     * @brief Called with the stop message right before the entity is destroyed
     */
    virtual void on_stop(IEntityContext& /*context*/, const Payload& /*stop_message*/) {}
};

using EntityFactory = std::function<std::unique_ptr<IEntity>(const ShardKey& shard, const EntityKey& entity)>;

/**
 * @brief In-process host driving IEntity objects synchronously
 *
 * Termination notices and passivation requests are posted to the region
 * through the transport, so they are observed by the region as ordinary
 * messages after the current call returns.
 */
class LocalEntityHost : public IEntityHost {
public:
    LocalEntityHost(Address region_address, std::shared_ptr<ITransport> transport, EntityFactory factory);
    ~LocalEntityHost() override;

    LocalEntityHost(const LocalEntityHost&) = delete;
    LocalEntityHost& operator=(const LocalEntityHost&) = delete;

    ShardingResult start_entity(const ShardKey& shard, const EntityKey& entity) override;
    ShardingResult deliver(const ShardKey& shard, const EntityKey& entity,
                           const Payload& message, const Address& sender) override;
    void stop_entity(const ShardKey& shard, const EntityKey& entity, const Payload& stop_message) override;
    void kill_entity(const ShardKey& shard, const EntityKey& entity) override;

    /**
     * @brief Number of live entities
     */
    SizeT entity_count() const;

    bool is_running(const ShardKey& shard, const EntityKey& entity) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create an in-process entity host for a region
 */
std::shared_ptr<LocalEntityHost> create_local_entity_host(const Address& region_address,
                                                          std::shared_ptr<ITransport> transport,
                                                          EntityFactory factory);

} // namespace tessera::sharding
