#pragma once
/**
 * @file shard.h
 * @brief Per-partition entity host with passivation and handoff
 *
 * A Shard is owned by exactly one ShardRegion and is driven only from
 * inside that region's serialized event processing, so it carries no lock
 * of its own.
 *
 * Lifecycle: Starting -> Running -> HandingOff -> Stopped.
 *  - Starting: remembered entities are loaded and recreated.
 *  - Running: messages are routed to entities, created on first use.
 *  - HandingOff: no new entities; waits for running ones to stop or for
 *    the handoff timeout.
 *  - Stopped: terminal. The remembered set is left intact.
 */

#include "tessera/config/settings.h"
#include "tessera/core/time.h"
#include "tessera/sharding/entity_host.h"
#include "tessera/sharding/message.h"
#include "tessera/sharding/remember_entities.h"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace tessera::sharding {

/**
 * @brief Shard lifecycle state
 */
enum class ShardState : UInt8 {
    Starting,
    Running,
    HandingOff,
    Stopped
};

/**
 * @brief Convert ShardState to string
 */
inline const char* shard_state_to_string(ShardState state) {
    switch (state) {
        case ShardState::Starting: return "Starting";
        case ShardState::Running: return "Running";
        case ShardState::HandingOff: return "HandingOff";
        case ShardState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

/**
 * @brief Outbound effects of a shard, provided by its region
 */
struct ShardCallbacks {
    std::function<void(const Address& to, const StartEntityAck& ack)> start_entity_ack;
    DeadLetterCallback dead_letter;
};

/**
 * @brief One partition's worth of entities
 */
class Shard {
public:
    Shard(ShardKey shard_key,
          const config::ShardingSettings& settings,
          std::shared_ptr<IEntityHost> host,
          std::shared_ptr<IRememberEntitiesStore> remember_store,
          std::shared_ptr<core::IClock> clock,
          ShardCallbacks callbacks);

    Shard(const Shard&) = delete;
    Shard& operator=(const Shard&) = delete;

    /**
     * @brief Recreate remembered entities and become Running
     * @return Success, or StorageError if the remembered set cannot be read
     *         (the shard is then Stopped)
     */
    ShardingResult start();

    /**
     * @brief Handle a resolved envelope for this shard
     * @return Success, or NotActive if the shard is handing off or stopped
     *         (the envelope was not consumed)
     */
    ShardingResult deliver(const ShardEnvelope& envelope);

    /**
     * @brief Begin passivating an entity
     * @param stop_message Delivered to the entity as it stops
     */
    void passivate(const EntityKey& entity, const Payload& stop_message);

    /**
     * @brief The host reports that an entity stopped
     */
    void entity_terminated(const EntityKey& entity);

    /**
     * @brief Stop every entity and move towards Stopped
     * @param stop_message Delivered to each entity
     */
    void begin_handoff(const Payload& stop_message);

    /**
     * @brief Evaluate timers: idle passivation, entity restarts, handoff timeout
     */
    void update();

    /**
     * @brief Messages accepted but never delivered, released once Stopped
     *
     * These are messages buffered for entities that were mid-passivation
     * when the handoff began; the region routes them to the next owner.
     */
    std::vector<ShardEnvelope> take_undelivered();

    const ShardKey& key() const noexcept { return shard_key_; }
    ShardState state() const noexcept { return state_; }
    bool is_stopped() const noexcept { return state_ == ShardState::Stopped; }

    SizeT entity_count() const noexcept { return active_.size(); }
    std::set<EntityKey> active_entities() const;
    bool is_passivating(const EntityKey& entity) const;
    SizeT buffered_count() const;

private:
    struct EntityInfo {
        TimePoint last_activity{};
    };

    ShardingResult ensure_started(const EntityKey& entity);
    void deliver_running(const ShardEnvelope& envelope);
    void dead_letter(ShardingResult reason, const ShardEnvelope& envelope, const std::string& detail);
    void finish_if_drained();
    void force_stop();

    ShardKey shard_key_;
    config::ShardingSettings settings_;
    std::shared_ptr<IEntityHost> host_;
    std::shared_ptr<IRememberEntitiesStore> remember_store_;
    std::shared_ptr<core::IClock> clock_;
    ShardCallbacks callbacks_;

    ShardState state_{ShardState::Starting};
    std::map<EntityKey, EntityInfo> active_;
    std::map<EntityKey, std::deque<ShardEnvelope>> passivating_;   ///< stop pending, messages held
    std::map<EntityKey, TimePoint> restart_due_;                   ///< stopped or failed to start, awaiting restart
    std::set<EntityKey> remembered_;
    std::deque<ShardEnvelope> startup_buffer_;
    std::vector<ShardEnvelope> undelivered_;
    TimePoint handoff_started_{};
};

} // namespace tessera::sharding
