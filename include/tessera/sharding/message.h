#pragma once
/**
 * @file message.h
 * @brief Inbound message shapes and partition functions
 *
 * Everything that enters a region is one of three shapes: a user message
 * that still needs its keys extracted, an envelope whose keys were already
 * resolved by another region, or a control message. The shape is resolved
 * once, at the region boundary, into a ShardEnvelope; nothing deeper in the
 * pipeline looks at the user payload again.
 */

#include "tessera/sharding/sharding_types.h"
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

namespace tessera::sharding {

// ============================================================================
// Control Payloads
// ============================================================================

/**
 * @brief Start an entity without delivering a user message
 *
 * The extractor is asked for the shard key of this payload, so custom
 * extractors must handle it.
 */
struct StartEntity {
    EntityKey entity_key;
};

/**
 * @brief Sent to the StartEntity sender once the entity is running
 */
struct StartEntityAck {
    EntityKey entity_key;
    ShardKey shard_key;
};

/**
 * @brief Convenience wrapper pairing an entity key with its message
 *
 * Understood by HashCodeMessageExtractor out of the box.
 */
struct EntityEnvelope {
    EntityKey entity_key;
    Payload message;
};

// ============================================================================
// Inbound Message Sum Type
// ============================================================================

/**
 * @brief User message that has not been partitioned yet
 */
struct EntityMessage {
    Payload payload;
    Address sender;
};

/**
 * @brief What a resolved envelope asks the shard to do
 */
enum class EnvelopeKind : UInt8 {
    User,
    StartEntity,
    Passivate
};

/**
 * @brief Message with both keys resolved, ready for a shard
 */
struct ShardEnvelope {
    EnvelopeKind kind{EnvelopeKind::User};
    ShardKey shard_key;
    EntityKey entity_key;
    Payload payload;             ///< User message, or stop message for Passivate
    Address sender;
    UInt32 delivery_attempts{0}; ///< Failed remote sends so far
};

/**
 * @brief Kind of system control message
 */
enum class ControlKind : UInt8 {
    StartEntity,
    Passivate
};

/**
 * @brief Control message addressed to an entity
 *
 * Passivate requests come from the entity itself and already carry the
 * shard key; StartEntity requests are partitioned by the extractor.
 */
struct SystemControl {
    ControlKind kind{ControlKind::StartEntity};
    EntityKey entity_key;
    ShardKey shard_key;
    Payload stop_message;
    Address sender;
};

using InboundMessage = std::variant<EntityMessage, ShardEnvelope, SystemControl>;

// ============================================================================
// Message Extractor Interface
// ============================================================================

/**
 * @brief Caller-supplied partition functions
 *
 * Implementations must be pure and deterministic for the lifetime of the
 * cluster: the same message must always produce the same keys on every node.
 */
class IMessageExtractor {
public:
    virtual ~IMessageExtractor() = default;

    /**
     * @brief Entity key of a message, or nullopt if the message is not shardable
     */
    virtual std::optional<EntityKey> entity_key(const Payload& message) const = 0;

    /**
     * @brief Shard key of a message, or nullopt if the message is not shardable
     */
    virtual std::optional<ShardKey> shard_key(const Payload& message) const = 0;

    /**
     * @brief Message actually delivered to the entity (default: unchanged)
     */
    virtual Payload entity_message(const Payload& message) const {
        return message;
    }

    /**
     * @brief Entity key and delivered message in one pass
     *
     * Default combines entity_key() and entity_message(). Override when
     * both come from the same extraction.
     */
    virtual std::optional<std::pair<EntityKey, Payload>> extract_entity(const Payload& message) const {
        auto entity = entity_key(message);
        if (!entity) {
            return std::nullopt;
        }
        return std::make_pair(*entity, entity_message(message));
    }
};

/// Extracts the entity key and the message to deliver
using EntityKeyFunc = std::function<std::optional<std::pair<EntityKey, Payload>>(const Payload&)>;

/// Extracts the shard key
using ShardKeyFunc = std::function<std::optional<ShardKey>(const Payload&)>;

/**
 * @brief Extractor built from two functions
 */
class FunctionMessageExtractor : public IMessageExtractor {
public:
    FunctionMessageExtractor(EntityKeyFunc entity_func, ShardKeyFunc shard_func);

    std::optional<EntityKey> entity_key(const Payload& message) const override;
    std::optional<ShardKey> shard_key(const Payload& message) const override;
    Payload entity_message(const Payload& message) const override;
    std::optional<std::pair<EntityKey, Payload>> extract_entity(const Payload& message) const override;

private:
    EntityKeyFunc entity_func_;
    ShardKeyFunc shard_func_;
};

/**
 * @brief Extractor that hashes the entity key into a fixed number of shards
 *
 * Uses FNV-1a so the mapping is identical on every node and build.
 * EntityEnvelope and StartEntity are handled without a custom function.
 */
class HashCodeMessageExtractor : public IMessageExtractor {
public:
    /// Optional function for payloads other than EntityEnvelope/StartEntity
    using EntityKeyOf = std::function<std::optional<EntityKey>(const Payload&)>;

    explicit HashCodeMessageExtractor(UInt32 max_shards, EntityKeyOf entity_key_of = nullptr);

    std::optional<EntityKey> entity_key(const Payload& message) const override;
    std::optional<ShardKey> shard_key(const Payload& message) const override;
    Payload entity_message(const Payload& message) const override;

    /**
     * @brief Shard key for an entity key
     */
    ShardKey shard_key_for(const EntityKey& entity_key) const;

    UInt32 max_shards() const noexcept { return max_shards_; }

private:
    UInt32 max_shards_;
    EntityKeyOf entity_key_of_;
};

// ============================================================================
// Resolution
// ============================================================================

/**
 * @brief Resolve an inbound message into a shard envelope
 *
 * Pure function. Returns nullopt when the extractor cannot partition the
 * message (empty keys count as unpartitionable).
 */
std::optional<ShardEnvelope> resolve_inbound(const InboundMessage& message,
                                             const IMessageExtractor& extractor);

/**
 * @brief Stable 64-bit FNV-1a hash of a string
 */
UInt64 stable_hash(const std::string& value) noexcept;

} // namespace tessera::sharding
