/**
 * @file message.cpp
 * @brief Message extractors and inbound resolution
 */

#include "tessera/sharding/message.h"

namespace tessera::sharding {

// ============================================================================
// FunctionMessageExtractor
// ============================================================================

FunctionMessageExtractor::FunctionMessageExtractor(EntityKeyFunc entity_func, ShardKeyFunc shard_func)
    : entity_func_(std::move(entity_func))
    , shard_func_(std::move(shard_func)) {}

std::optional<EntityKey> FunctionMessageExtractor::entity_key(const Payload& message) const {
    if (!entity_func_) {
        return std::nullopt;
    }
    auto extracted = entity_func_(message);
    if (!extracted) {
        return std::nullopt;
    }
    return extracted->first;
}

std::optional<ShardKey> FunctionMessageExtractor::shard_key(const Payload& message) const {
    if (!shard_func_) {
        return std::nullopt;
    }
    return shard_func_(message);
}

Payload FunctionMessageExtractor::entity_message(const Payload& message) const {
    if (!entity_func_) {
        return message;
    }
    auto extracted = entity_func_(message);
    if (!extracted) {
        return message;
    }
    return extracted->second;
}

std::optional<std::pair<EntityKey, Payload>> FunctionMessageExtractor::extract_entity(const Payload& message) const {
    if (!entity_func_) {
        return std::nullopt;
    }
    return entity_func_(message);
}

// ============================================================================
// HashCodeMessageExtractor
// ============================================================================

HashCodeMessageExtractor::HashCodeMessageExtractor(UInt32 max_shards, EntityKeyOf entity_key_of)
    : max_shards_(max_shards == 0 ? 1 : max_shards)
    , entity_key_of_(std::move(entity_key_of)) {}

std::optional<EntityKey> HashCodeMessageExtractor::entity_key(const Payload& message) const {
    if (const auto* envelope = std::any_cast<EntityEnvelope>(&message)) {
        return envelope->entity_key;
    }
    if (const auto* start = std::any_cast<StartEntity>(&message)) {
        return start->entity_key;
    }
    if (entity_key_of_) {
        return entity_key_of_(message);
    }
    return std::nullopt;
}

std::optional<ShardKey> HashCodeMessageExtractor::shard_key(const Payload& message) const {
    auto key = entity_key(message);
    if (!key) {
        return std::nullopt;
    }
    return shard_key_for(*key);
}

Payload HashCodeMessageExtractor::entity_message(const Payload& message) const {
    if (const auto* envelope = std::any_cast<EntityEnvelope>(&message)) {
        return envelope->message;
    }
    return message;
}

ShardKey HashCodeMessageExtractor::shard_key_for(const EntityKey& entity_key) const {
    return std::to_string(stable_hash(entity_key) % max_shards_);
}

// ============================================================================
// Resolution
// ============================================================================

std::optional<ShardEnvelope> resolve_inbound(const InboundMessage& message,
                                             const IMessageExtractor& extractor) {
    struct Resolver {
        const IMessageExtractor& extractor;

        std::optional<ShardEnvelope> operator()(const EntityMessage& msg) const {
            auto entity = extractor.extract_entity(msg.payload);
            if (!entity || entity->first.empty()) {
                return std::nullopt;
            }
            auto shard = extractor.shard_key(msg.payload);
            if (!shard || shard->empty()) {
                return std::nullopt;
            }

            ShardEnvelope envelope;
            envelope.kind = EnvelopeKind::User;
            envelope.shard_key = *shard;
            envelope.entity_key = std::move(entity->first);
            envelope.payload = std::move(entity->second);
            envelope.sender = msg.sender;
            return envelope;
        }

        std::optional<ShardEnvelope> operator()(const ShardEnvelope& msg) const {
            if (msg.shard_key.empty() || msg.entity_key.empty()) {
                return std::nullopt;
            }
            return msg;
        }

        std::optional<ShardEnvelope> operator()(const SystemControl& msg) const {
            if (msg.entity_key.empty()) {
                return std::nullopt;
            }

            ShardEnvelope envelope;
            envelope.entity_key = msg.entity_key;
            envelope.sender = msg.sender;

            if (msg.kind == ControlKind::Passivate) {
                if (msg.shard_key.empty()) {
                    return std::nullopt;
                }
                envelope.kind = EnvelopeKind::Passivate;
                envelope.shard_key = msg.shard_key;
                envelope.payload = msg.stop_message;
                return envelope;
            }

            auto shard = extractor.shard_key(Payload{StartEntity{msg.entity_key}});
            if (!shard || shard->empty()) {
                return std::nullopt;
            }
            envelope.kind = EnvelopeKind::StartEntity;
            envelope.shard_key = *shard;
            return envelope;
        }
    };

    return std::visit(Resolver{extractor}, message);
}

UInt64 stable_hash(const std::string& value) noexcept {
    UInt64 hash = 14695981039346656037ULL;
    for (unsigned char c : value) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace tessera::sharding
