#pragma once
/**
 * @file protocol.h
 * @brief Messages exchanged between regions, the coordinator and clients
 *
 * All cross-machine communication is one-way message passing over an
 * ITransport. Requests that expect a reply carry a correlation id; replies
 * echo it. Receivers treat duplicates idempotently since the transport is
 * at-least-once.
 */

#include "tessera/sharding/message.h"
#include <map>
#include <variant>
#include <vector>

namespace tessera::sharding {

// ============================================================================
// Region -> Coordinator
// ============================================================================

/// Region wants to host shards
struct Register {
    RegionId region;
};

/// Proxy wants location answers only
struct RegisterProxy {
    RegionId region;
};

/// Who owns this shard?
struct GetShardHome {
    ShardKey shard;
    RegionId requester;
    CorrelationId correlation{INVALID_CORRELATION_ID};
};

/// The shard is running on the sending region
struct ShardStarted {
    ShardKey shard;
    RegionId region;
};

/// Cache entry dropped; region is buffering for the shard
struct BeginHandOffAck {
    ShardKey shard;
    RegionId region;
};

/// Local shard fully stopped after HandOff
struct ShardStopped {
    ShardKey shard;
    RegionId region;
};

/// Region is leaving; move its shards away
struct GracefulShutdownReq {
    RegionId region;
};

/// Entity counts of locally hosted shards
struct ShardSizesReport {
    RegionId region;
    std::map<ShardKey, UInt32> sizes;
};

// ============================================================================
// Coordinator -> Region
// ============================================================================

/// Registration accepted
struct RegisterAck {
    Address coordinator;
};

/// Reply to GetShardHome
struct ShardHome {
    ShardKey shard;
    RegionId region;
    CorrelationId correlation{INVALID_CORRELATION_ID};
};

/// Start hosting this shard (sent to an owner that did not ask)
struct HostShard {
    ShardKey shard;
};

/// Shard is about to move: drop cache entry and buffer
struct BeginHandOff {
    ShardKey shard;
};

/// Stop the local shard and answer ShardStopped
struct HandOff {
    ShardKey shard;
};

// ============================================================================
// Region <-> Region / Entity / Client
// ============================================================================

/// Entity stopped (sent by the entity host to its region)
struct EntityTerminated {
    ShardKey shard;
    EntityKey entity;
};

/// Message from an entity or region to an arbitrary address
struct UserMessage {
    Payload payload;
    Address sender;
};

// ============================================================================
// Membership
// ============================================================================

struct RegionUp {
    RegionId region;
};

struct RegionUnreachable {
    RegionId region;
};

struct RegionRemoved {
    RegionId region;
};

// ============================================================================
// Cluster Message Sum Type
// ============================================================================

using ClusterMessage = std::variant<
    // region -> coordinator
    Register,
    RegisterProxy,
    GetShardHome,
    ShardStarted,
    BeginHandOffAck,
    ShardStopped,
    GracefulShutdownReq,
    ShardSizesReport,
    // coordinator -> region
    RegisterAck,
    ShardHome,
    HostShard,
    BeginHandOff,
    HandOff,
    // routing
    EntityMessage,
    ShardEnvelope,
    SystemControl,
    EntityTerminated,
    UserMessage,
    StartEntityAck,
    // membership
    RegionUp,
    RegionUnreachable,
    RegionRemoved>;

/**
 * @brief Name of the alternative held by a message, for logging
 */
const char* message_type_name(const ClusterMessage& message);

} // namespace tessera::sharding
