#pragma once
/**
 * @file sharding_types.h
 * @brief Result codes, dead letters and shared state enums for sharding
 */

#include "tessera/core/types.h"
#include <any>
#include <functional>
#include <string>

namespace tessera::sharding {

// ============================================================================
// Sharding Result Enum
// ============================================================================

/**
 * @brief Result codes for sharding operations
 */
enum class ShardingResult : UInt8 {
    Success = 0,

    // Configuration errors
    InvalidConfiguration,
    InvalidShardKey,
    InvalidEntityKey,

    // Protocol errors
    AllocationConflict,
    HandoffTimeout,
    UnknownPartition,
    DeliveryFailed,
    BufferOverflow,

    // Lookup errors
    ShardNotFound,
    RegionNotFound,
    EntityNotFound,

    // State errors
    NotInitialized,
    AlreadyInitialized,
    NotActive,
    OperationInProgress,

    // Resource errors
    PersistenceFailure,
    StorageError,

    // Network errors
    RegionUnreachable
};

/**
 * @brief Convert ShardingResult to string
 */
inline const char* sharding_result_to_string(ShardingResult result) {
    switch (result) {
        case ShardingResult::Success: return "Success";
        case ShardingResult::InvalidConfiguration: return "InvalidConfiguration";
        case ShardingResult::InvalidShardKey: return "InvalidShardKey";
        case ShardingResult::InvalidEntityKey: return "InvalidEntityKey";
        case ShardingResult::AllocationConflict: return "AllocationConflict";
        case ShardingResult::HandoffTimeout: return "HandoffTimeout";
        case ShardingResult::UnknownPartition: return "UnknownPartition";
        case ShardingResult::DeliveryFailed: return "DeliveryFailed";
        case ShardingResult::BufferOverflow: return "BufferOverflow";
        case ShardingResult::ShardNotFound: return "ShardNotFound";
        case ShardingResult::RegionNotFound: return "RegionNotFound";
        case ShardingResult::EntityNotFound: return "EntityNotFound";
        case ShardingResult::NotInitialized: return "NotInitialized";
        case ShardingResult::AlreadyInitialized: return "AlreadyInitialized";
        case ShardingResult::NotActive: return "NotActive";
        case ShardingResult::OperationInProgress: return "OperationInProgress";
        case ShardingResult::PersistenceFailure: return "PersistenceFailure";
        case ShardingResult::StorageError: return "StorageError";
        case ShardingResult::RegionUnreachable: return "RegionUnreachable";
        default: return "Unknown";
    }
}

// ============================================================================
// Payload
// ============================================================================

/**
 * @brief Opaque user message carried through the sharding layer
 *
 * Wire serialization is the transport's concern; in-process the payload is
 * passed by value.
 */
using Payload = std::any;

// ============================================================================
// Dead Letters
// ============================================================================

/**
 * @brief A message the sharding layer could not deliver
 */
struct DeadLetter {
    ShardingResult reason{ShardingResult::DeliveryFailed};
    ShardKey shard_key;
    EntityKey entity_key;
    Payload payload;
    Address sender;
    std::string detail;
};

/// Callback receiving every undeliverable message
using DeadLetterCallback = std::function<void(const DeadLetter&)>;

/// Callback invoked when a coordinator hits an unrecoverable error
using FatalErrorCallback = std::function<void(ShardingResult, const std::string&)>;

} // namespace tessera::sharding
