#pragma once
/**
 * @file types.h
 * @brief Core type definitions for Tessera
 *
 * This file defines fundamental types used throughout the library,
 * including integer aliases, the key types that identify entities, shards
 * and regions, and the clock types used for every timeout.
 */

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <limits>
#include <string>

namespace tessera {

// ============================================================================
// Numeric Types
// ============================================================================

using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Opaque identifier of one entity, stable for its logical lifetime
 */
using EntityKey = std::string;

/**
 * @brief Partition identifier derived from a message by the extractor
 *
 * Many entity keys map to one shard key.
 */
using ShardKey = std::string;

/**
 * @brief Network address of an endpoint (region, proxy, coordinator, client)
 */
using Address = std::string;

/**
 * @brief Identifies a node-level region instance (its network address)
 */
using RegionId = Address;

/**
 * @brief Correlates a request with its reply
 */
using CorrelationId = UInt64;

constexpr CorrelationId INVALID_CORRELATION_ID = 0;

/**
 * @brief Sequence number of a persisted record
 */
using SequenceNr = UInt64;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Monotonic clock used for all protocol timeouts
 */
using SteadyClockType = std::chrono::steady_clock;
using TimePoint = SteadyClockType::time_point;

/**
 * @brief Millisecond resolution is enough for every timer in the protocol
 */
using Duration = std::chrono::milliseconds;

} // namespace tessera
