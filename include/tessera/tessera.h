#pragma once
/**
 * @file tessera.h
 * @brief Main include file for Tessera
 *
 * Tessera - Cluster Entity Sharding
 *
 * Include this single header to access all public Tessera APIs.
 */

#include "tessera/core/types.h"
#include "tessera/core/time.h"
#include "tessera/core/logging.h"

#include "tessera/config/settings.h"

#include "tessera/sharding/sharding_types.h"
#include "tessera/sharding/message.h"
#include "tessera/sharding/protocol.h"
#include "tessera/sharding/transport.h"
#include "tessera/sharding/allocation_strategy.h"
#include "tessera/sharding/allocation_log.h"
#include "tessera/sharding/remember_entities.h"
#include "tessera/sharding/entity_host.h"
#include "tessera/sharding/shard.h"
#include "tessera/sharding/shard_region.h"
#include "tessera/sharding/shard_coordinator.h"

/**
 * @namespace tessera
 * @brief Root namespace for all Tessera components
 */
namespace tessera {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace tessera
