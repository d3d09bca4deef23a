#pragma once
/**
 * @file settings.h
 * @brief Sharding configuration loading and management
 */

#include "tessera/core/types.h"
#include "tessera/core/logging.h"
#include <string>
#include <vector>

namespace tessera::config {

/**
 * @brief Backend used to persist remembered entity keys
 */
enum class RememberEntitiesStoreKind : UInt8 {
    Memory,
    File
};

/**
 * @brief Convert RememberEntitiesStoreKind to string
 */
inline const char* remember_store_kind_to_string(RememberEntitiesStoreKind kind) {
    switch (kind) {
        case RememberEntitiesStoreKind::Memory: return "memory";
        case RememberEntitiesStoreKind::File: return "file";
        default: return "unknown";
    }
}

/**
 * @brief Sharding configuration loaded from XML
 *
 * One instance configures a coordinator and every region of an entity type.
 * Timer values are policy knobs; the defaults below are the library's choice.
 */
struct ShardingSettings {
    // Cluster
    std::string role;                                  ///< Node role; empty = any
    Address coordinator_address{"coordinator"};        ///< Where regions reach the coordinator

    // Remember entities
    bool remember_entities{false};
    RememberEntitiesStoreKind remember_entities_store{RememberEntitiesStoreKind::Memory};
    std::string remember_entities_path{"./data/remember_entities.log"};

    // Shard / entity lifecycle
    Duration passivate_idle_entity_after{std::chrono::seconds(120)}; ///< 0 = never passivate
    Duration handoff_timeout{std::chrono::seconds(60)};
    Duration shard_start_timeout{std::chrono::seconds(10)};
    Duration shard_failure_backoff{std::chrono::seconds(10)};
    Duration entity_restart_backoff{std::chrono::seconds(10)};

    // Region
    Duration retry_interval{std::chrono::seconds(2)};
    Duration stats_report_interval{std::chrono::seconds(10)};
    SizeT buffer_size{100000};
    UInt32 max_delivery_attempts{3};

    // Coordinator
    Duration rebalance_interval{std::chrono::seconds(10)};
    UInt32 rebalance_threshold{1};
    UInt32 max_simultaneous_rebalance{3};
    UInt32 snapshot_after{1000};
    std::string coordinator_journal_path;              ///< Empty = in-memory journal

    // Logging
    core::LoggingConfig logging;

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file cannot be parsed
     */
    static ShardingSettings load(const std::string& path);

    /**
     * @brief Create default configuration
     */
    static ShardingSettings defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @brief Check value ranges
     * @return Human readable problems; empty if the settings are usable
     */
    std::vector<std::string> validate() const;

    /// Factory methods for common configurations
    static ShardingSettings default_config() noexcept {
        return ShardingSettings{};
    }

    static ShardingSettings small_cluster() noexcept {
        ShardingSettings settings;
        settings.passivate_idle_entity_after = std::chrono::seconds(5);
        settings.handoff_timeout = std::chrono::seconds(2);
        settings.shard_start_timeout = std::chrono::seconds(1);
        settings.shard_failure_backoff = std::chrono::milliseconds(500);
        settings.entity_restart_backoff = std::chrono::milliseconds(500);
        settings.retry_interval = std::chrono::milliseconds(200);
        settings.stats_report_interval = std::chrono::seconds(1);
        settings.rebalance_interval = std::chrono::seconds(1);
        settings.buffer_size = 1000;
        settings.snapshot_after = 50;
        return settings;
    }

    static ShardingSettings large_cluster() noexcept {
        ShardingSettings settings;
        settings.handoff_timeout = std::chrono::seconds(120);
        settings.rebalance_interval = std::chrono::seconds(30);
        settings.max_simultaneous_rebalance = 10;
        settings.rebalance_threshold = 3;
        settings.buffer_size = 500000;
        settings.snapshot_after = 5000;
        return settings;
    }
};

/**
 * @brief Configuration loader service
 */
class SettingsLoader {
public:
    SettingsLoader();
    ~SettingsLoader();

    /**
     * @brief Load sharding configuration from the search paths
     * @throws std::runtime_error if the file is missing or invalid
     */
    ShardingSettings load_sharding_settings(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     */
    std::string find_file(const std::string& filename) const;

private:
    std::vector<std::string> search_paths_;
};

} // namespace tessera::config
