/**
 * @file settings_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Loads and saves ShardingSettings using pugixml. Durations accept a
 * unit attribute (ms, s, min); bare numbers are milliseconds.
 */

#include "tessera/config/settings.h"
#include <pugixml.hpp>
#include <filesystem>
#include <stdexcept>

namespace tessera::config {

namespace {

// ============================================================================
// Parse Helpers
// ============================================================================

Duration convert_to_ms(double value, const std::string& unit) {
    if (unit == "min") return Duration{static_cast<Int64>(value * 60000.0)};
    if (unit == "s") return Duration{static_cast<Int64>(value * 1000.0)};
    if (unit == "us") return Duration{static_cast<Int64>(value / 1000.0)};

    // Default: milliseconds
    return Duration{static_cast<Int64>(value)};
}

Duration parse_duration(const pugi::xml_node& node, Duration fallback) {
    if (!node) {
        return fallback;
    }
    double value = node.text().as_double(static_cast<double>(fallback.count()));
    std::string unit = node.attribute("unit").as_string("ms");
    return convert_to_ms(value, unit);
}

RememberEntitiesStoreKind parse_store_kind(const std::string& kind) {
    if (kind == "file" || kind == "eventsourced") return RememberEntitiesStoreKind::File;
    return RememberEntitiesStoreKind::Memory;
}

void write_duration(pugi::xml_node parent, const char* name, Duration value) {
    auto node = parent.append_child(name);
    node.append_attribute("unit") = "ms";
    node.text().set(static_cast<long long>(value.count()));
}

} // anonymous namespace

// ============================================================================
// ShardingSettings Implementation
// ============================================================================

ShardingSettings ShardingSettings::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load sharding config: " + std::string(result.description()));
    }

    auto root = doc.child("sharding_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid sharding config XML: no root element");
    }

    ShardingSettings settings = defaults();

    // Cluster settings
    if (auto cluster = root.child("cluster")) {
        settings.role = cluster.child("role").text().as_string(settings.role.c_str());
        settings.coordinator_address = cluster.child("coordinator_address").text().as_string(
            settings.coordinator_address.c_str());
    }

    // Remember entities
    if (auto remember = root.child("remember_entities")) {
        settings.remember_entities = remember.attribute("enabled").as_bool(settings.remember_entities);
        settings.remember_entities_store = parse_store_kind(
            remember.attribute("store").as_string(remember_store_kind_to_string(settings.remember_entities_store)));
        settings.remember_entities_path = remember.child("path").text().as_string(
            settings.remember_entities_path.c_str());
    }

    // Shard settings
    if (auto shard = root.child("shard")) {
        settings.passivate_idle_entity_after = parse_duration(
            shard.child("passivate_idle_entity_after"), settings.passivate_idle_entity_after);
        settings.handoff_timeout = parse_duration(shard.child("handoff_timeout"), settings.handoff_timeout);
        settings.shard_start_timeout = parse_duration(
            shard.child("shard_start_timeout"), settings.shard_start_timeout);
        settings.shard_failure_backoff = parse_duration(
            shard.child("shard_failure_backoff"), settings.shard_failure_backoff);
        settings.entity_restart_backoff = parse_duration(
            shard.child("entity_restart_backoff"), settings.entity_restart_backoff);
    }

    // Region settings
    if (auto region = root.child("region")) {
        settings.retry_interval = parse_duration(region.child("retry_interval"), settings.retry_interval);
        settings.stats_report_interval = parse_duration(
            region.child("stats_report_interval"), settings.stats_report_interval);
        settings.buffer_size = static_cast<SizeT>(region.child("buffer_size").text().as_ullong(
            static_cast<unsigned long long>(settings.buffer_size)));
        settings.max_delivery_attempts = region.child("max_delivery_attempts").text().as_uint(
            settings.max_delivery_attempts);
    }

    // Coordinator settings
    if (auto coordinator = root.child("coordinator")) {
        settings.rebalance_interval = parse_duration(
            coordinator.child("rebalance_interval"), settings.rebalance_interval);
        settings.rebalance_threshold = coordinator.child("rebalance_threshold").text().as_uint(
            settings.rebalance_threshold);
        settings.max_simultaneous_rebalance = coordinator.child("max_simultaneous_rebalance").text().as_uint(
            settings.max_simultaneous_rebalance);
        settings.snapshot_after = coordinator.child("snapshot_after").text().as_uint(settings.snapshot_after);
        settings.coordinator_journal_path = coordinator.child("journal_path").text().as_string(
            settings.coordinator_journal_path.c_str());
    }

    // Logging
    if (auto logging = root.child("logging")) {
        settings.logging.level = logging.child("level").text().as_string(settings.logging.level.c_str());
        settings.logging.pattern = logging.child("pattern").text().as_string(settings.logging.pattern.c_str());
    }

    return settings;
}

ShardingSettings ShardingSettings::defaults() {
    return ShardingSettings{};
}

bool ShardingSettings::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("sharding_config");

    auto cluster = root.append_child("cluster");
    cluster.append_child("role").text().set(role.c_str());
    cluster.append_child("coordinator_address").text().set(coordinator_address.c_str());

    auto remember = root.append_child("remember_entities");
    remember.append_attribute("enabled") = remember_entities;
    remember.append_attribute("store") = remember_store_kind_to_string(remember_entities_store);
    remember.append_child("path").text().set(remember_entities_path.c_str());

    auto shard = root.append_child("shard");
    write_duration(shard, "passivate_idle_entity_after", passivate_idle_entity_after);
    write_duration(shard, "handoff_timeout", handoff_timeout);
    write_duration(shard, "shard_start_timeout", shard_start_timeout);
    write_duration(shard, "shard_failure_backoff", shard_failure_backoff);
    write_duration(shard, "entity_restart_backoff", entity_restart_backoff);

    auto region = root.append_child("region");
    write_duration(region, "retry_interval", retry_interval);
    write_duration(region, "stats_report_interval", stats_report_interval);
    region.append_child("buffer_size").text().set(static_cast<unsigned long long>(buffer_size));
    region.append_child("max_delivery_attempts").text().set(max_delivery_attempts);

    auto coordinator = root.append_child("coordinator");
    write_duration(coordinator, "rebalance_interval", rebalance_interval);
    coordinator.append_child("rebalance_threshold").text().set(rebalance_threshold);
    coordinator.append_child("max_simultaneous_rebalance").text().set(max_simultaneous_rebalance);
    coordinator.append_child("snapshot_after").text().set(snapshot_after);
    coordinator.append_child("journal_path").text().set(coordinator_journal_path.c_str());

    auto logging_node = root.append_child("logging");
    logging_node.append_child("level").text().set(logging.level.c_str());
    logging_node.append_child("pattern").text().set(logging.pattern.c_str());

    return doc.save_file(path.c_str());
}

std::vector<std::string> ShardingSettings::validate() const {
    std::vector<std::string> problems;

    if (coordinator_address.empty()) {
        problems.push_back("coordinator_address must not be empty");
    }
    if (handoff_timeout.count() <= 0) {
        problems.push_back("handoff_timeout must be positive");
    }
    if (retry_interval.count() <= 0) {
        problems.push_back("retry_interval must be positive");
    }
    if (rebalance_interval.count() <= 0) {
        problems.push_back("rebalance_interval must be positive");
    }
    if (passivate_idle_entity_after.count() < 0) {
        problems.push_back("passivate_idle_entity_after must not be negative");
    }
    if (buffer_size == 0) {
        problems.push_back("buffer_size must be at least 1");
    }
    if (max_delivery_attempts == 0) {
        problems.push_back("max_delivery_attempts must be at least 1");
    }
    if (rebalance_threshold == 0) {
        problems.push_back("rebalance_threshold must be at least 1");
    }
    if (remember_entities && remember_entities_store == RememberEntitiesStoreKind::File &&
        remember_entities_path.empty()) {
        problems.push_back("remember_entities_path is required for the file store");
    }

    return problems;
}

// ============================================================================
// SettingsLoader Implementation
// ============================================================================

SettingsLoader::SettingsLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./config");
}

SettingsLoader::~SettingsLoader() = default;

ShardingSettings SettingsLoader::load_sharding_settings(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Sharding config file not found: " + path);
    }
    return ShardingSettings::load(resolved);
}

void SettingsLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string SettingsLoader::find_file(const std::string& filename) const {
    // Check if it's already a path that exists
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace tessera::config
