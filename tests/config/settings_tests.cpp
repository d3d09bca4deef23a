/**
 * @file settings_tests.cpp
 * @brief Unit tests for sharding configuration
 */

#include <gtest/gtest.h>
#include "tessera/config/settings.h"
#include <filesystem>
#include <fstream>

using namespace tessera;
using namespace tessera::config;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("tessera_settings_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(SettingsTest, DefaultsAreValid) {
    ShardingSettings settings = ShardingSettings::defaults();
    EXPECT_TRUE(settings.validate().empty());
    EXPECT_FALSE(settings.remember_entities);
    EXPECT_EQ(settings.handoff_timeout, std::chrono::seconds(60));
    EXPECT_EQ(settings.passivate_idle_entity_after, std::chrono::seconds(120));
    EXPECT_EQ(settings.max_simultaneous_rebalance, 3u);
    EXPECT_EQ(settings.rebalance_threshold, 1u);
}

TEST_F(SettingsTest, Presets) {
    ShardingSettings small = ShardingSettings::small_cluster();
    ShardingSettings large = ShardingSettings::large_cluster();

    EXPECT_TRUE(small.validate().empty());
    EXPECT_TRUE(large.validate().empty());
    EXPECT_LT(small.handoff_timeout, large.handoff_timeout);
    EXPECT_GT(large.max_simultaneous_rebalance, small.max_simultaneous_rebalance);
}

TEST_F(SettingsTest, LoadXml) {
    std::string path = write_file("sharding.xml", R"(<?xml version="1.0"?>
<sharding_config>
  <cluster>
    <role>backend</role>
    <coordinator_address>coord-1</coordinator_address>
  </cluster>
  <remember_entities enabled="true" store="file">
    <path>/tmp/remember.log</path>
  </remember_entities>
  <shard>
    <passivate_idle_entity_after unit="s">30</passivate_idle_entity_after>
    <handoff_timeout unit="min">2</handoff_timeout>
  </shard>
  <region>
    <retry_interval>250</retry_interval>
    <buffer_size>42</buffer_size>
    <max_delivery_attempts>5</max_delivery_attempts>
  </region>
  <coordinator>
    <rebalance_threshold>2</rebalance_threshold>
    <max_simultaneous_rebalance>4</max_simultaneous_rebalance>
    <journal_path>/tmp/coordinator.journal</journal_path>
  </coordinator>
  <logging>
    <level>debug</level>
  </logging>
</sharding_config>)");

    ShardingSettings settings = ShardingSettings::load(path);

    EXPECT_EQ(settings.role, "backend");
    EXPECT_EQ(settings.coordinator_address, "coord-1");
    EXPECT_TRUE(settings.remember_entities);
    EXPECT_EQ(settings.remember_entities_store, RememberEntitiesStoreKind::File);
    EXPECT_EQ(settings.remember_entities_path, "/tmp/remember.log");
    EXPECT_EQ(settings.passivate_idle_entity_after, std::chrono::seconds(30));
    EXPECT_EQ(settings.handoff_timeout, std::chrono::minutes(2));
    EXPECT_EQ(settings.retry_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(settings.buffer_size, 42u);
    EXPECT_EQ(settings.max_delivery_attempts, 5u);
    EXPECT_EQ(settings.rebalance_threshold, 2u);
    EXPECT_EQ(settings.max_simultaneous_rebalance, 4u);
    EXPECT_EQ(settings.coordinator_journal_path, "/tmp/coordinator.journal");
    EXPECT_EQ(settings.logging.level, "debug");

    // Unlisted values keep their defaults
    EXPECT_EQ(settings.rebalance_interval, ShardingSettings::defaults().rebalance_interval);
}

TEST_F(SettingsTest, SaveThenLoad) {
    ShardingSettings original = ShardingSettings::small_cluster();
    original.remember_entities = true;
    original.coordinator_address = "coord-9";
    original.buffer_size = 7;

    std::string path = (dir_ / "saved.xml").string();
    ASSERT_TRUE(original.save(path));

    ShardingSettings loaded = ShardingSettings::load(path);
    EXPECT_EQ(loaded.coordinator_address, "coord-9");
    EXPECT_TRUE(loaded.remember_entities);
    EXPECT_EQ(loaded.buffer_size, 7u);
    EXPECT_EQ(loaded.handoff_timeout, original.handoff_timeout);
    EXPECT_EQ(loaded.retry_interval, original.retry_interval);
    EXPECT_EQ(loaded.snapshot_after, original.snapshot_after);
}

TEST_F(SettingsTest, LoadMissingFileThrows) {
    EXPECT_THROW(ShardingSettings::load((dir_ / "missing.xml").string()), std::runtime_error);
}

TEST_F(SettingsTest, LoadWrongRootThrows) {
    std::string path = write_file("other.xml", "<something_else/>");
    EXPECT_THROW(ShardingSettings::load(path), std::runtime_error);
}

TEST_F(SettingsTest, ValidateReportsProblems) {
    ShardingSettings settings;
    settings.coordinator_address.clear();
    settings.buffer_size = 0;
    settings.max_delivery_attempts = 0;
    settings.handoff_timeout = Duration{0};

    auto problems = settings.validate();
    EXPECT_EQ(problems.size(), 4u);
}

TEST_F(SettingsTest, FileStoreNeedsPath) {
    ShardingSettings settings;
    settings.remember_entities = true;
    settings.remember_entities_store = RememberEntitiesStoreKind::File;
    settings.remember_entities_path.clear();
    EXPECT_EQ(settings.validate().size(), 1u);
}

TEST_F(SettingsTest, LoaderSearchPaths) {
    write_file("found.xml", "<sharding_config><region><buffer_size>11</buffer_size></region></sharding_config>");

    SettingsLoader loader;
    loader.add_search_path(dir_.string());
    ShardingSettings settings = loader.load_sharding_settings("found.xml");
    EXPECT_EQ(settings.buffer_size, 11u);
    EXPECT_EQ(loader.find_file("found.xml"), (dir_ / "found.xml").string());

    EXPECT_THROW(loader.load_sharding_settings("does_not_exist.xml"), std::runtime_error);
}
