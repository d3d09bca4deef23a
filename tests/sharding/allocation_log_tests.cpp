/**
 * @file allocation_log_tests.cpp
 * @brief Unit tests for coordinator state, allocation log backends and recovery
 */

#include <gtest/gtest.h>
#include "tessera/sharding/allocation_log.h"
#include <filesystem>
#include <fstream>

using namespace tessera;
using namespace tessera::sharding;

// ============================================================================
// CoordinatorState Tests
// ============================================================================

class CoordinatorStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(state_.apply(ShardRegionRegistered{"r1"}), ShardingResult::Success);
        ASSERT_EQ(state_.apply(ShardRegionRegistered{"r2"}), ShardingResult::Success);
    }

    CoordinatorState state_;
};

TEST_F(CoordinatorStateTest, RegisterIsIdempotent) {
    ASSERT_EQ(state_.apply(ShardHomeAllocated{"1", "r1"}), ShardingResult::Success);
    EXPECT_EQ(state_.apply(ShardRegionRegistered{"r1"}), ShardingResult::Success);
    EXPECT_EQ(state_.regions.at("r1").count("1"), 1u);
}

TEST_F(CoordinatorStateTest, AllocateAndDeallocate) {
    ASSERT_EQ(state_.apply(ShardHomeAllocated{"1", "r1"}), ShardingResult::Success);
    EXPECT_EQ(state_.shards.at("1"), "r1");

    ASSERT_EQ(state_.apply(ShardHandOffStarted{"1"}), ShardingResult::Success);
    EXPECT_EQ(state_.in_handoff.count("1"), 1u);

    ASSERT_EQ(state_.apply(ShardHomeDeallocated{"1"}), ShardingResult::Success);
    EXPECT_EQ(state_.shards.count("1"), 0u);
    EXPECT_TRUE(state_.regions.at("r1").empty());
    EXPECT_TRUE(state_.in_handoff.empty());
}

TEST_F(CoordinatorStateTest, DoubleAllocationRejected) {
    ASSERT_EQ(state_.apply(ShardHomeAllocated{"1", "r1"}), ShardingResult::Success);
    EXPECT_EQ(state_.apply(ShardHomeAllocated{"1", "r2"}), ShardingResult::AllocationConflict);
    EXPECT_EQ(state_.shards.at("1"), "r1");
}

TEST_F(CoordinatorStateTest, AllocationToUnknownRegionRejected) {
    EXPECT_EQ(state_.apply(ShardHomeAllocated{"1", "r9"}), ShardingResult::AllocationConflict);
}

TEST_F(CoordinatorStateTest, UnknownShardOrRegion) {
    EXPECT_EQ(state_.apply(ShardHomeDeallocated{"7"}), ShardingResult::ShardNotFound);
    EXPECT_EQ(state_.apply(ShardHandOffStarted{"7"}), ShardingResult::ShardNotFound);
    EXPECT_EQ(state_.apply(ShardRegionTerminated{"r9"}), ShardingResult::RegionNotFound);
}

TEST_F(CoordinatorStateTest, TerminationReleasesShards) {
    state_.apply(ShardHomeAllocated{"1", "r1"});
    state_.apply(ShardHomeAllocated{"2", "r1"});
    state_.apply(ShardHomeAllocated{"3", "r2"});
    state_.apply(ShardHandOffStarted{"2"});

    ASSERT_EQ(state_.apply(ShardRegionTerminated{"r1"}), ShardingResult::Success);
    EXPECT_EQ(state_.regions.count("r1"), 0u);
    EXPECT_EQ(state_.shards.size(), 1u);
    EXPECT_EQ(state_.shards.at("3"), "r2");
    EXPECT_TRUE(state_.in_handoff.empty());
}

TEST(CoordinatorEventTest, Names) {
    EXPECT_STREQ(coordinator_event_name(ShardHomeAllocated{"1", "r1"}), "ShardHomeAllocated");
    EXPECT_STREQ(coordinator_event_name(ShardHandOffStarted{"1"}), "ShardHandOffStarted");
}

// ============================================================================
// Memory Log Tests
// ============================================================================

class MemoryAllocationLogTest : public ::testing::Test {
protected:
    std::shared_ptr<IAllocationLog> log_ = create_memory_allocation_log();
};

TEST_F(MemoryAllocationLogTest, SequenceNumbersIncrease) {
    SequenceNr a = 0, b = 0;
    ASSERT_EQ(log_->append(ShardRegionRegistered{"r1"}, a), ShardingResult::Success);
    ASSERT_EQ(log_->append(ShardHomeAllocated{"1", "r1"}, b), ShardingResult::Success);
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(log_->highest_sequence_nr(), 2u);

    std::vector<LogRecord> tail;
    ASSERT_EQ(log_->replay_from(1, tail), ShardingResult::Success);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail.front().sequence_nr, 2u);
}

TEST_F(MemoryAllocationLogTest, RecoverFromSnapshotAndTail) {
    SequenceNr seq = 0;
    log_->append(ShardRegionRegistered{"r1"}, seq);
    log_->append(ShardHomeAllocated{"1", "r1"}, seq);

    CoordinatorState at_snapshot;
    at_snapshot.apply(ShardRegionRegistered{"r1"});
    at_snapshot.apply(ShardHomeAllocated{"1", "r1"});
    ASSERT_EQ(log_->save_snapshot(CoordinatorSnapshot{seq, at_snapshot}), ShardingResult::Success);

    log_->append(ShardRegionRegistered{"r2"}, seq);
    log_->append(ShardHomeAllocated{"2", "r2"}, seq);

    CoordinatorState recovered;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*log_, recovered, last), ShardingResult::Success);
    EXPECT_EQ(last, 4u);
    EXPECT_EQ(recovered.shards.at("1"), "r1");
    EXPECT_EQ(recovered.shards.at("2"), "r2");
}

TEST_F(MemoryAllocationLogTest, SnapshotDropsCoveredRecords) {
    CoordinatorState live;
    SequenceNr seq = 0;
    for (const CoordinatorEvent& event : {CoordinatorEvent{ShardRegionRegistered{"r1"}},
                                          CoordinatorEvent{ShardHomeAllocated{"1", "r1"}},
                                          CoordinatorEvent{ShardHomeAllocated{"2", "r1"}}}) {
        live.apply(event);
        log_->append(event, seq);
    }
    ASSERT_EQ(log_->save_snapshot(CoordinatorSnapshot{seq, live}), ShardingResult::Success);
    EXPECT_EQ(log_->record_count(), 0u);
    EXPECT_EQ(log_->highest_sequence_nr(), 3u);

    ASSERT_EQ(log_->append(ShardHomeDeallocated{"2"}, seq), ShardingResult::Success);
    EXPECT_EQ(seq, 4u);
    EXPECT_EQ(log_->record_count(), 1u);

    CoordinatorState recovered;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*log_, recovered, last), ShardingResult::Success);
    EXPECT_EQ(last, 4u);
    EXPECT_EQ(recovered.shards.size(), 1u);
    EXPECT_EQ(recovered.shards.at("1"), "r1");
}

TEST_F(MemoryAllocationLogTest, NonApplyingRecordFailsRecovery) {
    SequenceNr seq = 0;
    log_->append(ShardRegionRegistered{"r1"}, seq);
    log_->append(ShardHomeAllocated{"1", "r1"}, seq);
    log_->append(ShardHomeAllocated{"1", "r1"}, seq);

    CoordinatorState recovered;
    SequenceNr last = 0;
    EXPECT_EQ(recover_coordinator_state(*log_, recovered, last), ShardingResult::AllocationConflict);
}

// ============================================================================
// File Log Tests
// ============================================================================

class FileAllocationLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("tessera_alloc_log_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        path_ = (dir_ / "coordinator.journal").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::string path_;
};

TEST_F(FileAllocationLogTest, SurvivesReopen) {
    {
        auto log = create_file_allocation_log(path_);
        SequenceNr seq = 0;
        ASSERT_EQ(log->append(ShardRegionRegistered{"region one"}, seq), ShardingResult::Success);
        ASSERT_EQ(log->append(ShardHomeAllocated{"shard:1", "region one"}, seq), ShardingResult::Success);
        ASSERT_EQ(log->append(ShardHandOffStarted{"shard:1"}, seq), ShardingResult::Success);
    }

    auto reopened = create_file_allocation_log(path_);
    EXPECT_EQ(reopened->highest_sequence_nr(), 3u);

    CoordinatorState state;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*reopened, state, last), ShardingResult::Success);
    EXPECT_EQ(last, 3u);
    EXPECT_EQ(state.shards.at("shard:1"), "region one");
    EXPECT_EQ(state.in_handoff.count("shard:1"), 1u);

    SequenceNr next = 0;
    ASSERT_EQ(reopened->append(ShardHomeDeallocated{"shard:1"}, next), ShardingResult::Success);
    EXPECT_EQ(next, 4u);
}

TEST_F(FileAllocationLogTest, TornTailIsDropped) {
    {
        auto log = create_file_allocation_log(path_);
        SequenceNr seq = 0;
        log->append(ShardRegionRegistered{"r1"}, seq);
        log->append(ShardHomeAllocated{"1", "r1"}, seq);
    }
    {
        std::ofstream out(path_, std::ios::app);
        out << "3 2 1:2 5:r";  // crash mid-append
    }

    auto reopened = create_file_allocation_log(path_);
    EXPECT_EQ(reopened->highest_sequence_nr(), 2u);

    std::vector<LogRecord> records;
    ASSERT_EQ(reopened->replay_from(0, records), ShardingResult::Success);
    EXPECT_EQ(records.size(), 2u);

    SequenceNr seq = 0;
    ASSERT_EQ(reopened->append(ShardHomeAllocated{"2", "r1"}, seq), ShardingResult::Success);
    EXPECT_EQ(seq, 3u);

    CoordinatorState state;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*reopened, state, last), ShardingResult::Success);
    EXPECT_EQ(state.shards.size(), 2u);
}

TEST_F(FileAllocationLogTest, SnapshotPlusTail) {
    auto log = create_file_allocation_log(path_);
    CoordinatorState live;
    SequenceNr seq = 0;

    auto persist = [&](const CoordinatorEvent& event) {
        ASSERT_EQ(live.apply(event), ShardingResult::Success);
        ASSERT_EQ(log->append(event, seq), ShardingResult::Success);
    };

    persist(ShardRegionRegistered{"r1"});
    persist(ShardRegionRegistered{"r2"});
    persist(ShardHomeAllocated{"1", "r1"});
    persist(ShardHomeAllocated{"2", "r2"});
    ASSERT_EQ(log->save_snapshot(CoordinatorSnapshot{seq, live}), ShardingResult::Success);
    persist(ShardHandOffStarted{"1"});
    persist(ShardHomeDeallocated{"1"});
    persist(ShardHomeAllocated{"1", "r2"});

    auto reopened = create_file_allocation_log(path_);
    std::optional<CoordinatorSnapshot> snapshot;
    ASSERT_EQ(reopened->load_snapshot(snapshot), ShardingResult::Success);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->sequence_nr, 4u);

    CoordinatorState recovered;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*reopened, recovered, last), ShardingResult::Success);
    EXPECT_EQ(last, 7u);
    EXPECT_EQ(recovered, live);
}

TEST_F(FileAllocationLogTest, SnapshotCompactsJournal) {
    CoordinatorState live;
    {
        auto log = create_file_allocation_log(path_);
        SequenceNr seq = 0;
        for (int i = 0; i < 20; ++i) {
            CoordinatorEvent event = i == 0 ? CoordinatorEvent{ShardRegionRegistered{"r1"}}
                                            : CoordinatorEvent{ShardHomeAllocated{std::to_string(i), "r1"}};
            ASSERT_EQ(live.apply(event), ShardingResult::Success);
            ASSERT_EQ(log->append(event, seq), ShardingResult::Success);
        }
        ASSERT_EQ(log->save_snapshot(CoordinatorSnapshot{seq, live}), ShardingResult::Success);
        EXPECT_EQ(log->record_count(), 0u);
    }

    auto reopened = create_file_allocation_log(path_);
    EXPECT_EQ(reopened->record_count(), 0u);
    EXPECT_EQ(reopened->highest_sequence_nr(), 20u);

    SequenceNr next = 0;
    ASSERT_EQ(reopened->append(ShardHomeDeallocated{"5"}, next), ShardingResult::Success);
    EXPECT_EQ(next, 21u);
    live.apply(ShardHomeDeallocated{"5"});

    CoordinatorState recovered;
    SequenceNr last = 0;
    ASSERT_EQ(recover_coordinator_state(*reopened, recovered, last), ShardingResult::Success);
    EXPECT_EQ(last, 21u);
    EXPECT_EQ(recovered, live);
}

TEST_F(FileAllocationLogTest, NoSnapshotYet) {
    auto log = create_file_allocation_log(path_);
    std::optional<CoordinatorSnapshot> snapshot;
    ASSERT_EQ(log->load_snapshot(snapshot), ShardingResult::Success);
    EXPECT_FALSE(snapshot.has_value());
}

TEST_F(FileAllocationLogTest, CorruptSnapshotReported) {
    auto log = create_file_allocation_log(path_);
    {
        std::ofstream out(path_ + ".snapshot");
        out << "garbage";
    }
    std::optional<CoordinatorSnapshot> snapshot;
    EXPECT_EQ(log->load_snapshot(snapshot), ShardingResult::StorageError);

    CoordinatorState state;
    SequenceNr last = 0;
    EXPECT_EQ(recover_coordinator_state(*log, state, last), ShardingResult::StorageError);
}
