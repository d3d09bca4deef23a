/**
 * @file allocation_log.cpp
 * @brief Coordinator state transitions and allocation log backends
 */

#include "tessera/sharding/allocation_log.h"
#include "tessera/core/record_codec.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <type_traits>

namespace tessera::sharding {

// ============================================================================
// Event Names
// ============================================================================

const char* coordinator_event_name(const CoordinatorEvent& event) {
    switch (event.index()) {
        case 0: return "ShardRegionRegistered";
        case 1: return "ShardRegionTerminated";
        case 2: return "ShardHomeAllocated";
        case 3: return "ShardHomeDeallocated";
        case 4: return "ShardHandOffStarted";
        default: return "Unknown";
    }
}

// ============================================================================
// CoordinatorState
// ============================================================================

ShardingResult CoordinatorState::apply(const CoordinatorEvent& event) {
    return std::visit([this](const auto& e) -> ShardingResult {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, ShardRegionRegistered>) {
            regions.try_emplace(e.region);
            return ShardingResult::Success;
        } else if constexpr (std::is_same_v<T, ShardRegionTerminated>) {
            auto it = regions.find(e.region);
            if (it == regions.end()) {
                return ShardingResult::RegionNotFound;
            }
            for (const auto& shard : it->second) {
                shards.erase(shard);
                in_handoff.erase(shard);
            }
            regions.erase(it);
            return ShardingResult::Success;
        } else if constexpr (std::is_same_v<T, ShardHomeAllocated>) {
            auto it = regions.find(e.region);
            if (it == regions.end() || shards.count(e.shard) > 0) {
                return ShardingResult::AllocationConflict;
            }
            it->second.insert(e.shard);
            shards[e.shard] = e.region;
            return ShardingResult::Success;
        } else if constexpr (std::is_same_v<T, ShardHomeDeallocated>) {
            auto it = shards.find(e.shard);
            if (it == shards.end()) {
                return ShardingResult::ShardNotFound;
            }
            regions[it->second].erase(e.shard);
            in_handoff.erase(e.shard);
            shards.erase(it);
            return ShardingResult::Success;
        } else {
            if (shards.count(e.shard) == 0) {
                return ShardingResult::ShardNotFound;
            }
            in_handoff.insert(e.shard);
            return ShardingResult::Success;
        }
    }, event);
}

namespace {

// ============================================================================
// Record Encoding
// ============================================================================

void write_event(std::ostream& out, const CoordinatorEvent& event) {
    core::write_number(out, event.index());
    std::visit([&out](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ShardRegionRegistered> || std::is_same_v<T, ShardRegionTerminated>) {
            core::write_field(out, e.region);
        } else if constexpr (std::is_same_v<T, ShardHomeAllocated>) {
            core::write_field(out, e.shard);
            core::write_field(out, e.region);
        } else {
            core::write_field(out, e.shard);
        }
    }, event);
}

bool read_event(std::istream& in, CoordinatorEvent& event) {
    UInt64 type = 0;
    std::string first;
    if (!core::read_number(in, type) || !core::read_field(in, first)) {
        return false;
    }

    switch (type) {
        case 0: event = ShardRegionRegistered{first}; return true;
        case 1: event = ShardRegionTerminated{first}; return true;
        case 2: {
            std::string region;
            if (!core::read_field(in, region)) {
                return false;
            }
            event = ShardHomeAllocated{first, region};
            return true;
        }
        case 3: event = ShardHomeDeallocated{first}; return true;
        case 4: event = ShardHandOffStarted{first}; return true;
        default: return false;
    }
}

void write_record(std::ostream& out, const LogRecord& record) {
    core::write_number(out, record.sequence_nr);
    write_event(out, record.event);
    out << '\n';
}

void write_snapshot(std::ostream& out, const CoordinatorSnapshot& snapshot) {
    core::write_number(out, snapshot.sequence_nr);
    core::write_number(out, snapshot.state.regions.size());
    for (const auto& [region, shards] : snapshot.state.regions) {
        core::write_field(out, region);
        core::write_number(out, shards.size());
        for (const auto& shard : shards) {
            core::write_field(out, shard);
        }
    }
    core::write_number(out, snapshot.state.in_handoff.size());
    for (const auto& shard : snapshot.state.in_handoff) {
        core::write_field(out, shard);
    }
    out << '\n';
}

bool read_snapshot(std::istream& in, CoordinatorSnapshot& snapshot) {
    UInt64 region_count = 0;
    if (!core::read_number(in, snapshot.sequence_nr) || !core::read_number(in, region_count)) {
        return false;
    }

    for (UInt64 i = 0; i < region_count; ++i) {
        std::string region;
        UInt64 shard_count = 0;
        if (!core::read_field(in, region) || !core::read_number(in, shard_count)) {
            return false;
        }
        auto& owned = snapshot.state.regions[region];
        for (UInt64 j = 0; j < shard_count; ++j) {
            std::string shard;
            if (!core::read_field(in, shard)) {
                return false;
            }
            owned.insert(shard);
            snapshot.state.shards[shard] = region;
        }
    }

    UInt64 handoff_count = 0;
    if (!core::read_number(in, handoff_count)) {
        return false;
    }
    for (UInt64 i = 0; i < handoff_count; ++i) {
        std::string shard;
        if (!core::read_field(in, shard)) {
            return false;
        }
        snapshot.state.in_handoff.insert(shard);
    }
    return true;
}

// ============================================================================
// Memory Allocation Log
// ============================================================================

class MemoryAllocationLog : public IAllocationLog {
public:
    ShardingResult append(const CoordinatorEvent& event, SequenceNr& sequence_nr) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence_nr = ++highest_;
        records_.push_back(LogRecord{sequence_nr, event});
        return ShardingResult::Success;
    }

    ShardingResult replay_from(SequenceNr after, std::vector<LogRecord>& records) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (record.sequence_nr > after) {
                records.push_back(record);
            }
        }
        return ShardingResult::Success;
    }

    ShardingResult save_snapshot(const CoordinatorSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = snapshot;

        // Records covered by the snapshot are never replayed again
        auto covered = std::find_if(records_.begin(), records_.end(), [&snapshot](const LogRecord& record) {
            return record.sequence_nr > snapshot.sequence_nr;
        });
        records_.erase(records_.begin(), covered);
        return ShardingResult::Success;
    }

    ShardingResult load_snapshot(std::optional<CoordinatorSnapshot>& snapshot) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = snapshot_;
        return ShardingResult::Success;
    }

    SequenceNr highest_sequence_nr() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return highest_;
    }

    SizeT record_count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    std::vector<LogRecord> records_;
    std::optional<CoordinatorSnapshot> snapshot_;
    SequenceNr highest_{0};
    mutable std::mutex mutex_;
};

// ============================================================================
// File Allocation Log
// ============================================================================

/**
 * @brief Journal file of one record per line plus a snapshot file
 *
 * A torn final record (crash during append) is cut off when the log is
 * opened; the append it belonged to never reported success.
 */
class FileAllocationLog : public IAllocationLog {
public:
    explicit FileAllocationLog(std::string journal_path)
        : journal_path_(std::move(journal_path))
        , snapshot_path_(journal_path_ + ".snapshot") {
        open();
    }

    ShardingResult append(const CoordinatorEvent& event, SequenceNr& sequence_nr) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!usable_) {
            return ShardingResult::StorageError;
        }

        std::ofstream out(journal_path_, std::ios::app);
        if (!out.is_open()) {
            return ShardingResult::PersistenceFailure;
        }

        LogRecord record{highest_ + 1, event};
        write_record(out, record);
        out.flush();
        if (!out.good()) {
            return ShardingResult::PersistenceFailure;
        }

        highest_ = record.sequence_nr;
        sequence_nr = highest_;
        return ShardingResult::Success;
    }

    ShardingResult replay_from(SequenceNr after, std::vector<LogRecord>& records) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!usable_) {
            return ShardingResult::StorageError;
        }

        std::vector<LogRecord> all;
        bool torn = false;
        if (!read_journal(all, torn)) {
            return ShardingResult::StorageError;
        }
        for (auto& record : all) {
            if (record.sequence_nr > after) {
                records.push_back(std::move(record));
            }
        }
        return ShardingResult::Success;
    }

    ShardingResult save_snapshot(const CoordinatorSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string tmp_path = snapshot_path_ + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                return ShardingResult::PersistenceFailure;
            }
            write_snapshot(out, snapshot);
            out.flush();
            if (!out.good()) {
                return ShardingResult::PersistenceFailure;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, snapshot_path_, ec);
        if (ec) {
            SPDLOG_ERROR("allocation log: snapshot rename failed: {}", ec.message());
            return ShardingResult::PersistenceFailure;
        }

        compact(snapshot.sequence_nr);
        return ShardingResult::Success;
    }

    ShardingResult load_snapshot(std::optional<CoordinatorSnapshot>& snapshot) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reset();

        if (!std::filesystem::exists(snapshot_path_)) {
            return ShardingResult::Success;
        }

        std::ifstream in(snapshot_path_);
        if (!in.is_open()) {
            return ShardingResult::StorageError;
        }

        CoordinatorSnapshot loaded;
        if (!read_snapshot(in, loaded)) {
            SPDLOG_ERROR("allocation log: snapshot {} is corrupt", snapshot_path_);
            return ShardingResult::StorageError;
        }
        snapshot = std::move(loaded);
        return ShardingResult::Success;
    }

    SequenceNr highest_sequence_nr() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return highest_;
    }

    SizeT record_count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogRecord> records;
        bool torn = false;
        if (!usable_ || !read_journal(records, torn)) {
            return 0;
        }
        return records.size();
    }

private:
    /**
     * @brief Drop journal records already contained in the snapshot
     *
     * A failure leaves the longer journal in place; replay skips the
     * covered records either way.
     */
    void compact(SequenceNr covered) {
        std::vector<LogRecord> records;
        bool torn = false;
        if (!read_journal(records, torn)) {
            SPDLOG_WARN("allocation log: cannot read {} for compaction", journal_path_);
            return;
        }

        std::vector<LogRecord> tail;
        for (auto& record : records) {
            if (record.sequence_nr > covered) {
                tail.push_back(std::move(record));
            }
        }
        if (tail.size() == records.size()) {
            return;
        }
        if (!rewrite_journal(tail)) {
            SPDLOG_WARN("allocation log: compaction of {} failed, keeping full journal", journal_path_);
            return;
        }
        SPDLOG_DEBUG("allocation log: compacted {} records up to {}", records.size() - tail.size(), covered);
    }

    void open() {
        std::filesystem::path parent = std::filesystem::path(journal_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }

        std::vector<LogRecord> records;
        bool torn = false;
        if (!read_journal(records, torn)) {
            SPDLOG_ERROR("allocation log: cannot read journal {}", journal_path_);
            usable_ = false;
            return;
        }

        if (torn) {
            SPDLOG_WARN("allocation log: dropping torn record at end of {}", journal_path_);
            usable_ = rewrite_journal(records);
        }

        highest_ = records.empty() ? 0 : records.back().sequence_nr;

        // A compacted journal may be empty; numbering continues after the snapshot
        if (std::filesystem::exists(snapshot_path_)) {
            std::ifstream in(snapshot_path_);
            CoordinatorSnapshot snapshot;
            if (in.is_open() && read_snapshot(in, snapshot)) {
                highest_ = std::max(highest_, snapshot.sequence_nr);
            }
        }
    }

    bool read_journal(std::vector<LogRecord>& records, bool& torn) const {
        if (!std::filesystem::exists(journal_path_)) {
            return true;
        }

        std::ifstream in(journal_path_);
        if (!in.is_open()) {
            return false;
        }

        for (;;) {
            in >> std::ws;
            if (in.eof()) {
                break;
            }
            LogRecord record;
            if (!core::read_number(in, record.sequence_nr) || !read_event(in, record.event)) {
                torn = true;
                break;
            }
            records.push_back(std::move(record));
        }
        return true;
    }

    bool rewrite_journal(const std::vector<LogRecord>& records) {
        std::string tmp_path = journal_path_ + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                return false;
            }
            for (const auto& record : records) {
                write_record(out, record);
            }
            out.flush();
            if (!out.good()) {
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, journal_path_, ec);
        return !ec;
    }

    std::string journal_path_;
    std::string snapshot_path_;
    SequenceNr highest_{0};
    bool usable_{true};
    mutable std::mutex mutex_;
};

} // anonymous namespace

// ============================================================================
// Factory Functions / Recovery
// ============================================================================

std::shared_ptr<IAllocationLog> create_memory_allocation_log() {
    return std::make_shared<MemoryAllocationLog>();
}

std::shared_ptr<IAllocationLog> create_file_allocation_log(const std::string& journal_path) {
    return std::make_shared<FileAllocationLog>(journal_path);
}

ShardingResult recover_coordinator_state(const IAllocationLog& log,
                                         CoordinatorState& state,
                                         SequenceNr& last_sequence_nr) {
    state = CoordinatorState{};
    last_sequence_nr = 0;

    std::optional<CoordinatorSnapshot> snapshot;
    ShardingResult result = log.load_snapshot(snapshot);
    if (result != ShardingResult::Success) {
        return result;
    }
    if (snapshot) {
        state = snapshot->state;
        last_sequence_nr = snapshot->sequence_nr;
    }

    std::vector<LogRecord> tail;
    result = log.replay_from(last_sequence_nr, tail);
    if (result != ShardingResult::Success) {
        return result;
    }

    for (const auto& record : tail) {
        result = state.apply(record.event);
        if (result != ShardingResult::Success) {
            SPDLOG_ERROR("allocation log: record {} ({}) does not apply: {}",
                         record.sequence_nr, coordinator_event_name(record.event),
                         sharding_result_to_string(result));
            return ShardingResult::AllocationConflict;
        }
        last_sequence_nr = record.sequence_nr;
    }

    return ShardingResult::Success;
}

} // namespace tessera::sharding
