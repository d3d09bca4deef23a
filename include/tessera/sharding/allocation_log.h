#pragma once
/**
 * @file allocation_log.h
 * @brief Coordinator events, state and the durable allocation log
 *
 * The coordinator's shard -> region table is event sourced. Every change is
 * an event appended to an IAllocationLog before it is acted upon; the table
 * is rebuilt after a restart from the latest snapshot plus the events that
 * follow it.
 */

#include "tessera/sharding/allocation_strategy.h"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tessera::sharding {

// ============================================================================
// Coordinator Events
// ============================================================================

struct ShardRegionRegistered {
    RegionId region;
};

struct ShardRegionTerminated {
    RegionId region;
};

struct ShardHomeAllocated {
    ShardKey shard;
    RegionId region;
};

struct ShardHomeDeallocated {
    ShardKey shard;
};

/// Rebalance of a shard began; the owner will be asked to hand it off
struct ShardHandOffStarted {
    ShardKey shard;
};

using CoordinatorEvent = std::variant<
    ShardRegionRegistered,
    ShardRegionTerminated,
    ShardHomeAllocated,
    ShardHomeDeallocated,
    ShardHandOffStarted>;

/**
 * @brief Event name, for logging
 */
const char* coordinator_event_name(const CoordinatorEvent& event);

// ============================================================================
// Coordinator State
// ============================================================================

/**
 * @brief Persistent part of the coordinator's state
 */
struct CoordinatorState {
    std::map<RegionId, std::set<ShardKey>> regions; ///< Registered regions and their shards
    ShardAllocationMap shards;                      ///< Shard -> owner
    std::set<ShardKey> in_handoff;                  ///< Allocated shards being rebalanced

    /**
     * @brief Apply one event
     * @return Success, or an error if the event contradicts the state
     *         (the state is left unchanged in that case)
     */
    ShardingResult apply(const CoordinatorEvent& event);

    bool operator==(const CoordinatorState& other) const {
        return regions == other.regions && shards == other.shards && in_handoff == other.in_handoff;
    }
    bool operator!=(const CoordinatorState& other) const { return !(*this == other); }
};

/**
 * @brief Journal entry
 */
struct LogRecord {
    SequenceNr sequence_nr{0};
    CoordinatorEvent event;
};

/**
 * @brief Full state as of a sequence number
 */
struct CoordinatorSnapshot {
    SequenceNr sequence_nr{0};
    CoordinatorState state;
};

// ============================================================================
// Allocation Log Interface
// ============================================================================

/**
 * @brief Append-only durable log of coordinator events
 *
 * An append that returns Success is durable. Implementations are used by
 * one coordinator instance at a time.
 */
class IAllocationLog {
public:
    virtual ~IAllocationLog() = default;

    /**
     * @brief Append an event
     * @param event Event to persist
     * @param sequence_nr Receives the assigned sequence number
     * @return Success or PersistenceFailure/StorageError
     */
    virtual ShardingResult append(const CoordinatorEvent& event, SequenceNr& sequence_nr) = 0;

    /**
     * @brief Read every record with sequence number > after, in order
     */
    virtual ShardingResult replay_from(SequenceNr after, std::vector<LogRecord>& records) const = 0;

    /**
     * @brief Persist a snapshot (replaces any previous one)
     *
     * Records up to the snapshot's sequence number may be discarded
     * afterwards; sequence numbers keep increasing from the highest one.
     */
    virtual ShardingResult save_snapshot(const CoordinatorSnapshot& snapshot) = 0;

    /**
     * @brief Load the latest snapshot, if any
     */
    virtual ShardingResult load_snapshot(std::optional<CoordinatorSnapshot>& snapshot) const = 0;

    /**
     * @brief Highest sequence number appended so far (0 if empty)
     */
    virtual SequenceNr highest_sequence_nr() const = 0;

    /**
     * @brief Number of journal records currently kept
     */
    virtual SizeT record_count() const = 0;
};

/**
 * @brief Create an in-memory log (survives coordinator restarts, not process restarts)
 */
std::shared_ptr<IAllocationLog> create_memory_allocation_log();

/**
 * @brief Create a file-backed log
 * @param journal_path Journal file; the snapshot lives beside it with a ".snapshot" suffix
 */
std::shared_ptr<IAllocationLog> create_file_allocation_log(const std::string& journal_path);

/**
 * @brief Rebuild state from a log: latest snapshot plus tail
 * @param log Log to read
 * @param state Receives the rebuilt state
 * @param last_sequence_nr Receives the sequence number of the last applied record
 */
ShardingResult recover_coordinator_state(const IAllocationLog& log,
                                         CoordinatorState& state,
                                         SequenceNr& last_sequence_nr);

} // namespace tessera::sharding
