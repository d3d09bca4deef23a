/**
 * @file shard_coordinator.cpp
 * @brief Coordinator state machine implementation
 */

#include "tessera/sharding/shard_coordinator.h"
#include <spdlog/spdlog.h>
#include <map>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace tessera::sharding {

namespace {

/**
 * @brief A shard moving away from its owner
 */
struct RebalanceInProgress {
    RegionId owner;
    bool awaiting_stopped{false};       ///< false: waiting for BeginHandOffAcks
    std::set<RegionId> awaiting_acks;
    TimePoint phase_started{};
};

struct AwaitingStart {
    RegionId owner;
    TimePoint sent_at{};
};

struct FatalError {
    ShardingResult result{ShardingResult::Success};
    std::string detail;
};

} // anonymous namespace

// ============================================================================
// ShardCoordinator::Impl
// ============================================================================

struct ShardCoordinator::Impl {
    config::ShardingSettings settings;
    Address address;
    std::shared_ptr<ITransport> transport;
    std::shared_ptr<IAllocationLog> log;
    std::shared_ptr<IShardAllocationStrategy> strategy;
    std::shared_ptr<core::IClock> clock;

    CoordinatorStatus status{CoordinatorStatus::WaitingForState};
    CoordinatorState state;
    SequenceNr last_sequence_nr{0};
    UInt32 events_since_snapshot{0};

    std::set<RegionId> proxies;
    std::set<RegionId> shutting_down;
    std::set<RegionId> unreachable;
    ShardSizeMap shard_sizes;

    std::map<ShardKey, RebalanceInProgress> rebalancing;
    std::map<ShardKey, std::map<RegionId, CorrelationId>> deferred_requests;
    std::map<ShardKey, AwaitingStart> awaiting_start;
    std::vector<std::pair<Address, ClusterMessage>> stash;
    TimePoint last_rebalance{};

    CoordinatorStats counters;

    FatalErrorCallback fatal_callback;
    std::optional<FatalError> fatal;

    mutable std::mutex mutex;

    TimePoint now() const { return clock->now(); }
    bool active() const { return status == CoordinatorStatus::Active; }

    void send(const Address& to, ClusterMessage message) {
        const char* name = message_type_name(message);
        ShardingResult result = transport->send(address, to, std::move(message));
        if (result != ShardingResult::Success) {
            SPDLOG_DEBUG("coordinator: {} to {} failed: {}", name, to, sharding_result_to_string(result));
        }
    }

    void fail(ShardingResult result, const std::string& detail) {
        if (status == CoordinatorStatus::Stopped) {
            return;
        }
        status = CoordinatorStatus::Stopped;
        SPDLOG_CRITICAL("coordinator {}: {}: {}", address, sharding_result_to_string(result), detail);
        fatal = FatalError{result, detail};
    }

    // ------------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------------

    /**
     * @brief Validate, append, then apply an event
     * @return false if the coordinator had to stop
     */
    bool persist(const CoordinatorEvent& event) {
        CoordinatorState next = state;
        ShardingResult result = next.apply(event);
        if (result != ShardingResult::Success) {
            fail(ShardingResult::AllocationConflict,
                 std::string(coordinator_event_name(event)) + " rejected: " + sharding_result_to_string(result));
            return false;
        }

        SequenceNr sequence_nr = 0;
        result = log->append(event, sequence_nr);
        if (result != ShardingResult::Success) {
            fail(ShardingResult::PersistenceFailure,
                 std::string("cannot persist ") + coordinator_event_name(event) + ": " +
                 sharding_result_to_string(result));
            return false;
        }

        state = std::move(next);
        last_sequence_nr = sequence_nr;
        ++counters.events_persisted;
        ++events_since_snapshot;

        if (settings.snapshot_after > 0 && events_since_snapshot >= settings.snapshot_after) {
            result = log->save_snapshot(CoordinatorSnapshot{last_sequence_nr, state});
            if (result == ShardingResult::Success) {
                events_since_snapshot = 0;
                ++counters.snapshots_saved;
                SPDLOG_DEBUG("coordinator: snapshot at {}", last_sequence_nr);
            } else {
                SPDLOG_ERROR("coordinator: snapshot at {} failed: {}", last_sequence_nr,
                             sharding_result_to_string(result));
            }
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Allocation
    // ------------------------------------------------------------------------

    std::set<RegionId> allocation_candidates() const {
        std::set<RegionId> candidates;
        for (const auto& [region, shards] : state.regions) {
            if (shutting_down.count(region) == 0 && unreachable.count(region) == 0) {
                candidates.insert(region);
            }
        }
        return candidates;
    }

    void handle_get_shard_home(const ShardKey& shard, const RegionId& requester, CorrelationId correlation) {
        if (shard.empty() || requester.empty()) {
            return;
        }

        if (rebalancing.count(shard) > 0) {
            SPDLOG_DEBUG("coordinator: GetShardHome {} from {} deferred, shard is moving", shard, requester);
            deferred_requests[shard][requester] = correlation;
            return;
        }

        auto owner = state.shards.find(shard);
        if (owner != state.shards.end()) {
            send(requester, ShardHome{shard, owner->second, correlation});
            return;
        }

        std::set<RegionId> candidates = allocation_candidates();
        if (candidates.empty()) {
            SPDLOG_WARN("coordinator: no region can host shard {} yet", shard);
            return;
        }

        auto chosen = strategy->allocate_shard(shard, requester, candidates, state.shards);
        if (!chosen || candidates.count(*chosen) == 0) {
            SPDLOG_ERROR("coordinator: allocation strategy gave no eligible region for shard {}", shard);
            return;
        }

        if (!persist(ShardHomeAllocated{shard, *chosen})) {
            return;
        }
        ++counters.allocations;
        SPDLOG_INFO("coordinator: shard {} allocated to {}", shard, *chosen);

        awaiting_start[shard] = AwaitingStart{*chosen, now()};
        if (*chosen != requester) {
            send(*chosen, HostShard{shard});
        }
        send(requester, ShardHome{shard, *chosen, correlation});
    }

    void handle_register(const RegionId& region) {
        if (state.regions.count(region) == 0) {
            if (!persist(ShardRegionRegistered{region})) {
                return;
            }
            SPDLOG_INFO("coordinator: region {} registered", region);
        }
        shutting_down.erase(region);
        unreachable.erase(region);
        send(region, RegisterAck{address});
    }

    void handle_shard_started(const ShardStarted& started) {
        auto owner = state.shards.find(started.shard);
        if (owner == state.shards.end()) {
            SPDLOG_DEBUG("coordinator: ShardStarted for unallocated shard {}", started.shard);
            return;
        }
        if (owner->second == started.region) {
            awaiting_start.erase(started.shard);
            return;
        }

        SPDLOG_WARN("coordinator: shard {} started on {} but is owned by {}",
                    started.shard, started.region, owner->second);
        send(started.region, ShardHome{started.shard, owner->second, INVALID_CORRELATION_ID});
    }

    // ------------------------------------------------------------------------
    // Rebalance / Handoff
    // ------------------------------------------------------------------------

    void start_handoff(const ShardKey& shard) {
        if (rebalancing.count(shard) > 0) {
            return;
        }
        auto owner = state.shards.find(shard);
        if (owner == state.shards.end()) {
            return;
        }
        RegionId current_owner = owner->second;

        if (!persist(ShardHandOffStarted{shard})) {
            return;
        }
        awaiting_start.erase(shard);

        RebalanceInProgress progress;
        progress.owner = current_owner;
        progress.phase_started = now();

        std::set<RegionId> recipients = proxies;
        for (const auto& [region, shards] : state.regions) {
            recipients.insert(region);
        }
        for (const auto& region : recipients) {
            if (unreachable.count(region) > 0) {
                continue;
            }
            if (transport->send(address, region, BeginHandOff{shard}) == ShardingResult::Success) {
                progress.awaiting_acks.insert(region);
            }
        }

        SPDLOG_INFO("coordinator: moving shard {} away from {} ({} acks expected)",
                    shard, current_owner, progress.awaiting_acks.size());
        bool no_acks = progress.awaiting_acks.empty();
        rebalancing[shard] = std::move(progress);
        if (no_acks) {
            send_handoff(shard);
        }
    }

    void send_handoff(const ShardKey& shard) {
        auto it = rebalancing.find(shard);
        if (it == rebalancing.end() || it->second.awaiting_stopped) {
            return;
        }
        it->second.awaiting_stopped = true;
        it->second.awaiting_acks.clear();
        it->second.phase_started = now();
        SPDLOG_DEBUG("coordinator: HandOff {} to {}", shard, it->second.owner);
        send(it->second.owner, HandOff{shard});
    }

    /**
     * @brief Stop the previous owner of a shard whose handoff a crash cut short
     *
     * The shard is already unallocated. Requests for it stay deferred until
     * the owner reports ShardStopped or the handoff timeout passes.
     */
    void resume_interrupted_handoff(const ShardKey& shard, const RegionId& owner) {
        RebalanceInProgress progress;
        progress.owner = owner;
        progress.awaiting_stopped = true;
        progress.phase_started = now();
        rebalancing[shard] = std::move(progress);
    }

    void complete_rebalance(const ShardKey& shard, bool timed_out) {
        auto it = rebalancing.find(shard);
        if (it == rebalancing.end()) {
            return;
        }
        RegionId previous_owner = it->second.owner;

        if (timed_out) {
            ++counters.handoff_timeouts;
            SPDLOG_WARN("coordinator: {} for shard {} on {}, reallocating anyway",
                        sharding_result_to_string(ShardingResult::HandoffTimeout), shard, previous_owner);
        }

        if (state.shards.count(shard) > 0 && !persist(ShardHomeDeallocated{shard})) {
            return;
        }

        rebalancing.erase(shard);
        awaiting_start.erase(shard);
        shard_sizes.erase(shard);
        ++counters.rebalances_completed;
        SPDLOG_INFO("coordinator: shard {} released by {}", shard, previous_owner);

        auto deferred = deferred_requests.find(shard);
        if (deferred == deferred_requests.end()) {
            return;
        }
        std::map<RegionId, CorrelationId> requests = std::move(deferred->second);
        deferred_requests.erase(deferred);
        for (const auto& [requester, correlation] : requests) {
            if (!active()) {
                return;
            }
            handle_get_shard_home(shard, requester, correlation);
        }
    }

    void drop_ack(const RegionId& region) {
        std::vector<ShardKey> ready;
        for (auto& [shard, progress] : rebalancing) {
            if (!progress.awaiting_stopped && progress.awaiting_acks.erase(region) > 0 &&
                progress.awaiting_acks.empty()) {
                ready.push_back(shard);
            }
        }
        for (const auto& shard : ready) {
            send_handoff(shard);
        }
    }

    ShardingResult rebalance_tick() {
        if (!active()) {
            return ShardingResult::NotActive;
        }
        last_rebalance = now();

        std::set<ShardKey> in_progress;
        for (const auto& [shard, progress] : rebalancing) {
            in_progress.insert(shard);
        }

        std::set<ShardKey> to_move = strategy->rebalance_shards(state.shards, allocation_candidates(),
                                                                shard_sizes, in_progress);
        for (const auto& shard : to_move) {
            if (!active()) {
                break;
            }
            start_handoff(shard);
        }
        return active() ? ShardingResult::Success : ShardingResult::PersistenceFailure;
    }

    // ------------------------------------------------------------------------
    // Membership
    // ------------------------------------------------------------------------

    void handle_graceful_shutdown(const RegionId& region) {
        auto it = state.regions.find(region);
        if (it == state.regions.end()) {
            SPDLOG_DEBUG("coordinator: GracefulShutdownReq from unknown region {}", region);
            return;
        }
        if (shutting_down.insert(region).second) {
            SPDLOG_INFO("coordinator: region {} shutting down, moving {} shards", region, it->second.size());
        }

        std::set<ShardKey> owned = it->second;
        for (const auto& shard : owned) {
            if (!active()) {
                return;
            }
            start_handoff(shard);
        }
    }

    void handle_region_removed(const RegionId& region) {
        proxies.erase(region);

        std::vector<ShardKey> orphaned_moves;
        auto it = state.regions.find(region);
        if (it != state.regions.end()) {
            std::set<ShardKey> owned = it->second;
            if (!persist(ShardRegionTerminated{region})) {
                return;
            }
            SPDLOG_INFO("coordinator: region {} removed, {} shards unallocated", region, owned.size());

            for (const auto& shard : owned) {
                awaiting_start.erase(shard);
                shard_sizes.erase(shard);
            }
        }
        for (const auto& [shard, progress] : rebalancing) {
            if (progress.owner == region) {
                orphaned_moves.push_back(shard);
            }
        }

        shutting_down.erase(region);
        unreachable.erase(region);
        for (auto& [shard, requests] : deferred_requests) {
            requests.erase(region);
        }

        for (const auto& shard : orphaned_moves) {
            complete_rebalance(shard, false);
        }
        drop_ack(region);
    }

    // ------------------------------------------------------------------------
    // Dispatch
    // ------------------------------------------------------------------------

    void handle(const Address& from, const ClusterMessage& message) {
        std::visit([this, &from](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;

            if constexpr (std::is_same_v<T, Register>) {
                handle_register(msg.region);
            } else if constexpr (std::is_same_v<T, RegisterProxy>) {
                if (proxies.insert(msg.region).second) {
                    SPDLOG_INFO("coordinator: proxy {} registered", msg.region);
                }
                send(msg.region, RegisterAck{address});
            } else if constexpr (std::is_same_v<T, GetShardHome>) {
                handle_get_shard_home(msg.shard, msg.requester, msg.correlation);
            } else if constexpr (std::is_same_v<T, ShardStarted>) {
                handle_shard_started(msg);
            } else if constexpr (std::is_same_v<T, BeginHandOffAck>) {
                auto it = rebalancing.find(msg.shard);
                if (it != rebalancing.end() && !it->second.awaiting_stopped) {
                    it->second.awaiting_acks.erase(msg.region);
                    if (it->second.awaiting_acks.empty()) {
                        send_handoff(msg.shard);
                    }
                }
            } else if constexpr (std::is_same_v<T, ShardStopped>) {
                auto it = rebalancing.find(msg.shard);
                if (it != rebalancing.end() && it->second.owner == msg.region) {
                    complete_rebalance(msg.shard, false);
                }
            } else if constexpr (std::is_same_v<T, GracefulShutdownReq>) {
                handle_graceful_shutdown(msg.region);
            } else if constexpr (std::is_same_v<T, ShardSizesReport>) {
                for (const auto& [shard, size] : msg.sizes) {
                    auto owner = state.shards.find(shard);
                    if (owner != state.shards.end() && owner->second == msg.region) {
                        shard_sizes[shard] = size;
                    }
                }
            } else if constexpr (std::is_same_v<T, RegionUp>) {
                unreachable.erase(msg.region);
            } else if constexpr (std::is_same_v<T, RegionUnreachable>) {
                if (unreachable.insert(msg.region).second) {
                    SPDLOG_WARN("coordinator: region {} unreachable", msg.region);
                }
                drop_ack(msg.region);
            } else if constexpr (std::is_same_v<T, RegionRemoved>) {
                handle_region_removed(msg.region);
            } else {
                SPDLOG_DEBUG("coordinator: ignoring {} from {}", message_type_name(ClusterMessage{msg}), from);
            }
        }, message);
    }

    void update() {
        if (!active()) {
            return;
        }
        TimePoint current = now();

        if (settings.rebalance_interval.count() > 0 &&
            core::elapsed_between(last_rebalance, current) >= settings.rebalance_interval) {
            rebalance_tick();
        }

        std::vector<ShardKey> ack_timeouts;
        std::vector<ShardKey> stop_timeouts;
        for (const auto& [shard, progress] : rebalancing) {
            if (core::elapsed_between(progress.phase_started, current) < settings.handoff_timeout) {
                continue;
            }
            if (progress.awaiting_stopped) {
                stop_timeouts.push_back(shard);
            } else {
                ack_timeouts.push_back(shard);
            }
        }
        for (const auto& shard : ack_timeouts) {
            SPDLOG_WARN("coordinator: BeginHandOffAck for shard {} timed out", shard);
            send_handoff(shard);
        }
        for (const auto& shard : stop_timeouts) {
            if (!active()) {
                return;
            }
            complete_rebalance(shard, true);
        }

        for (auto& [shard, waiting] : awaiting_start) {
            if (core::elapsed_between(waiting.sent_at, current) >= settings.shard_start_timeout &&
                unreachable.count(waiting.owner) == 0) {
                SPDLOG_DEBUG("coordinator: shard {} not started on {}, resending HostShard", shard, waiting.owner);
                waiting.sent_at = current;
                send(waiting.owner, HostShard{shard});
            }
        }
    }

    std::optional<FatalError> take_fatal() {
        std::optional<FatalError> result;
        result.swap(fatal);
        return result;
    }
};

namespace {

void emit_fatal(const FatalErrorCallback& callback, const std::optional<FatalError>& fatal) {
    if (callback && fatal) {
        callback(fatal->result, fatal->detail);
    }
}

} // anonymous namespace

// ============================================================================
// ShardCoordinator Implementation
// ============================================================================

ShardCoordinator::ShardCoordinator(const config::ShardingSettings& settings,
                                   Address address,
                                   std::shared_ptr<ITransport> transport,
                                   std::shared_ptr<IAllocationLog> log,
                                   std::shared_ptr<IShardAllocationStrategy> strategy,
                                   std::shared_ptr<core::IClock> clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->settings = settings;
    impl_->address = std::move(address);
    impl_->transport = std::move(transport);
    impl_->log = std::move(log);
    impl_->strategy = strategy ? std::move(strategy)
                               : std::shared_ptr<IShardAllocationStrategy>(create_least_shard_strategy(
                                     settings.rebalance_threshold, settings.max_simultaneous_rebalance));
    impl_->clock = clock ? std::move(clock) : core::create_steady_clock();
}

ShardCoordinator::~ShardCoordinator() = default;
ShardCoordinator::ShardCoordinator(ShardCoordinator&&) noexcept = default;
ShardCoordinator& ShardCoordinator::operator=(ShardCoordinator&&) noexcept = default;

ShardingResult ShardCoordinator::start() {
    std::optional<FatalError> fatal;
    FatalErrorCallback callback;
    ShardingResult result = ShardingResult::Success;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        if (impl_->status != CoordinatorStatus::WaitingForState) {
            return ShardingResult::AlreadyInitialized;
        }
        if (!impl_->transport || !impl_->log) {
            return ShardingResult::InvalidConfiguration;
        }

        result = recover_coordinator_state(*impl_->log, impl_->state, impl_->last_sequence_nr);
        if (result != ShardingResult::Success) {
            impl_->fail(result == ShardingResult::AllocationConflict ? result : ShardingResult::PersistenceFailure,
                        std::string("recovery failed: ") + sharding_result_to_string(result));
        } else {
            SPDLOG_INFO("coordinator {}: recovered {} regions, {} shards up to sequence {}",
                        impl_->address, impl_->state.regions.size(), impl_->state.shards.size(),
                        impl_->last_sequence_nr);

            std::set<ShardKey> interrupted = impl_->state.in_handoff;
            for (const auto& shard : interrupted) {
                auto owner = impl_->state.shards.find(shard);
                if (owner == impl_->state.shards.end()) {
                    continue;
                }
                RegionId previous_owner = owner->second;
                SPDLOG_WARN("coordinator {}: shard {} was being handed off from {}, deallocating",
                            impl_->address, shard, previous_owner);

                // The owner may never have received HandOff
                impl_->send(previous_owner, HandOff{shard});
                if (!impl_->persist(ShardHomeDeallocated{shard})) {
                    result = ShardingResult::PersistenceFailure;
                    break;
                }
                impl_->resume_interrupted_handoff(shard, previous_owner);
            }
        }

        if (impl_->status == CoordinatorStatus::WaitingForState) {
            impl_->status = CoordinatorStatus::Active;
            impl_->last_rebalance = impl_->now();

            auto stashed = std::move(impl_->stash);
            impl_->stash.clear();
            for (const auto& [from, message] : stashed) {
                if (!impl_->active()) {
                    break;
                }
                impl_->handle(from, message);
            }
        }

        fatal = impl_->take_fatal();
        callback = impl_->fatal_callback;
    }
    emit_fatal(callback, fatal);
    return result;
}

void ShardCoordinator::stop() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->status != CoordinatorStatus::Stopped) {
        impl_->status = CoordinatorStatus::Stopped;
        SPDLOG_INFO("coordinator {}: stopped", impl_->address);
    }
}

void ShardCoordinator::update() {
    std::optional<FatalError> fatal;
    FatalErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->update();
        fatal = impl_->take_fatal();
        callback = impl_->fatal_callback;
    }
    emit_fatal(callback, fatal);
}

ShardingResult ShardCoordinator::rebalance_tick() {
    std::optional<FatalError> fatal;
    FatalErrorCallback callback;
    ShardingResult result;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        result = impl_->rebalance_tick();
        fatal = impl_->take_fatal();
        callback = impl_->fatal_callback;
    }
    emit_fatal(callback, fatal);
    return result;
}

void ShardCoordinator::receive(const Address& from, const ClusterMessage& message) {
    std::optional<FatalError> fatal;
    FatalErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        switch (impl_->status) {
            case CoordinatorStatus::WaitingForState:
                if (impl_->stash.size() < impl_->settings.buffer_size) {
                    impl_->stash.emplace_back(from, message);
                } else {
                    SPDLOG_WARN("coordinator {}: stash full, dropping {} from {}",
                                impl_->address, message_type_name(message), from);
                }
                return;
            case CoordinatorStatus::Stopped:
                SPDLOG_DEBUG("coordinator {}: stopped, dropping {}", impl_->address, message_type_name(message));
                return;
            default:
                break;
        }
        impl_->handle(from, message);
        fatal = impl_->take_fatal();
        callback = impl_->fatal_callback;
    }
    emit_fatal(callback, fatal);
}

void ShardCoordinator::set_fatal_error_callback(FatalErrorCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->fatal_callback = std::move(callback);
}

// ============================================================================
// Queries
// ============================================================================

const Address& ShardCoordinator::address() const noexcept {
    return impl_->address;
}

CoordinatorStatus ShardCoordinator::get_status() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->status;
}

ShardAllocationMap ShardCoordinator::get_current_allocations() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state.shards;
}

std::optional<RegionId> ShardCoordinator::get_shard_home(const ShardKey& shard) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->state.shards.find(shard);
    if (it == impl_->state.shards.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::set<RegionId> ShardCoordinator::get_regions() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::set<RegionId> result;
    for (const auto& [region, shards] : impl_->state.regions) {
        result.insert(region);
    }
    return result;
}

std::set<ShardKey> ShardCoordinator::get_rebalance_in_progress() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::set<ShardKey> result;
    for (const auto& [shard, progress] : impl_->rebalancing) {
        result.insert(shard);
    }
    return result;
}

CoordinatorStats ShardCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    CoordinatorStats stats = impl_->counters;
    stats.regions = static_cast<UInt32>(impl_->state.regions.size());
    stats.proxies = static_cast<UInt32>(impl_->proxies.size());
    stats.allocated_shards = static_cast<UInt32>(impl_->state.shards.size());
    stats.rebalances_in_progress = static_cast<UInt32>(impl_->rebalancing.size());
    UInt32 pending = 0;
    for (const auto& [shard, requests] : impl_->deferred_requests) {
        pending += static_cast<UInt32>(requests.size());
    }
    stats.pending_requests = pending;
    return stats;
}

std::unique_ptr<ShardCoordinator> create_shard_coordinator(const config::ShardingSettings& settings,
                                                           const Address& address,
                                                           std::shared_ptr<ITransport> transport,
                                                           std::shared_ptr<IAllocationLog> log,
                                                           std::shared_ptr<core::IClock> clock) {
    return std::make_unique<ShardCoordinator>(settings, address, std::move(transport), std::move(log),
                                              nullptr, std::move(clock));
}

} // namespace tessera::sharding
