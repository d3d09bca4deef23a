/**
 * @file shard_region.cpp
 * @brief Region routing, location cache and local shard management
 */

#include "tessera/sharding/shard_region.h"
#include <spdlog/spdlog.h>
#include <deque>
#include <map>
#include <mutex>
#include <type_traits>

namespace tessera::sharding {

namespace {

/**
 * @brief A shard whose owner is not (or no longer) known
 */
struct PendingShard {
    std::deque<ShardEnvelope> buffer;
    bool requested{false};                  ///< GetShardHome outstanding
    TimePoint requested_at{};
    std::set<CorrelationId> correlations;   ///< requests sent while unresolved, oldest dropped first
    std::optional<TimePoint> start_retry_at; ///< local start failed, retry then
};

constexpr SizeT MAX_TRACKED_CORRELATIONS = 16;

void emit_dead_letters(const DeadLetterCallback& callback, const std::vector<DeadLetter>& letters) {
    if (!callback) {
        return;
    }
    for (const auto& letter : letters) {
        callback(letter);
    }
}

} // anonymous namespace

// ============================================================================
// ShardRegion::Impl
// ============================================================================

struct ShardRegion::Impl {
    config::ShardingSettings settings;
    ShardRegionOptions options;
    std::shared_ptr<ITransport> transport;

    RegionState state{RegionState::Idle};
    TimePoint last_register_attempt{};
    TimePoint last_shutdown_request{};
    TimePoint last_stats_report{};

    std::map<ShardKey, RegionId> region_by_shard;
    std::map<ShardKey, PendingShard> pending;
    std::map<ShardKey, std::unique_ptr<Shard>> shards;
    CorrelationId next_correlation{1};
    SizeT buffered_total{0};

    UInt64 delivered_local{0};
    UInt64 forwarded{0};
    UInt64 shard_home_requests{0};
    UInt64 dead_letters{0};

    DeadLetterCallback dead_letter_callback;
    std::vector<DeadLetter> pending_dead_letters;

    mutable std::mutex mutex;

    const RegionId& self() const { return options.address; }
    TimePoint now() const { return options.clock->now(); }

    // ------------------------------------------------------------------------
    // Outbound
    // ------------------------------------------------------------------------

    ShardingResult send(const Address& to, ClusterMessage message) {
        const char* name = message_type_name(message);
        ShardingResult result = transport->send(self(), to, std::move(message));
        if (result != ShardingResult::Success) {
            SPDLOG_DEBUG("region {}: {} to {} failed: {}", self(), name, to, sharding_result_to_string(result));
        }
        return result;
    }

    void send_registration() {
        last_register_attempt = now();
        if (options.proxy) {
            send(settings.coordinator_address, RegisterProxy{self()});
        } else {
            send(settings.coordinator_address, Register{self()});
        }
    }

    void dead_letter(ShardingResult reason, const ShardEnvelope& envelope, const std::string& detail) {
        DeadLetter letter;
        letter.reason = reason;
        letter.shard_key = envelope.shard_key;
        letter.entity_key = envelope.entity_key;
        letter.payload = envelope.payload;
        letter.sender = envelope.sender;
        letter.detail = detail;
        record_dead_letter(letter);
    }

    void record_dead_letter(const DeadLetter& letter) {
        ++dead_letters;
        SPDLOG_WARN("region {}: dead letter {} for {}/{}: {}", self(),
                    sharding_result_to_string(letter.reason), letter.shard_key, letter.entity_key, letter.detail);
        pending_dead_letters.push_back(letter);
    }

    // ------------------------------------------------------------------------
    // Routing
    // ------------------------------------------------------------------------

    void route(ShardEnvelope envelope) {
        const ShardKey shard = envelope.shard_key;

        auto known = region_by_shard.find(shard);
        if (known != region_by_shard.end()) {
            if (known->second != self()) {
                forward(std::move(envelope), known->second);
                return;
            }

            auto local = shards.find(shard);
            if (local != shards.end() && local->second->deliver(envelope) == ShardingResult::Success) {
                ++delivered_local;
                return;
            }
            region_by_shard.erase(known);
        }

        // A local shard that is still stopping re-resolves once it is gone
        auto local = shards.find(shard);
        bool stopping_locally = local != shards.end() && local->second->state() == ShardState::HandingOff;
        buffer(std::move(envelope), !stopping_locally);
    }

    void forward(ShardEnvelope envelope, const RegionId& owner) {
        ShardingResult result = send(owner, envelope);
        if (result == ShardingResult::Success) {
            ++forwarded;
            return;
        }

        SPDLOG_WARN("region {}: shard {} owner {} {}, re-resolving", self(), envelope.shard_key, owner,
                    sharding_result_to_string(result));
        auto known = region_by_shard.find(envelope.shard_key);
        if (known != region_by_shard.end() && known->second == owner) {
            region_by_shard.erase(known);
        }

        ++envelope.delivery_attempts;
        if (envelope.delivery_attempts >= settings.max_delivery_attempts) {
            dead_letter(ShardingResult::DeliveryFailed, envelope,
                        "owner " + owner + " unreachable after " +
                        std::to_string(envelope.delivery_attempts) + " attempts");
            return;
        }
        buffer(std::move(envelope), true);
    }

    void buffer(ShardEnvelope envelope, bool request) {
        if (buffered_total >= settings.buffer_size) {
            dead_letter(ShardingResult::BufferOverflow, envelope,
                        "region buffer full (" + std::to_string(settings.buffer_size) + ")");
            return;
        }

        const ShardKey shard = envelope.shard_key;
        pending[shard].buffer.push_back(std::move(envelope));
        ++buffered_total;

        if (request) {
            request_shard_home(shard);
        }
    }

    void request_shard_home(const ShardKey& shard) {
        if (state == RegionState::Idle || state == RegionState::Registering) {
            return;
        }

        auto& entry = pending[shard];
        if (entry.requested || entry.start_retry_at) {
            return;
        }

        CorrelationId correlation = next_correlation++;
        entry.requested = true;
        entry.requested_at = now();
        entry.correlations.insert(correlation);
        if (entry.correlations.size() > MAX_TRACKED_CORRELATIONS) {
            entry.correlations.erase(entry.correlations.begin());
        }
        ++shard_home_requests;

        SPDLOG_DEBUG("region {}: GetShardHome {} (correlation {})", self(), shard, correlation);
        send(settings.coordinator_address, GetShardHome{shard, self(), correlation});
    }

    void flush_pending(const ShardKey& shard) {
        auto it = pending.find(shard);
        if (it == pending.end()) {
            return;
        }

        std::deque<ShardEnvelope> buffered = std::move(it->second.buffer);
        buffered_total -= buffered.size();
        pending.erase(it);

        if (!buffered.empty()) {
            SPDLOG_DEBUG("region {}: flushing {} messages for shard {}", self(), buffered.size(), shard);
        }
        for (auto& envelope : buffered) {
            route(std::move(envelope));
        }
    }

    // ------------------------------------------------------------------------
    // Local Shards
    // ------------------------------------------------------------------------

    void start_local_shard(const ShardKey& shard) {
        ShardCallbacks callbacks;
        callbacks.start_entity_ack = [this](const Address& to, const StartEntityAck& ack) {
            send(to, ack);
        };
        callbacks.dead_letter = [this](const DeadLetter& letter) {
            record_dead_letter(letter);
        };

        auto instance = std::make_unique<Shard>(shard, settings, options.entity_host,
                                                options.remember_store, options.clock, std::move(callbacks));
        ShardingResult result = instance->start();
        if (result != ShardingResult::Success) {
            SPDLOG_ERROR("region {}: shard {} failed to start ({}), retry in {} ms", self(), shard,
                         sharding_result_to_string(result), settings.shard_failure_backoff.count());
            auto& entry = pending[shard];
            entry.requested = false;
            entry.start_retry_at = now() + settings.shard_failure_backoff;
            return;
        }

        shards[shard] = std::move(instance);
        region_by_shard[shard] = self();
        SPDLOG_INFO("region {}: hosting shard {}", self(), shard);

        send(settings.coordinator_address, ShardStarted{shard, self()});
        flush_pending(shard);
    }

    void begin_local_handoff(const ShardKey& shard) {
        auto local = shards.find(shard);
        if (local == shards.end()) {
            return;
        }
        local->second->begin_handoff(options.handoff_stop_message);
        check_shard(shard);
    }

    /**
     * @brief Remove a local shard that reached Stopped
     */
    void check_shard(const ShardKey& shard) {
        auto local = shards.find(shard);
        if (local == shards.end() || !local->second->is_stopped()) {
            return;
        }

        std::vector<ShardEnvelope> undelivered = local->second->take_undelivered();
        shards.erase(local);
        auto known = region_by_shard.find(shard);
        if (known != region_by_shard.end() && known->second == self()) {
            region_by_shard.erase(known);
        }

        SPDLOG_INFO("region {}: shard {} stopped, {} messages to re-route", self(), shard, undelivered.size());
        send(settings.coordinator_address, ShardStopped{shard, self()});

        // Held by the shard before anything the region buffered afterwards
        if (!undelivered.empty()) {
            auto& entry = pending[shard];
            buffered_total += undelivered.size();
            entry.buffer.insert(entry.buffer.begin(),
                                std::make_move_iterator(undelivered.begin()),
                                std::make_move_iterator(undelivered.end()));
        }

        auto waiting = pending.find(shard);
        if (waiting != pending.end() && !waiting->second.buffer.empty()) {
            auto owner = region_by_shard.find(shard);
            if (owner != region_by_shard.end()) {
                flush_pending(shard);
            } else {
                request_shard_home(shard);
            }
        }

        check_shutdown_complete();
    }

    void check_shutdown_complete() {
        if (state == RegionState::ShuttingDown && shards.empty() && buffered_total == 0) {
            state = RegionState::Stopped;
            SPDLOG_INFO("region {}: graceful shutdown complete", self());
        }
    }

    // ------------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------------

    /**
     * @brief Route a message from outside the region
     * @return false if the extractor could not partition it
     */
    bool handle_inbound(const InboundMessage& message) {
        auto envelope = resolve_inbound(message, *options.extractor);
        if (!envelope) {
            ShardEnvelope unresolved;
            std::visit([&unresolved](const auto& msg) {
                using T = std::decay_t<decltype(msg)>;
                if constexpr (std::is_same_v<T, EntityMessage>) {
                    unresolved.payload = msg.payload;
                } else if constexpr (std::is_same_v<T, ShardEnvelope>) {
                    unresolved = msg;
                } else {
                    unresolved.entity_key = msg.entity_key;
                }
                unresolved.sender = msg.sender;
            }, message);
            dead_letter(ShardingResult::UnknownPartition, unresolved, "extractor could not partition message");
            return false;
        }

        if (envelope->kind == EnvelopeKind::Passivate) {
            auto local = shards.find(envelope->shard_key);
            if (local != shards.end()) {
                local->second->passivate(envelope->entity_key, envelope->payload);
                check_shard(envelope->shard_key);
            }
            return true;
        }

        route(std::move(*envelope));
        return true;
    }

    void handle_shard_home(const ShardHome& home) {
        SPDLOG_DEBUG("region {}: shard {} is at {}", self(), home.shard, home.region);

        auto pending_it = pending.find(home.shard);
        if (pending_it != pending.end()) {
            if (home.correlation != INVALID_CORRELATION_ID &&
                pending_it->second.correlations.count(home.correlation) == 0) {
                SPDLOG_DEBUG("region {}: ignoring ShardHome {} with unknown correlation {}",
                             self(), home.shard, home.correlation);
                return;
            }
            pending_it->second.requested = false;
        }

        auto local = shards.find(home.shard);

        if (home.region == self()) {
            if (options.proxy) {
                SPDLOG_ERROR("region {}: proxy was allocated shard {}", self(), home.shard);
                return;
            }
            if (local == shards.end()) {
                start_local_shard(home.shard);
                return;
            }
            if (local->second->state() != ShardState::Running) {
                // Previous incarnation still stopping; re-resolved when it is gone
                return;
            }
            region_by_shard[home.shard] = self();
            flush_pending(home.shard);
            return;
        }

        if (local != shards.end() && !local->second->is_stopped() &&
            local->second->state() != ShardState::HandingOff) {
            SPDLOG_WARN("region {}: shard {} is owned by {}, handing off local copy",
                        self(), home.shard, home.region);
            region_by_shard[home.shard] = home.region;
            begin_local_handoff(home.shard);
        }

        region_by_shard[home.shard] = home.region;
        flush_pending(home.shard);
    }

    void handle_host_shard(const HostShard& host) {
        if (options.proxy) {
            return;
        }
        auto local = shards.find(host.shard);
        if (local == shards.end()) {
            start_local_shard(host.shard);
            return;
        }
        if (local->second->state() == ShardState::Running) {
            send(settings.coordinator_address, ShardStarted{host.shard, self()});
        }
    }

    void invalidate_region(const RegionId& region) {
        if (region == self()) {
            return;
        }
        SizeT removed = 0;
        for (auto it = region_by_shard.begin(); it != region_by_shard.end();) {
            if (it->second == region) {
                it = region_by_shard.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            SPDLOG_INFO("region {}: dropped {} cached locations of {}", self(), removed, region);
        }
    }

    void receive(const Address& from, const ClusterMessage& message) {
        std::visit([this, &from](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;

            if constexpr (std::is_same_v<T, EntityMessage> || std::is_same_v<T, ShardEnvelope> ||
                          std::is_same_v<T, SystemControl>) {
                handle_inbound(InboundMessage{msg});
            } else if constexpr (std::is_same_v<T, RegisterAck>) {
                if (state == RegionState::Registering) {
                    state = RegionState::Active;
                    SPDLOG_INFO("region {}: registered with {}", self(), from);
                    std::vector<ShardKey> waiting;
                    for (const auto& [shard, entry] : pending) {
                        waiting.push_back(shard);
                    }
                    for (const auto& shard : waiting) {
                        request_shard_home(shard);
                    }
                }
            } else if constexpr (std::is_same_v<T, ShardHome>) {
                handle_shard_home(msg);
            } else if constexpr (std::is_same_v<T, HostShard>) {
                handle_host_shard(msg);
            } else if constexpr (std::is_same_v<T, BeginHandOff>) {
                SPDLOG_DEBUG("region {}: BeginHandOff {}", self(), msg.shard);
                region_by_shard.erase(msg.shard);
                send(from, BeginHandOffAck{msg.shard, self()});
            } else if constexpr (std::is_same_v<T, HandOff>) {
                SPDLOG_INFO("region {}: HandOff {}", self(), msg.shard);
                region_by_shard.erase(msg.shard);
                if (shards.count(msg.shard) == 0) {
                    send(from, ShardStopped{msg.shard, self()});
                } else {
                    begin_local_handoff(msg.shard);
                }
            } else if constexpr (std::is_same_v<T, EntityTerminated>) {
                auto local = shards.find(msg.shard);
                if (local != shards.end()) {
                    local->second->entity_terminated(msg.entity);
                    check_shard(msg.shard);
                }
            } else if constexpr (std::is_same_v<T, RegionRemoved> || std::is_same_v<T, RegionUnreachable>) {
                invalidate_region(msg.region);
            } else if constexpr (std::is_same_v<T, RegionUp>) {
                SPDLOG_DEBUG("region {}: {} is up", self(), msg.region);
            } else {
                SPDLOG_DEBUG("region {}: ignoring {} from {}", self(), message_type_name(ClusterMessage{msg}), from);
            }
        }, message);
    }

    // ------------------------------------------------------------------------
    // Timers
    // ------------------------------------------------------------------------

    void update() {
        TimePoint current = now();

        if (state == RegionState::Registering &&
            core::elapsed_between(last_register_attempt, current) >= settings.retry_interval) {
            send_registration();
        }

        std::vector<ShardKey> local_keys;
        for (const auto& [shard, instance] : shards) {
            local_keys.push_back(shard);
        }
        for (const auto& shard : local_keys) {
            auto local = shards.find(shard);
            if (local != shards.end()) {
                local->second->update();
                check_shard(shard);
            }
        }

        std::vector<ShardKey> retry;
        for (auto& [shard, entry] : pending) {
            if (entry.start_retry_at && *entry.start_retry_at <= current) {
                entry.start_retry_at.reset();
                retry.push_back(shard);
            } else if (entry.requested &&
                       core::elapsed_between(entry.requested_at, current) >= settings.retry_interval) {
                entry.requested = false;
                retry.push_back(shard);
            }
        }
        for (const auto& shard : retry) {
            request_shard_home(shard);
        }

        if (state == RegionState::ShuttingDown) {
            if (!shards.empty() &&
                core::elapsed_between(last_shutdown_request, current) >= settings.retry_interval) {
                last_shutdown_request = current;
                send(settings.coordinator_address, GracefulShutdownReq{self()});
            }
            check_shutdown_complete();
        }

        if (!options.proxy && (state == RegionState::Active || state == RegionState::ShuttingDown) &&
            settings.stats_report_interval.count() > 0 &&
            core::elapsed_between(last_stats_report, current) >= settings.stats_report_interval) {
            last_stats_report = current;
            ShardSizesReport report{self(), {}};
            for (const auto& [shard, instance] : shards) {
                if (instance->state() == ShardState::Running) {
                    report.sizes[shard] = static_cast<UInt32>(instance->entity_count());
                }
            }
            send(settings.coordinator_address, std::move(report));
        }
    }
};

// ============================================================================
// ShardRegion Implementation
// ============================================================================

ShardRegion::ShardRegion(const config::ShardingSettings& settings,
                         ShardRegionOptions options,
                         std::shared_ptr<ITransport> transport)
    : impl_(std::make_unique<Impl>()) {
    impl_->settings = settings;
    impl_->options = std::move(options);
    impl_->transport = std::move(transport);
    if (!impl_->options.clock) {
        impl_->options.clock = core::create_steady_clock();
    }
}

ShardRegion::~ShardRegion() = default;
ShardRegion::ShardRegion(ShardRegion&&) noexcept = default;
ShardRegion& ShardRegion::operator=(ShardRegion&&) noexcept = default;

ShardingResult ShardRegion::start() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->state != RegionState::Idle) {
        return ShardingResult::AlreadyInitialized;
    }
    if (impl_->options.address.empty() || !impl_->transport || !impl_->options.extractor ||
        (!impl_->options.proxy && !impl_->options.entity_host)) {
        SPDLOG_ERROR("region: incomplete options for '{}'", impl_->options.address);
        return ShardingResult::InvalidConfiguration;
    }

    impl_->state = RegionState::Registering;
    impl_->last_stats_report = impl_->now();
    SPDLOG_INFO("region {}: starting ({})", impl_->self(), impl_->options.proxy ? "proxy" : "host");
    impl_->send_registration();
    return ShardingResult::Success;
}

ShardingResult ShardRegion::graceful_shutdown() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    switch (impl_->state) {
        case RegionState::Idle:
            return ShardingResult::NotInitialized;
        case RegionState::ShuttingDown:
        case RegionState::Stopped:
            return ShardingResult::Success;
        default:
            break;
    }

    SPDLOG_INFO("region {}: graceful shutdown with {} shards", impl_->self(), impl_->shards.size());
    impl_->state = RegionState::ShuttingDown;
    impl_->last_shutdown_request = impl_->now();
    impl_->send(impl_->settings.coordinator_address, GracefulShutdownReq{impl_->self()});
    impl_->check_shutdown_complete();
    return ShardingResult::Success;
}

void ShardRegion::update() {
    std::vector<DeadLetter> letters;
    DeadLetterCallback callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->update();
        letters.swap(impl_->pending_dead_letters);
        callback = impl_->dead_letter_callback;
    }
    emit_dead_letters(callback, letters);
}

ShardingResult ShardRegion::tell(Payload message, const Address& sender) {
    std::vector<DeadLetter> letters;
    DeadLetterCallback callback;
    ShardingResult result = ShardingResult::Success;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->handle_inbound(InboundMessage{EntityMessage{std::move(message), sender}})) {
            result = ShardingResult::UnknownPartition;
        }
        letters.swap(impl_->pending_dead_letters);
        callback = impl_->dead_letter_callback;
    }
    emit_dead_letters(callback, letters);
    return result;
}

ShardingResult ShardRegion::start_entity(const EntityKey& entity, const Address& sender) {
    if (entity.empty()) {
        return ShardingResult::InvalidEntityKey;
    }

    std::vector<DeadLetter> letters;
    DeadLetterCallback callback;
    ShardingResult result = ShardingResult::Success;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        SystemControl control;
        control.kind = ControlKind::StartEntity;
        control.entity_key = entity;
        control.sender = sender;
        if (!impl_->handle_inbound(InboundMessage{control})) {
            result = ShardingResult::UnknownPartition;
        }
        letters.swap(impl_->pending_dead_letters);
        callback = impl_->dead_letter_callback;
    }
    emit_dead_letters(callback, letters);
    return result;
}

void ShardRegion::receive(const Address& from, const ClusterMessage& message) {
    std::vector<DeadLetter> letters;
    DeadLetterCallback callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state == RegionState::Idle) {
            SPDLOG_DEBUG("region {}: not started, dropping {}", impl_->self(), message_type_name(message));
            return;
        }
        impl_->receive(from, message);
        letters.swap(impl_->pending_dead_letters);
        callback = impl_->dead_letter_callback;
    }
    emit_dead_letters(callback, letters);
}

void ShardRegion::set_dead_letter_callback(DeadLetterCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->dead_letter_callback = std::move(callback);
}

// ============================================================================
// Queries
// ============================================================================

const RegionId& ShardRegion::address() const noexcept {
    return impl_->options.address;
}

bool ShardRegion::is_proxy() const noexcept {
    return impl_->options.proxy;
}

RegionState ShardRegion::get_state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

std::vector<ShardKey> ShardRegion::get_hosted_shards() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<ShardKey> result;
    result.reserve(impl_->shards.size());
    for (const auto& [shard, instance] : impl_->shards) {
        result.push_back(shard);
    }
    return result;
}

std::optional<ShardState> ShardRegion::get_shard_state(const ShardKey& shard) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->shards.find(shard);
    if (it == impl_->shards.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

std::set<EntityKey> ShardRegion::get_shard_entities(const ShardKey& shard) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->shards.find(shard);
    if (it == impl_->shards.end()) {
        return {};
    }
    return it->second->active_entities();
}

std::optional<RegionId> ShardRegion::get_cached_location(const ShardKey& shard) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->region_by_shard.find(shard);
    if (it == impl_->region_by_shard.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ShardRegion::is_resolving(const ShardKey& shard) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->pending.find(shard);
    return it != impl_->pending.end() && it->second.requested;
}

RegionStats ShardRegion::get_stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    RegionStats stats;
    stats.hosted_shards = static_cast<UInt32>(impl_->shards.size());
    SizeT buffered = impl_->buffered_total;
    for (const auto& [shard, instance] : impl_->shards) {
        stats.active_entities += static_cast<UInt32>(instance->entity_count());
        buffered += instance->buffered_count();
    }
    stats.buffered_messages = static_cast<UInt32>(buffered);
    stats.cached_locations = static_cast<UInt32>(impl_->region_by_shard.size());
    stats.delivered_local = impl_->delivered_local;
    stats.forwarded = impl_->forwarded;
    stats.shard_home_requests = impl_->shard_home_requests;
    stats.dead_letters = impl_->dead_letters;
    return stats;
}

std::unique_ptr<ShardRegion> create_shard_region(const config::ShardingSettings& settings,
                                                 ShardRegionOptions options,
                                                 std::shared_ptr<ITransport> transport) {
    return std::make_unique<ShardRegion>(settings, std::move(options), std::move(transport));
}

} // namespace tessera::sharding
