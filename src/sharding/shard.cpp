/**
 * @file shard.cpp
 * @brief Shard state machine implementation
 */

#include "tessera/sharding/shard.h"
#include <spdlog/spdlog.h>
#include <iterator>

namespace tessera::sharding {

Shard::Shard(ShardKey shard_key,
             const config::ShardingSettings& settings,
             std::shared_ptr<IEntityHost> host,
             std::shared_ptr<IRememberEntitiesStore> remember_store,
             std::shared_ptr<core::IClock> clock,
             ShardCallbacks callbacks)
    : shard_key_(std::move(shard_key))
    , settings_(settings)
    , host_(std::move(host))
    , remember_store_(std::move(remember_store))
    , clock_(std::move(clock))
    , callbacks_(std::move(callbacks)) {}

// ============================================================================
// Lifecycle
// ============================================================================

ShardingResult Shard::start() {
    if (state_ != ShardState::Starting) {
        return ShardingResult::AlreadyInitialized;
    }

    if (remember_store_) {
        std::set<EntityKey> remembered;
        ShardingResult result = remember_store_->load(shard_key_, remembered);
        if (result != ShardingResult::Success) {
            SPDLOG_ERROR("shard {}: cannot load remembered entities: {}",
                         shard_key_, sharding_result_to_string(result));
            state_ = ShardState::Stopped;
            return ShardingResult::StorageError;
        }

        remembered_ = std::move(remembered);
        TimePoint now = clock_->now();
        for (const auto& entity : remembered_) {
            result = host_->start_entity(shard_key_, entity);
            if (result != ShardingResult::Success) {
                SPDLOG_WARN("shard {}: remembered entity {} did not start: {}, retry in {} ms",
                            shard_key_, entity, sharding_result_to_string(result),
                            settings_.entity_restart_backoff.count());
                restart_due_[entity] = now + settings_.entity_restart_backoff;
                continue;
            }
            active_[entity].last_activity = now;
        }
    }

    state_ = ShardState::Running;
    SPDLOG_INFO("shard {}: running ({} remembered entities recreated)", shard_key_, active_.size());

    std::deque<ShardEnvelope> buffered;
    buffered.swap(startup_buffer_);
    for (const auto& envelope : buffered) {
        deliver_running(envelope);
    }
    return ShardingResult::Success;
}

void Shard::begin_handoff(const Payload& stop_message) {
    if (state_ == ShardState::HandingOff || state_ == ShardState::Stopped) {
        return;
    }

    for (auto& envelope : startup_buffer_) {
        undelivered_.push_back(std::move(envelope));
    }
    startup_buffer_.clear();

    state_ = ShardState::HandingOff;
    handoff_started_ = clock_->now();
    restart_due_.clear();

    SPDLOG_INFO("shard {}: handing off, stopping {} entities", shard_key_, active_.size());

    std::vector<EntityKey> to_stop;
    for (const auto& [entity, info] : active_) {
        if (passivating_.count(entity) == 0) {
            to_stop.push_back(entity);
        }
    }
    for (const auto& entity : to_stop) {
        host_->stop_entity(shard_key_, entity, stop_message);
    }

    finish_if_drained();
}

void Shard::finish_if_drained() {
    if (state_ != ShardState::HandingOff || !active_.empty()) {
        return;
    }

    for (auto& [entity, buffer] : passivating_) {
        std::move(buffer.begin(), buffer.end(), std::back_inserter(undelivered_));
    }
    passivating_.clear();
    state_ = ShardState::Stopped;
    SPDLOG_INFO("shard {}: stopped", shard_key_);
}

void Shard::force_stop() {
    SPDLOG_WARN("shard {}: {} after {} ms, stopping with {} entities still active",
                shard_key_, sharding_result_to_string(ShardingResult::HandoffTimeout),
                settings_.handoff_timeout.count(), active_.size());

    std::set<EntityKey> remaining = active_entities();
    for (auto& [entity, buffer] : passivating_) {
        remaining.insert(entity);
        std::move(buffer.begin(), buffer.end(), std::back_inserter(undelivered_));
    }
    for (const auto& entity : remaining) {
        host_->kill_entity(shard_key_, entity);
    }
    passivating_.clear();
    active_.clear();
    state_ = ShardState::Stopped;
}

// ============================================================================
// Message Routing
// ============================================================================

ShardingResult Shard::deliver(const ShardEnvelope& envelope) {
    switch (state_) {
        case ShardState::Starting:
            startup_buffer_.push_back(envelope);
            return ShardingResult::Success;
        case ShardState::Running:
            deliver_running(envelope);
            return ShardingResult::Success;
        default:
            return ShardingResult::NotActive;
    }
}

void Shard::deliver_running(const ShardEnvelope& envelope) {
    const EntityKey& entity = envelope.entity_key;

    if (envelope.kind == EnvelopeKind::Passivate) {
        passivate(entity, envelope.payload);
        return;
    }

    auto stopping = passivating_.find(entity);
    if (stopping != passivating_.end()) {
        stopping->second.push_back(envelope);
        return;
    }

    ShardingResult result = ensure_started(entity);
    if (result != ShardingResult::Success) {
        dead_letter(ShardingResult::DeliveryFailed, envelope,
                    std::string("entity start failed: ") + sharding_result_to_string(result));
        return;
    }

    if (envelope.kind == EnvelopeKind::StartEntity) {
        if (callbacks_.start_entity_ack && !envelope.sender.empty()) {
            callbacks_.start_entity_ack(envelope.sender, StartEntityAck{entity, shard_key_});
        }
        return;
    }

    result = host_->deliver(shard_key_, entity, envelope.payload, envelope.sender);
    if (result == ShardingResult::EntityNotFound) {
        // Stopped on its own; hold the message until the termination arrives
        passivating_[entity].push_back(envelope);
        return;
    }
    if (result != ShardingResult::Success) {
        dead_letter(ShardingResult::DeliveryFailed, envelope, sharding_result_to_string(result));
        return;
    }

    active_[entity].last_activity = clock_->now();
}

ShardingResult Shard::ensure_started(const EntityKey& entity) {
    if (active_.count(entity) > 0) {
        return ShardingResult::Success;
    }
    restart_due_.erase(entity);

    // Recorded before the entity can observe anything
    if (remember_store_ && remembered_.count(entity) == 0) {
        ShardingResult stored = remember_store_->add(shard_key_, entity);
        if (stored != ShardingResult::Success) {
            SPDLOG_ERROR("shard {}: cannot remember entity {}: {}",
                         shard_key_, entity, sharding_result_to_string(stored));
            return stored;
        }
        remembered_.insert(entity);
    }

    ShardingResult result = host_->start_entity(shard_key_, entity);
    if (result != ShardingResult::Success) {
        return result;
    }

    active_[entity].last_activity = clock_->now();
    SPDLOG_DEBUG("shard {}: started entity {}", shard_key_, entity);
    return ShardingResult::Success;
}

void Shard::dead_letter(ShardingResult reason, const ShardEnvelope& envelope, const std::string& detail) {
    SPDLOG_WARN("shard {}: dead letter for entity {} ({}): {}",
                shard_key_, envelope.entity_key, sharding_result_to_string(reason), detail);

    if (callbacks_.dead_letter) {
        DeadLetter letter;
        letter.reason = reason;
        letter.shard_key = shard_key_;
        letter.entity_key = envelope.entity_key;
        letter.payload = envelope.payload;
        letter.sender = envelope.sender;
        letter.detail = detail;
        callbacks_.dead_letter(letter);
    }
}

// ============================================================================
// Passivation / Termination
// ============================================================================

void Shard::passivate(const EntityKey& entity, const Payload& stop_message) {
    if (state_ != ShardState::Running) {
        return;
    }
    if (active_.count(entity) == 0 || passivating_.count(entity) > 0) {
        SPDLOG_DEBUG("shard {}: ignoring passivation of {}", shard_key_, entity);
        return;
    }

    passivating_[entity];
    SPDLOG_DEBUG("shard {}: passivating entity {}", shard_key_, entity);
    host_->stop_entity(shard_key_, entity, stop_message);
}

void Shard::entity_terminated(const EntityKey& entity) {
    auto stopping = passivating_.find(entity);
    if (active_.erase(entity) == 0 && stopping == passivating_.end()) {
        SPDLOG_DEBUG("shard {}: termination of unknown entity {} ignored", shard_key_, entity);
        return;
    }

    if (stopping != passivating_.end()) {
        std::deque<ShardEnvelope> buffered = std::move(stopping->second);
        passivating_.erase(stopping);

        if (state_ != ShardState::Running) {
            std::move(buffered.begin(), buffered.end(), std::back_inserter(undelivered_));
        } else if (buffered.empty()) {
            if (remember_store_ && remembered_.erase(entity) > 0) {
                ShardingResult result = remember_store_->remove(shard_key_, entity);
                if (result != ShardingResult::Success) {
                    SPDLOG_ERROR("shard {}: cannot forget passivated entity {}: {}",
                                 shard_key_, entity, sharding_result_to_string(result));
                }
            }
            SPDLOG_DEBUG("shard {}: entity {} passivated", shard_key_, entity);
        } else {
            SPDLOG_DEBUG("shard {}: restarting entity {} for {} buffered messages",
                         shard_key_, entity, buffered.size());
            for (const auto& envelope : buffered) {
                deliver_running(envelope);
            }
        }
    } else if (state_ == ShardState::Running && remember_store_) {
        restart_due_[entity] = clock_->now() + settings_.entity_restart_backoff;
        SPDLOG_INFO("shard {}: entity {} stopped unexpectedly, restart in {} ms",
                    shard_key_, entity, settings_.entity_restart_backoff.count());
    }

    finish_if_drained();
}

// ============================================================================
// Timers
// ============================================================================

void Shard::update() {
    TimePoint now = clock_->now();

    if (state_ == ShardState::Running) {
        // Idle passivation is off when entities are remembered
        if (!remember_store_ && settings_.passivate_idle_entity_after.count() > 0) {
            std::vector<EntityKey> idle;
            for (const auto& [entity, info] : active_) {
                if (passivating_.count(entity) == 0 &&
                    core::elapsed_between(info.last_activity, now) >= settings_.passivate_idle_entity_after) {
                    idle.push_back(entity);
                }
            }
            for (const auto& entity : idle) {
                SPDLOG_DEBUG("shard {}: entity {} idle", shard_key_, entity);
                passivate(entity, Payload{});
            }
        }

        std::vector<EntityKey> due;
        for (const auto& [entity, at] : restart_due_) {
            if (at <= now) {
                due.push_back(entity);
            }
        }
        for (const auto& entity : due) {
            restart_due_.erase(entity);
            if (active_.count(entity) > 0) {
                continue;
            }
            ShardingResult result = host_->start_entity(shard_key_, entity);
            if (result != ShardingResult::Success) {
                SPDLOG_ERROR("shard {}: restart of entity {} failed: {}, retry in {} ms",
                             shard_key_, entity, sharding_result_to_string(result),
                             settings_.entity_restart_backoff.count());
                restart_due_[entity] = now + settings_.entity_restart_backoff;
                continue;
            }
            active_[entity].last_activity = now;
            SPDLOG_INFO("shard {}: restarted entity {}", shard_key_, entity);
        }
    }

    if (state_ == ShardState::HandingOff &&
        core::elapsed_between(handoff_started_, now) >= settings_.handoff_timeout) {
        force_stop();
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<ShardEnvelope> Shard::take_undelivered() {
    std::vector<ShardEnvelope> result;
    result.swap(undelivered_);
    return result;
}

std::set<EntityKey> Shard::active_entities() const {
    std::set<EntityKey> result;
    for (const auto& [entity, info] : active_) {
        result.insert(entity);
    }
    return result;
}

bool Shard::is_passivating(const EntityKey& entity) const {
    return passivating_.count(entity) > 0;
}

SizeT Shard::buffered_count() const {
    SizeT count = startup_buffer_.size();
    for (const auto& [entity, buffer] : passivating_) {
        count += buffer.size();
    }
    return count;
}

} // namespace tessera::sharding
