/**
 * @file entity_host.cpp
 * @brief In-process entity host
 */

#include "tessera/sharding/entity_host.h"
#include <spdlog/spdlog.h>
#include <map>
#include <mutex>
#include <utility>

namespace tessera::sharding {

namespace {

class LocalEntityContext : public IEntityContext {
public:
    LocalEntityContext(ShardKey shard, EntityKey entity, Address region, ITransport& transport)
        : shard_(std::move(shard))
        , entity_(std::move(entity))
        , region_(std::move(region))
        , transport_(transport) {}

    const ShardKey& shard_key() const override { return shard_; }
    const EntityKey& entity_key() const override { return entity_; }

    void reply(const Address& to, Payload message) override {
        ShardingResult result = transport_.send(region_, to, UserMessage{std::move(message), region_});
        if (result != ShardingResult::Success) {
            SPDLOG_WARN("entity {}/{}: reply to {} failed: {}", shard_, entity_, to,
                        sharding_result_to_string(result));
        }
    }

    void passivate(Payload stop_message) override {
        SystemControl control;
        control.kind = ControlKind::Passivate;
        control.entity_key = entity_;
        control.shard_key = shard_;
        control.stop_message = std::move(stop_message);
        control.sender = region_;

        ShardingResult result = transport_.send(region_, region_, control);
        if (result != ShardingResult::Success) {
            SPDLOG_ERROR("entity {}/{}: passivation request lost: {}", shard_, entity_,
                         sharding_result_to_string(result));
        }
    }

    void stop() override { stop_requested_ = true; }

    bool stop_requested() const { return stop_requested_; }

private:
    ShardKey shard_;
    EntityKey entity_;
    Address region_;
    ITransport& transport_;
    bool stop_requested_{false};
};

struct EntitySlot {
    std::unique_ptr<IEntity> entity;
    std::unique_ptr<LocalEntityContext> context;
};

} // anonymous namespace

struct LocalEntityHost::Impl {
    Address region_address;
    std::shared_ptr<ITransport> transport;
    EntityFactory factory;
    std::map<std::pair<ShardKey, EntityKey>, EntitySlot> entities;
    mutable std::mutex mutex;

    void notify_terminated(const ShardKey& shard, const EntityKey& entity) {
        ShardingResult result = transport->send(region_address, region_address, EntityTerminated{shard, entity});
        if (result != ShardingResult::Success) {
            SPDLOG_ERROR("entity host {}: termination of {}/{} not reported: {}", region_address, shard, entity,
                         sharding_result_to_string(result));
        }
    }

    void reap_if_stopped(std::map<std::pair<ShardKey, EntityKey>, EntitySlot>::iterator it) {
        if (!it->second.context->stop_requested()) {
            return;
        }
        auto key = it->first;
        entities.erase(it);
        notify_terminated(key.first, key.second);
    }
};

LocalEntityHost::LocalEntityHost(Address region_address, std::shared_ptr<ITransport> transport, EntityFactory factory)
    : impl_(std::make_unique<Impl>()) {
    impl_->region_address = std::move(region_address);
    impl_->transport = std::move(transport);
    impl_->factory = std::move(factory);
}

LocalEntityHost::~LocalEntityHost() = default;

ShardingResult LocalEntityHost::start_entity(const ShardKey& shard, const EntityKey& entity) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto key = std::make_pair(shard, entity);
    if (impl_->entities.count(key) > 0) {
        return ShardingResult::Success;
    }

    auto instance = impl_->factory ? impl_->factory(shard, entity) : nullptr;
    if (!instance) {
        return ShardingResult::InvalidEntityKey;
    }

    EntitySlot slot;
    slot.entity = std::move(instance);
    slot.context = std::make_unique<LocalEntityContext>(shard, entity, impl_->region_address, *impl_->transport);

    auto it = impl_->entities.emplace(key, std::move(slot)).first;
    it->second.entity->on_start(*it->second.context);
    impl_->reap_if_stopped(it);
    return ShardingResult::Success;
}

ShardingResult LocalEntityHost::deliver(const ShardKey& shard, const EntityKey& entity,
                                        const Payload& message, const Address& sender) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->entities.find(std::make_pair(shard, entity));
    if (it == impl_->entities.end()) {
        return ShardingResult::EntityNotFound;
    }

    it->second.entity->on_message(*it->second.context, message, sender);
    impl_->reap_if_stopped(it);
    return ShardingResult::Success;
}

void LocalEntityHost::stop_entity(const ShardKey& shard, const EntityKey& entity, const Payload& stop_message) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->entities.find(std::make_pair(shard, entity));
    if (it != impl_->entities.end()) {
        it->second.entity->on_stop(*it->second.context, stop_message);
        impl_->entities.erase(it);
    }
    impl_->notify_terminated(shard, entity);
}

void LocalEntityHost::kill_entity(const ShardKey& shard, const EntityKey& entity) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->entities.erase(std::make_pair(shard, entity)) > 0) {
        SPDLOG_WARN("entity host {}: killed {}/{}", impl_->region_address, shard, entity);
    }
}

SizeT LocalEntityHost::entity_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entities.size();
}

bool LocalEntityHost::is_running(const ShardKey& shard, const EntityKey& entity) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entities.count(std::make_pair(shard, entity)) > 0;
}

std::shared_ptr<LocalEntityHost> create_local_entity_host(const Address& region_address,
                                                          std::shared_ptr<ITransport> transport,
                                                          EntityFactory factory) {
    return std::make_shared<LocalEntityHost>(region_address, std::move(transport), std::move(factory));
}

} // namespace tessera::sharding
