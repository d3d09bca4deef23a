/**
 * @file transport.cpp
 * @brief In-process transport implementation
 */

#include "tessera/sharding/transport.h"
#include <spdlog/spdlog.h>
#include <deque>
#include <mutex>
#include <set>
#include <unordered_map>

namespace tessera::sharding {

namespace {

struct QueuedMessage {
    Address from;
    Address to;
    ClusterMessage message;
};

} // anonymous namespace

struct LocalTransport::Impl {
    std::unordered_map<Address, IMessageHandler*> endpoints;
    std::set<Address> unreachable;
    std::deque<QueuedMessage> queue;
    TransportTap tap;
    UInt64 dropped{0};
    mutable std::mutex mutex;

    bool can_reach(const Address& from, const Address& to) const {
        return endpoints.count(to) > 0 && unreachable.count(to) == 0 && unreachable.count(from) == 0;
    }
};

LocalTransport::LocalTransport() : impl_(std::make_unique<Impl>()) {}
LocalTransport::~LocalTransport() = default;

ShardingResult LocalTransport::send(const Address& from, const Address& to, ClusterMessage message) {
    TransportTap tap;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->can_reach(from, to)) {
            SPDLOG_DEBUG("transport: {} -> {} refused ({})", from, to, message_type_name(message));
            return ShardingResult::RegionUnreachable;
        }
        tap = impl_->tap;
        impl_->queue.push_back(QueuedMessage{from, to, message});
    }

    if (tap) {
        tap(from, to, message);
    }
    return ShardingResult::Success;
}

void LocalTransport::register_endpoint(const Address& address, IMessageHandler* handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->endpoints[address] = handler;
}

void LocalTransport::unregister_endpoint(const Address& address) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->endpoints.erase(address);
}

void LocalTransport::set_reachable(const Address& address, bool reachable) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (reachable) {
        impl_->unreachable.erase(address);
    } else {
        impl_->unreachable.insert(address);
    }
}

bool LocalTransport::is_reachable(const Address& address) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->unreachable.count(address) == 0;
}

SizeT LocalTransport::deliver_pending(SizeT max_messages) {
    SizeT delivered = 0;

    while (delivered < max_messages) {
        QueuedMessage next;
        IMessageHandler* handler = nullptr;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->queue.empty()) {
                break;
            }
            next = std::move(impl_->queue.front());
            impl_->queue.pop_front();

            if (!impl_->can_reach(next.from, next.to)) {
                ++impl_->dropped;
                SPDLOG_DEBUG("transport: dropped {} -> {} ({})",
                             next.from, next.to, message_type_name(next.message));
                continue;
            }
            handler = impl_->endpoints[next.to];
        }

        if (handler != nullptr) {
            handler->receive(next.from, next.message);
            ++delivered;
        }
    }

    return delivered;
}

SizeT LocalTransport::run_until_idle(SizeT max_messages) {
    SizeT delivered = 0;
    while (delivered < max_messages && pending_count() > 0) {
        delivered += deliver_pending(max_messages - delivered);
    }
    return delivered;
}

SizeT LocalTransport::pending_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

UInt64 LocalTransport::dropped_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->dropped;
}

void LocalTransport::set_tap(TransportTap tap) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->tap = std::move(tap);
}

std::unique_ptr<LocalTransport> create_local_transport() {
    return std::make_unique<LocalTransport>();
}

} // namespace tessera::sharding
