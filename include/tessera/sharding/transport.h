#pragma once
/**
 * @file transport.h
 * @brief Point-to-point message transport between sharding endpoints
 *
 * The sharding layer never holds references to remote state machines; it
 * only knows addresses. ITransport is the collaborator that moves a
 * ClusterMessage from one address to another. LocalTransport is the
 * in-process implementation used by tests and the demo.
 */

#include "tessera/sharding/protocol.h"
#include <functional>
#include <memory>

namespace tessera::sharding {

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Receiver side of the transport
 */
class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;

    /**
     * @brief Handle one message
     * @param from Sender address
     * @param message Message
     */
    virtual void receive(const Address& from, const ClusterMessage& message) = 0;
};

/**
 * @brief Sender side of the transport
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Send a message
     * @return Success if accepted for delivery, RegionUnreachable if the
     *         destination is unknown or unreachable
     */
    virtual ShardingResult send(const Address& from, const Address& to, ClusterMessage message) = 0;
};

// ============================================================================
// Local Transport
// ============================================================================

/// Observes every message accepted by a LocalTransport
using TransportTap = std::function<void(const Address& from, const Address& to, const ClusterMessage&)>;

/**
 * @brief In-process transport with an explicit delivery pump
 *
 * Messages are queued in a single FIFO and delivered only when
 * deliver_pending() or run_until_idle() is called, outside the internal
 * lock, so handlers may send from within receive(). Handlers are not
 * owned and must outlive their registration.
 */
class LocalTransport : public ITransport {
public:
    LocalTransport();
    ~LocalTransport() override;

    LocalTransport(const LocalTransport&) = delete;
    LocalTransport& operator=(const LocalTransport&) = delete;

    ShardingResult send(const Address& from, const Address& to, ClusterMessage message) override;

    /**
     * @brief Attach a handler to an address (replaces any previous one)
     */
    void register_endpoint(const Address& address, IMessageHandler* handler);

    /**
     * @brief Detach an address; queued messages to it are dropped on delivery
     */
    void unregister_endpoint(const Address& address);

    /**
     * @brief Simulate a network partition of one endpoint
     *
     * Messages to or from an unreachable endpoint are refused by send()
     * and dropped if already queued.
     */
    void set_reachable(const Address& address, bool reachable);

    bool is_reachable(const Address& address) const;

    /**
     * @brief Deliver up to max_messages queued messages
     * @return Number of messages handed to a handler
     */
    SizeT deliver_pending(SizeT max_messages = static_cast<SizeT>(-1));

    /**
     * @brief Deliver until the queue is empty
     * @param max_messages Safety bound against message storms
     * @return Number of messages handed to a handler
     */
    SizeT run_until_idle(SizeT max_messages = 1000000);

    SizeT pending_count() const;
    UInt64 dropped_count() const;

    /**
     * @brief Install an observer for accepted messages
     */
    void set_tap(TransportTap tap);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create an in-process transport
 */
std::unique_ptr<LocalTransport> create_local_transport();

} // namespace tessera::sharding
