#pragma once

// =============================================================================
// Transport - Byte pipes under the gameplay and bulk connections
//
// A client holds two IClientTransports, a server two IServerTransports: one
// pair carries gameplay messages, the other map chunks. Both sides only see
// whole, reliably ordered messages; framing and retransmission are the
// implementation's business (LocalTransport in-process, ENet on the wire).
// =============================================================================

#include <mapsync/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

namespace mapsync::transport {

/// One received message. Only valid for the duration of the callback.
using ByteView = std::span<const std::uint8_t>;

/// Events fire from inside poll(), on the polling thread.
using PeerEvent = std::function<void()>;
using PeerMessage = std::function<void(ByteView data)>;

using ClientEvent = std::function<void(ClientId id)>;
using ClientMessage = std::function<void(ClientId id, ByteView data)>;

// --- Client side ---

class IClientTransport {
public:
    virtual ~IClientTransport() = default;

    /// Queues one message for the server. Dropped once the connection is closed.
    virtual void send(ByteView data) = 0;

    /// Delivers pending connect, receive and disconnect events, in order.
    virtual void poll(std::uint32_t timeoutMs = 0) = 0;

    virtual bool is_connected() const = 0;

    /// Closes the connection; onDisconnect fires if it was open.
    virtual void disconnect() = 0;

    PeerMessage onReceive;
    PeerEvent onConnect;
    PeerEvent onDisconnect;
};

// --- Server side ---

class IServerTransport {
public:
    virtual ~IServerTransport() = default;

    /// Queues one message for a client. Never blocks; unknown ids are ignored.
    virtual void send(ClientId id, ByteView data) = 0;

    virtual void broadcast(ByteView data) = 0;

    virtual void poll(std::uint32_t timeoutMs = 0) = 0;

    virtual void disconnect(ClientId id) = 0;

    /// Bytes passed to send() for this client that it has not consumed yet.
    /// Transfer workers stop sending while this is above their threshold.
    virtual std::size_t write_buffer_size(ClientId id) const = 0;

    ClientMessage onReceive;
    ClientEvent onClientConnect;
    ClientEvent onClientDisconnect;
};

} // namespace mapsync::transport
