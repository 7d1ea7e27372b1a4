#pragma once

#include "transport.hpp"
#include "enet_common.hpp"
#include "send_backlog.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mapsync::transport {

// ============================================================================
// ENetServerTransport - Server-side ENet transport
// ============================================================================

/// One instance per channel: the gameplay and bulk transports listen on
/// separate ports so bulk traffic never queues behind gameplay traffic.
class ENetServerTransport : public IServerTransport {
public:
    explicit ENetServerTransport(std::string name = "enet_server");
    ~ENetServerTransport() override;

    ENetServerTransport(const ENetServerTransport&) = delete;
    ENetServerTransport& operator=(const ENetServerTransport&) = delete;

    // --- Server control ---

    /// Start listening on the specified port.
    /// @return true if server started successfully.
    bool start(std::uint16_t port = config::kDefaultGameplayPort,
               std::size_t maxClients = config::kDefaultMaxClients);

    /// Stop the server and disconnect all clients.
    void stop();

    bool is_running() const { return running_; }

    // --- IServerTransport implementation ---

    void send(ClientId id, std::span<const std::uint8_t> data) override;
    void broadcast(std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    void disconnect(ClientId id) override;
    std::size_t write_buffer_size(ClientId id) const override;

private:
    ClientId next_client_id();
    ClientId find_client_id(ENetPeer* peer);
    void send_to(ClientId id, ENetPeer* peer, std::span<const std::uint8_t> data);

    std::string name_;
    ENetHost* host_{nullptr};
    bool running_{false};

    ClientId nextClientId_{1};
    std::unordered_map<ClientId, ENetPeer*> clients_;
    std::unordered_map<ENetPeer*, ClientId> peerToClient_;

    // Released by each packet's free callback, once ENet has the ack or drops it.
    std::unordered_map<ClientId, SendBacklog> backlog_;
};

} // namespace mapsync::transport
