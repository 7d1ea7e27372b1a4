#pragma once

#include "transport.hpp"
#include "enet_common.hpp"

#include <string>

namespace mapsync::transport {

// ============================================================================
// ENetClientTransport - Client-side ENet transport
// ============================================================================

class ENetClientTransport : public IClientTransport {
public:
    explicit ENetClientTransport(std::string name = "enet_client");
    ~ENetClientTransport() override;

    ENetClientTransport(const ENetClientTransport&) = delete;
    ENetClientTransport& operator=(const ENetClientTransport&) = delete;

    // --- Connection ---

    /// Connect to a server.
    /// @param timeoutMs Time to wait for the handshake. With 0 the call only
    ///        initiates the connection and onConnect fires from poll().
    /// @return true if connected (or, with timeoutMs == 0, initiated).
    bool connect(const std::string& host, std::uint16_t port,
                 std::uint32_t timeoutMs = config::kConnectionTimeoutMs);

    /// True between a successful connect() and the connection event.
    bool is_connecting() const { return peer_ != nullptr && !connected_; }

    // --- IClientTransport implementation ---

    void send(std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    bool is_connected() const override;
    void disconnect() override;

    std::uint32_t ping_ms() const;

private:
    void destroy_host();

    std::string name_;
    ENetHost* host_{nullptr};
    ENetPeer* peer_{nullptr};
    bool connected_{false};
};

} // namespace mapsync::transport
