#include "enet_client.hpp"

#include <mapsync/core/logger.hpp>

#include <enet/enet.h>

namespace mapsync::transport {

ENetClientTransport::ENetClientTransport(std::string name)
    : name_(std::move(name))
{
}

ENetClientTransport::~ENetClientTransport() {
    disconnect();
}

bool ENetClientTransport::connect(const std::string& host, std::uint16_t port,
                                  std::uint32_t timeoutMs) {
    if (connected_ || peer_) {
        logf(LogLevel::Warning, name_.c_str(), "already connected");
        return false;
    }

    // A host left over from a server-side disconnect.
    destroy_host();

    host_ = enet_host_create(
        nullptr,  // No address - we're a client
        1,        // Only one outgoing connection
        config::kChannelCount,
        0,        // Unlimited incoming bandwidth
        0         // Unlimited outgoing bandwidth
    );

    if (!host_) {
        logf(LogLevel::Error, name_.c_str(), "enet_host_create failed");
        return false;
    }

    enet_host_compress_with_range_coder(host_);

    ENetAddress address;
    address.port = port;

    int result = enet_address_set_host_ip(&address, host.c_str());
    if (result < 0) {
        result = enet_address_set_host(&address, host.c_str());
    }

    if (result < 0) {
        logf(LogLevel::Error, name_.c_str(), "failed to resolve host: %s", host.c_str());
        destroy_host();
        return false;
    }

    logf(LogLevel::Info, name_.c_str(), "connecting to %s:%u...", host.c_str(), port);

    peer_ = enet_host_connect(host_, &address, config::kChannelCount, 0);
    if (!peer_) {
        logf(LogLevel::Error, name_.c_str(), "enet_host_connect failed");
        destroy_host();
        return false;
    }

    if (timeoutMs == 0) {
        return true;
    }

    ENetEvent event;
    if (enet_host_service(host_, &event, timeoutMs) > 0 &&
        event.type == ENET_EVENT_TYPE_CONNECT) {
        connected_ = true;
        logf(LogLevel::Info, name_.c_str(), "connected, ping=%ums", peer_->roundTripTime);
        if (onConnect) {
            onConnect();
        }
        return true;
    }

    logf(LogLevel::Warning, name_.c_str(), "connection timed out");
    enet_peer_reset(peer_);
    peer_ = nullptr;
    destroy_host();
    return false;
}

void ENetClientTransport::send(std::span<const std::uint8_t> data) {
    if (!connected_ || !peer_) return;

    ENetPacket* packet = enet_packet_create(
        data.data(),
        data.size(),
        ENET_PACKET_FLAG_RELIABLE
    );

    if (packet && enet_peer_send(peer_, static_cast<std::uint8_t>(Channel::Reliable), packet) < 0) {
        enet_packet_destroy(packet);
        logf(LogLevel::Warning, name_.c_str(), "enet_peer_send failed");
    }
}

void ENetClientTransport::poll(std::uint32_t timeoutMs) {
    if (!host_) return;

    ENetEvent event;
    while (host_ && enet_host_service(host_, &event, timeoutMs) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT:
                connected_ = true;
                logf(LogLevel::Info, name_.c_str(), "connected, ping=%ums", event.peer->roundTripTime);
                if (onConnect) {
                    onConnect();
                }
                break;

            case ENET_EVENT_TYPE_RECEIVE:
                if (onReceive) {
                    onReceive(std::span<const std::uint8_t>(
                        event.packet->data,
                        event.packet->dataLength
                    ));
                }
                enet_packet_destroy(event.packet);
                break;

            case ENET_EVENT_TYPE_DISCONNECT:
                connected_ = false;
                peer_ = nullptr;
                logf(LogLevel::Info, name_.c_str(), "disconnected by server");
                if (onDisconnect) {
                    onDisconnect();
                }
                break;

            default:
                break;
        }

        // Only wait on first iteration
        timeoutMs = 0;
    }
}

bool ENetClientTransport::is_connected() const {
    return connected_;
}

void ENetClientTransport::disconnect() {
    const bool wasConnected = connected_;

    if (peer_ && connected_) {
        enet_peer_disconnect(peer_, 0);

        // Wait for disconnect acknowledgment
        ENetEvent event;
        while (enet_host_service(host_, &event, 100) > 0) {
            if (event.type == ENET_EVENT_TYPE_DISCONNECT) {
                break;
            }
            if (event.type == ENET_EVENT_TYPE_RECEIVE) {
                enet_packet_destroy(event.packet);
            }
        }

        enet_peer_reset(peer_);
    } else if (peer_) {
        enet_peer_reset(peer_);
    }

    connected_ = false;
    peer_ = nullptr;
    destroy_host();

    if (wasConnected && onDisconnect) {
        onDisconnect();
    }
}

std::uint32_t ENetClientTransport::ping_ms() const {
    if (peer_ && connected_) {
        return peer_->roundTripTime;
    }
    return 0;
}

void ENetClientTransport::destroy_host() {
    if (host_) {
        enet_host_destroy(host_);
        host_ = nullptr;
    }
}

} // namespace mapsync::transport
