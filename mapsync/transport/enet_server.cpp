#include "enet_server.hpp"

#include <mapsync/core/logger.hpp>

#include <enet/enet.h>

namespace mapsync::transport {

namespace {

void release_backlog_entry(ENetPacket* packet) {
    delete static_cast<SendBacklog::Entry*>(packet->userData);
    packet->userData = nullptr;
}

} // namespace

ENetServerTransport::ENetServerTransport(std::string name)
    : name_(std::move(name))
{
}

ENetServerTransport::~ENetServerTransport() {
    stop();
}

bool ENetServerTransport::start(std::uint16_t port, std::size_t maxClients) {
    if (running_) {
        return false;
    }

    ENetAddress address;
    address.host = ENET_HOST_ANY;
    address.port = port;

    logf(LogLevel::Info, name_.c_str(), "starting on port %u, maxClients=%zu", port, maxClients);

    host_ = enet_host_create(
        &address,
        maxClients,
        config::kChannelCount,
        0,  // Unlimited incoming bandwidth
        0   // Unlimited outgoing bandwidth
    );

    if (!host_) {
        logf(LogLevel::Error, name_.c_str(), "enet_host_create failed on port %u", port);
        return false;
    }

    enet_host_compress_with_range_coder(host_);

    running_ = true;
    return true;
}

void ENetServerTransport::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    for (auto& [id, peer] : clients_) {
        enet_peer_disconnect(peer, 0);
    }

    // Flush pending packets
    if (host_) {
        for (int i = 0; i < 10; ++i) {
            enet_host_service(host_, nullptr, 10);
        }
        enet_host_destroy(host_);
        host_ = nullptr;
    }

    clients_.clear();
    peerToClient_.clear();
    backlog_.clear();

    logf(LogLevel::Info, name_.c_str(), "stopped");
}

void ENetServerTransport::send(ClientId id, std::span<const std::uint8_t> data) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;

    send_to(id, it->second, data);
}

void ENetServerTransport::broadcast(std::span<const std::uint8_t> data) {
    if (!host_) return;

    // One packet per peer so each backlog is released by its own ack.
    for (auto& [id, peer] : clients_) {
        send_to(id, peer, data);
    }
}

void ENetServerTransport::send_to(ClientId id, ENetPeer* peer, std::span<const std::uint8_t> data) {
    ENetPacket* packet = enet_packet_create(
        data.data(),
        data.size(),
        ENET_PACKET_FLAG_RELIABLE
    );

    if (!packet) return;

    packet->userData = backlog_[id].add(data.size()).release();
    packet->freeCallback = release_backlog_entry;

    if (enet_peer_send(peer, static_cast<std::uint8_t>(Channel::Reliable), packet) != 0) {
        enet_packet_destroy(packet);
        logf(LogLevel::Warning, name_.c_str(), "enet_peer_send failed for client %u", id);
    }
}

void ENetServerTransport::poll(std::uint32_t timeoutMs) {
    if (!host_) return;

    ENetEvent event;
    while (enet_host_service(host_, &event, timeoutMs) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT: {
                ClientId id = next_client_id();
                clients_[id] = event.peer;
                peerToClient_[event.peer] = id;
                event.peer->data = reinterpret_cast<void*>(static_cast<std::uintptr_t>(id));

                logf(LogLevel::Info, name_.c_str(), "client %u connected from %x:%u",
                     id, event.peer->address.host, event.peer->address.port);

                if (onClientConnect) {
                    onClientConnect(id);
                }
                break;
            }

            case ENET_EVENT_TYPE_DISCONNECT: {
                ClientId id = find_client_id(event.peer);
                if (id != kInvalidClientId) {
                    logf(LogLevel::Info, name_.c_str(), "client %u disconnected", id);

                    if (onClientDisconnect) {
                        onClientDisconnect(id);
                    }

                    clients_.erase(id);
                    peerToClient_.erase(event.peer);
                    backlog_.erase(id);
                }
                break;
            }

            case ENET_EVENT_TYPE_RECEIVE: {
                ClientId id = find_client_id(event.peer);
                if (id != kInvalidClientId && onReceive) {
                    onReceive(id, std::span<const std::uint8_t>(
                        event.packet->data,
                        event.packet->dataLength
                    ));
                }
                enet_packet_destroy(event.packet);
                break;
            }

            default:
                break;
        }

        // Only wait on first iteration
        timeoutMs = 0;
    }
}

void ENetServerTransport::disconnect(ClientId id) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;

    enet_peer_disconnect(it->second, 0);

    if (onClientDisconnect) {
        onClientDisconnect(id);
    }

    peerToClient_.erase(it->second);
    clients_.erase(it);
    backlog_.erase(id);
}

std::size_t ENetServerTransport::write_buffer_size(ClientId id) const {
    if (!clients_.contains(id)) return 0;

    auto it = backlog_.find(id);
    return it != backlog_.end() ? it->second.bytes() : 0;
}

ClientId ENetServerTransport::next_client_id() {
    return nextClientId_++;
}

ClientId ENetServerTransport::find_client_id(ENetPeer* peer) {
    auto it = peerToClient_.find(peer);
    return (it != peerToClient_.end()) ? it->second : kInvalidClientId;
}

} // namespace mapsync::transport
