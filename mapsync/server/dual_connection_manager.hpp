#pragma once

// DualConnectionManager - Gameplay and bulk server transports side by side.
// Gameplay carries control traffic; bulk carries map chunks and is bound to a
// client by the ClientIdentification it sends after connecting.

#include <mapsync/protocol/messages.hpp>
#include <mapsync/transfer/transfer_channels.hpp>
#include <mapsync/transport/transport.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace mapsync::server {

class DualConnectionManager {
public:
    DualConnectionManager(std::shared_ptr<transport::IServerTransport> gameplay,
                          std::shared_ptr<transport::IServerTransport> bulk);
    ~DualConnectionManager();

    DualConnectionManager(const DualConnectionManager&) = delete;
    DualConnectionManager& operator=(const DualConnectionManager&) = delete;

    /// Polls both transports. Callbacks fire from here.
    void poll();

    void send(transfer::ChannelKind channel, ClientId id, const proto::Message& msg);
    void broadcast_gameplay(const proto::Message& msg);
    std::size_t write_buffer_size(transfer::ChannelKind channel, ClientId id) const;

    /// Bulk connection bound to this identity, nullopt until its
    /// ClientIdentification has arrived.
    std::optional<ClientId> bulk_connection_for(const std::string& uniqueId) const;
    std::optional<std::string> bulk_identity(ClientId bulkId) const;
    std::size_t bulk_binding_count() const { return bulkByUniqueId_.size(); }

    /// Closes the gameplay connection and, if bound, the client's bulk connection.
    void disconnect(ClientId gameplayId, const std::string& uniqueId);

    transport::IServerTransport& gameplay() { return *gameplay_; }
    transport::IServerTransport& bulk() { return *bulk_; }

    std::function<void(ClientId)> onGameplayConnect;
    std::function<void(ClientId)> onGameplayDisconnect;
    std::function<void(ClientId, proto::Message)> onGameplayMessage;

    /// Fired after a bulk connection is bound to an identity.
    std::function<void(ClientId bulkId, const std::string& uniqueId)> onBulkBound;

private:
    void handle_bulk_data(ClientId bulkId, std::span<const std::uint8_t> data);
    void handle_bulk_disconnect(ClientId bulkId);

    transport::IServerTransport& transport_for(transfer::ChannelKind channel) const;

    std::shared_ptr<transport::IServerTransport> gameplay_;
    std::shared_ptr<transport::IServerTransport> bulk_;

    std::unordered_map<std::string, ClientId> bulkByUniqueId_;
    std::unordered_map<ClientId, std::string> uniqueIdByBulk_;
};

} // namespace mapsync::server
