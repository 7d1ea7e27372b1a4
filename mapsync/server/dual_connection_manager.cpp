#include "dual_connection_manager.hpp"

#include <mapsync/core/logger.hpp>
#include <mapsync/protocol/serialization.hpp>

#include <stdexcept>

namespace mapsync::server {

namespace {
constexpr const char* kTag = "conn";
}

DualConnectionManager::DualConnectionManager(std::shared_ptr<transport::IServerTransport> gameplay,
                                             std::shared_ptr<transport::IServerTransport> bulk)
    : gameplay_(std::move(gameplay))
    , bulk_(std::move(bulk))
{
    if (!gameplay_ || !bulk_) {
        throw std::invalid_argument("DualConnectionManager needs both transports");
    }

    gameplay_->onClientConnect = [this](ClientId id) {
        logf(LogLevel::Info, kTag, "gameplay connection %u opened", id);
        if (onGameplayConnect) onGameplayConnect(id);
    };

    gameplay_->onClientDisconnect = [this](ClientId id) {
        logf(LogLevel::Info, kTag, "gameplay connection %u closed", id);
        if (onGameplayDisconnect) onGameplayDisconnect(id);
    };

    gameplay_->onReceive = [this](ClientId id, std::span<const std::uint8_t> data) {
        auto msg = proto::deserialize(data);
        if (!msg) {
            logf(LogLevel::Warning, kTag, "dropping malformed gameplay message from %u (%zu bytes)",
                 id, data.size());
            return;
        }
        if (onGameplayMessage) onGameplayMessage(id, std::move(*msg));
    };

    bulk_->onClientConnect = [](ClientId id) {
        logf(LogLevel::Debug, kTag, "bulk connection %u opened, waiting for identification", id);
    };

    bulk_->onClientDisconnect = [this](ClientId id) {
        handle_bulk_disconnect(id);
    };

    bulk_->onReceive = [this](ClientId id, std::span<const std::uint8_t> data) {
        handle_bulk_data(id, data);
    };
}

DualConnectionManager::~DualConnectionManager() {
    gameplay_->onClientConnect = nullptr;
    gameplay_->onClientDisconnect = nullptr;
    gameplay_->onReceive = nullptr;
    bulk_->onClientConnect = nullptr;
    bulk_->onClientDisconnect = nullptr;
    bulk_->onReceive = nullptr;
}

void DualConnectionManager::poll() {
    gameplay_->poll(0);
    bulk_->poll(0);
}

transport::IServerTransport& DualConnectionManager::transport_for(transfer::ChannelKind channel) const {
    return channel == transfer::ChannelKind::Bulk ? *bulk_ : *gameplay_;
}

void DualConnectionManager::send(transfer::ChannelKind channel, ClientId id, const proto::Message& msg) {
    auto bytes = proto::serialize(msg);
    transport_for(channel).send(id, bytes);
}

void DualConnectionManager::broadcast_gameplay(const proto::Message& msg) {
    auto bytes = proto::serialize(msg);
    gameplay_->broadcast(bytes);
}

std::size_t DualConnectionManager::write_buffer_size(transfer::ChannelKind channel, ClientId id) const {
    return transport_for(channel).write_buffer_size(id);
}

std::optional<ClientId> DualConnectionManager::bulk_connection_for(const std::string& uniqueId) const {
    auto it = bulkByUniqueId_.find(uniqueId);
    if (it == bulkByUniqueId_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> DualConnectionManager::bulk_identity(ClientId bulkId) const {
    auto it = uniqueIdByBulk_.find(bulkId);
    if (it == uniqueIdByBulk_.end()) return std::nullopt;
    return it->second;
}

void DualConnectionManager::disconnect(ClientId gameplayId, const std::string& uniqueId) {
    if (auto bulkId = bulk_connection_for(uniqueId)) {
        bulk_->disconnect(*bulkId);
    }
    gameplay_->disconnect(gameplayId);
}

void DualConnectionManager::handle_bulk_data(ClientId bulkId, std::span<const std::uint8_t> data) {
    auto msg = proto::deserialize(data);
    if (!msg) {
        logf(LogLevel::Warning, kTag, "dropping malformed bulk message from %u (%zu bytes)", bulkId, data.size());
        return;
    }

    const auto* ident = std::get_if<proto::ClientIdentification>(&*msg);
    if (!ident) {
        logf(LogLevel::Warning, kTag, "ignoring %s on bulk connection %u", proto::message_name(*msg), bulkId);
        return;
    }
    if (ident->clientUniqueId.empty()) {
        logf(LogLevel::Warning, kTag, "bulk connection %u identified with an empty id", bulkId);
        return;
    }

    // A reconnecting client replaces its previous bulk binding.
    auto prev = bulkByUniqueId_.find(ident->clientUniqueId);
    if (prev != bulkByUniqueId_.end() && prev->second != bulkId) {
        logf(LogLevel::Info, kTag, "'%s' rebound from bulk %u to bulk %u",
             ident->clientUniqueId.c_str(), prev->second, bulkId);
        uniqueIdByBulk_.erase(prev->second);
    }

    auto oldId = uniqueIdByBulk_.find(bulkId);
    if (oldId != uniqueIdByBulk_.end() && oldId->second != ident->clientUniqueId) {
        bulkByUniqueId_.erase(oldId->second);
    }

    bulkByUniqueId_[ident->clientUniqueId] = bulkId;
    uniqueIdByBulk_[bulkId] = ident->clientUniqueId;

    logf(LogLevel::Info, kTag, "bulk connection %u bound to '%s'", bulkId, ident->clientUniqueId.c_str());
    if (onBulkBound) onBulkBound(bulkId, ident->clientUniqueId);
}

void DualConnectionManager::handle_bulk_disconnect(ClientId bulkId) {
    auto it = uniqueIdByBulk_.find(bulkId);
    if (it == uniqueIdByBulk_.end()) {
        logf(LogLevel::Debug, kTag, "unbound bulk connection %u closed", bulkId);
        return;
    }

    logf(LogLevel::Info, kTag, "bulk connection %u of '%s' closed", bulkId, it->second.c_str());
    auto bound = bulkByUniqueId_.find(it->second);
    if (bound != bulkByUniqueId_.end() && bound->second == bulkId) {
        bulkByUniqueId_.erase(bound);
    }
    uniqueIdByBulk_.erase(it);
}

} // namespace mapsync::server
