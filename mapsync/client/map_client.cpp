#include "map_client.hpp"

#include <mapsync/core/logger.hpp>
#include <mapsync/protocol/serialization.hpp>
#include <mapsync/transfer/chunker.hpp>

#include <cstdio>
#include <random>
#include <stdexcept>
#include <variant>
#include <utility>

namespace mapsync::client {

using state::GameState;

namespace {

constexpr const char* kTag = "client";

/// Why the sizes announced by a TransferBegin cannot describe a real world,
/// or nullptr when they can.
const char* malformed_begin(const proto::TransferBegin& msg) {
    if (msg.totalChunks < 0 || msg.totalSize < 0) return "negative size";
    if ((msg.totalSize == 0) != (msg.totalChunks == 0)) return "chunk count does not match size";

    const auto maxChunks = transfer::chunk_count(static_cast<std::size_t>(msg.totalSize), kMinChunkSize);
    if (msg.totalChunks > maxChunks) return "more chunks than the size allows";
    return nullptr;
}

} // namespace

std::string generate_client_unique_id() {
    std::random_device rd;
    std::mt19937_64 rng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    char buf[32];
    std::snprintf(buf, sizeof(buf), "client-%016llx", static_cast<unsigned long long>(rng()));
    return buf;
}

MapClient::MapClient(std::shared_ptr<transport::IClientTransport> gameplay,
                     std::shared_ptr<transport::IClientTransport> bulk,
                     IWorldIntegration& world,
                     TransferConfig config,
                     std::string preferredName,
                     std::string uniqueId)
    : gameplay_(std::move(gameplay))
    , bulk_(std::move(bulk))
    , world_(world)
    , config_(std::move(config))
    , preferredName_(std::move(preferredName))
    , uniqueId_(uniqueId.empty() ? generate_client_unique_id() : std::move(uniqueId))
    , manager_(GameState::Lobby, GameState::Error, "state")
    , handlerContext_{manager_, session_, world_, config_,
                      [this]() { request_bulk_connection(); },
                      [this]() { return bulk_ && bulk_->is_connected(); }}
{
    if (!gameplay_ || !bulk_) {
        throw std::invalid_argument("MapClient needs both transports");
    }

    register_transfer_handlers(handlerContext_);

    auto listener = std::make_shared<state::CallbackStateListener<GameState>>();
    listener->onStateChanged = [this](GameState oldState, GameState newState, const GameStateContext&) {
        if (gameplay_->is_connected()) {
            send_gameplay(proto::ClientStateChange{state::to_string(oldState), state::to_string(newState)});
        }
        if (onStateChanged) onStateChanged(oldState, newState);
    };
    manager_.add_listener(std::move(listener));

    wire_transports();
    logf(LogLevel::Info, kTag, "client '%s' (%s) created", uniqueId_.c_str(), preferredName_.c_str());
}

MapClient::~MapClient() {
    gameplay_->onConnect = nullptr;
    gameplay_->onDisconnect = nullptr;
    gameplay_->onReceive = nullptr;
    bulk_->onConnect = nullptr;
    bulk_->onDisconnect = nullptr;
    bulk_->onReceive = nullptr;
}

void MapClient::wire_transports() {
    gameplay_->onConnect = [this]() {
        inbox_.push(InboundEvent{InboundEvent::Kind::GameplayConnect, false, std::nullopt});
    };
    gameplay_->onDisconnect = [this]() {
        inbox_.push(InboundEvent{InboundEvent::Kind::GameplayDisconnect, false, std::nullopt});
    };
    gameplay_->onReceive = [this](std::span<const std::uint8_t> data) {
        auto msg = proto::deserialize(data);
        if (!msg) {
            logf(LogLevel::Warning, kTag, "dropping malformed gameplay message (%zu bytes)", data.size());
            return;
        }
        inbox_.push(InboundEvent{InboundEvent::Kind::Message, false, std::move(msg)});
    };

    bulk_->onConnect = [this]() {
        inbox_.push(InboundEvent{InboundEvent::Kind::BulkConnect, true, std::nullopt});
    };
    bulk_->onDisconnect = [this]() {
        inbox_.push(InboundEvent{InboundEvent::Kind::BulkDisconnect, true, std::nullopt});
    };
    bulk_->onReceive = [this](std::span<const std::uint8_t> data) {
        auto msg = proto::deserialize(data);
        if (!msg) {
            logf(LogLevel::Warning, kTag, "dropping malformed bulk message (%zu bytes)", data.size());
            return;
        }
        inbox_.push(InboundEvent{InboundEvent::Kind::Message, true, std::move(msg)});
    };
}

bool MapClient::begin_connecting() {
    const GameState s = state();
    if (s != GameState::Lobby && s != GameState::ConnectionLost) {
        logf(LogLevel::Warning, kTag, "cannot start connecting from %s", state::to_string(s));
        return false;
    }
    return manager_.request_state_change(GameState::Connecting);
}

bool MapClient::return_to_lobby() {
    if (bulk_->is_connected()) bulk_->disconnect();
    if (gameplay_->is_connected()) gameplay_->disconnect();
    // The disconnect events were queued by the transports; drop them so they
    // do not move the client to ConnectionLost after it is back in the lobby.
    inbox_.clear();
    return manager_.request_state_change(GameState::Lobby);
}

void MapClient::update(float dt) {
    gameplay_->poll(0);
    bulk_->poll(0);
    process_inbox();
    manager_.update(dt);
}

void MapClient::process_inbox() {
    auto batch = inbox_.drain();
    while (!batch.empty()) {
        InboundEvent& ev = batch.front();
        switch (ev.kind) {
            case InboundEvent::Kind::GameplayConnect:
                handle_gameplay_connect();
                break;
            case InboundEvent::Kind::GameplayDisconnect:
                handle_gameplay_disconnect();
                break;
            case InboundEvent::Kind::BulkConnect:
                handle_bulk_connect();
                break;
            case InboundEvent::Kind::BulkDisconnect:
                logf(LogLevel::Info, kTag, "bulk connection closed");
                break;
            case InboundEvent::Kind::Message:
                if (ev.msg) handle_message(ev.bulk, *ev.msg);
                break;
        }
        batch.pop();
    }
}

// ============================================================================
// Connection events
// ============================================================================

void MapClient::handle_gameplay_connect() {
    logf(LogLevel::Info, kTag, "gameplay connection established");
    send_identification(*gameplay_);

    if (state() == GameState::Lobby || state() == GameState::ConnectionLost) {
        manager_.request_state_change(GameState::Connecting);
    }
    manager_.request_state_change(GameState::Connected);
}

void MapClient::handle_gameplay_disconnect() {
    const GameState s = state();
    if (s == GameState::Lobby || s == GameState::Error || s == GameState::ConnectionLost) {
        return;
    }
    logf(LogLevel::Warning, kTag, "gameplay connection lost in %s", state::to_string(s));
    if (bulk_->is_connected()) bulk_->disconnect();
    manager_.request_state_change(GameState::ConnectionLost);
}

void MapClient::handle_bulk_connect() {
    logf(LogLevel::Info, kTag, "bulk connection established");
    send_identification(*bulk_);
}

void MapClient::send_identification(transport::IClientTransport& transport) {
    auto bytes = proto::serialize(proto::ClientIdentification{uniqueId_, preferredName_});
    transport.send(bytes);
}

void MapClient::send_gameplay(const proto::Message& msg) {
    auto bytes = proto::serialize(msg);
    gameplay_->send(bytes);
}

void MapClient::report_current_state() {
    const char* name = state::to_string(state());
    send_gameplay(proto::ClientStateChange{name, name});
}

void MapClient::request_bulk_connection() {
    if (bulk_->is_connected()) return;
    if (bulkConnector_) {
        logf(LogLevel::Info, kTag, "opening bulk connection");
        bulkConnector_();
    } else {
        logf(LogLevel::Debug, kTag, "waiting for bulk connection");
    }
}

// ============================================================================
// Messages
// ============================================================================

void MapClient::handle_message(bool fromBulk, proto::Message& msg) {
    if (auto* chunk = std::get_if<proto::MapChunk>(&msg)) {
        on_map_chunk(*chunk);
        return;
    }

    if (fromBulk) {
        logf(LogLevel::Warning, kTag, "ignoring %s on bulk connection", proto::message_name(msg));
        return;
    }

    if (auto* begin = std::get_if<proto::TransferBegin>(&msg)) {
        on_transfer_begin(*begin);
    } else if (auto* done = std::get_if<proto::TransferComplete>(&msg)) {
        on_transfer_complete(*done);
    } else if (auto* progress = std::get_if<proto::AllClientProgress>(&msg)) {
        session_.peerProgress = std::move(progress->clientToChunkProgress);
    } else if (auto* regen = std::get_if<proto::MapRegenerationStart>(&msg)) {
        on_regeneration_start(*regen);
    } else {
        logf(LogLevel::Warning, kTag, "ignoring client-only message %s", proto::message_name(msg));
    }
}

void MapClient::on_transfer_begin(const proto::TransferBegin& msg) {
    const GameState s = state();

    if (const char* why = malformed_begin(msg)) {
        logf(LogLevel::Warning, kTag, "ignoring TransferBegin for '%s' with %d chunks / %lld bytes: %s",
             msg.mapId.c_str(), msg.totalChunks, static_cast<long long>(msg.totalSize), why);
        return;
    }

    // One transfer at a time; a second begin never disrupts the running one.
    if (state::is_map_transfer_in_progress(s) || s == GameState::MapRegenerationRebuilding ||
        s == GameState::MapRegenerationComplete) {
        logf(LogLevel::Warning, kTag, "ignoring TransferBegin for '%s' in %s", msg.mapId.c_str(),
             state::to_string(s));
        return;
    }

    if (s == GameState::MapRegenerationCleanup || s == GameState::MapRegenerationDownloading) {
        if (!session_.has_transfer()) {
            if (!fits_size_limit(msg)) return;
            logf(LogLevel::Info, kTag, "regeneration target '%s': %d chunks, %lld bytes", msg.mapId.c_str(),
                 msg.totalChunks, static_cast<long long>(msg.totalSize));
            session_.begin(msg);
        } else if (session_.expected->mapId != msg.mapId) {
            logf(LogLevel::Warning, kTag, "ignoring TransferBegin for '%s' while downloading '%s'",
                 msg.mapId.c_str(), session_.expected->mapId.c_str());
        }
        return;
    }

    if (s != GameState::Connected && s != GameState::MapTransferComplete && s != GameState::Playing) {
        logf(LogLevel::Warning, kTag, "ignoring TransferBegin for '%s' in %s", msg.mapId.c_str(),
             state::to_string(s));
        return;
    }

    const auto current = world_.current_map_id();
    const bool haveMap = current && *current == msg.mapId;

    if (haveMap) {
        logf(LogLevel::Info, kTag, "already holding '%s', skipping transfer", msg.mapId.c_str());
        if (s == GameState::MapTransferComplete) {
            report_current_state();
        } else {
            manager_.request_state_change(GameState::MapTransferComplete);
        }
        return;
    }

    if (!fits_size_limit(msg)) return;

    logf(LogLevel::Info, kTag, "transfer of '%s': %d chunks, %lld bytes", msg.mapId.c_str(),
         msg.totalChunks, static_cast<long long>(msg.totalSize));
    session_.begin(msg);

    if (s == GameState::Playing) {
        session_.regenerationReason = "new map announced";
        manager_.request_state_change(GameState::MapRegenerationCleanup);
    } else {
        manager_.request_state_change(GameState::MapTransferInitiated);
    }
}

bool MapClient::fits_size_limit(const proto::TransferBegin& msg) {
    if (static_cast<std::uint64_t>(msg.totalSize) <= config_.max_world_size) return true;

    char message[160];
    std::snprintf(message, sizeof(message), "world '%s' is %lld bytes, limit is %zu",
                  msg.mapId.c_str(), static_cast<long long>(msg.totalSize), config_.max_world_size);
    manager_.transition_to_error(message);
    return false;
}

void MapClient::on_map_chunk(const proto::MapChunk& msg) {
    const GameState s = state();
    if (s != GameState::MapTransferInitiated && s != GameState::MapTransferTransferring &&
        s != GameState::MapRegenerationDownloading) {
        logf(LogLevel::Debug, kTag, "dropping chunk %d of '%s' in %s", msg.chunkIndex, msg.mapId.c_str(),
             state::to_string(s));
        return;
    }

    if (!session_.expects(msg.mapId, msg.totalChunks)) {
        logf(LogLevel::Warning, kTag, "dropping chunk %d of unexpected map '%s' (%d chunks)",
             msg.chunkIndex, msg.mapId.c_str(), msg.totalChunks);
        return;
    }

    switch (session_.buffer.apply(msg.chunkIndex, msg.payload)) {
        case transfer::ReassemblyBuffer::ApplyResult::Stored:
            session_.stallTime = 0.0f;
            break;
        case transfer::ReassemblyBuffer::ApplyResult::Duplicate:
            logf(LogLevel::Debug, kTag, "duplicate chunk %d of '%s'", msg.chunkIndex, msg.mapId.c_str());
            return;
        case transfer::ReassemblyBuffer::ApplyResult::OutOfRange:
            logf(LogLevel::Warning, kTag, "chunk index %d out of range [0,%d)", msg.chunkIndex, msg.totalChunks);
            return;
    }

    const auto& buf = session_.buffer;
    char status[96];
    std::snprintf(status, sizeof(status), "Received %d/%d chunks", buf.chunks_received(), buf.total_chunks());
    manager_.update_progress(buf.fraction_complete(), status);

    if (!buf.is_complete()) return;

    if (s == GameState::MapTransferTransferring) {
        manager_.request_state_change(GameState::MapTransferReassembling);
    } else if (s == GameState::MapRegenerationDownloading) {
        manager_.request_state_change(GameState::MapRegenerationRebuilding);
    }
}

void MapClient::on_transfer_complete(const proto::TransferComplete& msg) {
    const GameState s = state();
    if (!state::is_transfer_complete_state(s)) {
        logf(LogLevel::Debug, kTag, "TransferComplete for '%s' in %s, not ready yet", msg.mapId.c_str(),
             state::to_string(s));
        return;
    }

    const auto current = world_.current_map_id();
    if (!msg.mapId.empty() && current && *current != msg.mapId) {
        logf(LogLevel::Warning, kTag, "TransferComplete for '%s' but holding '%s'", msg.mapId.c_str(),
             current->c_str());
        return;
    }

    manager_.request_state_change(GameState::Playing);
}

void MapClient::on_regeneration_start(const proto::MapRegenerationStart& msg) {
    const GameState s = state();
    if (s != GameState::Playing) {
        logf(LogLevel::Debug, kTag, "ignoring MapRegenerationStart in %s", state::to_string(s));
        return;
    }

    logf(LogLevel::Info, kTag, "map regeneration (seed %llu): %s",
         static_cast<unsigned long long>(msg.newMapSeed), msg.reason.c_str());
    session_.clear();
    session_.regenerationSeed = msg.newMapSeed;
    session_.regenerationReason = msg.reason;
    manager_.request_state_change(GameState::MapRegenerationCleanup);
}

} // namespace mapsync::client
