#include "map_server.hpp"

#include <mapsync/core/logger.hpp>
#include <mapsync/transfer/chunker.hpp>

#include <chrono>
#include <type_traits>
#include <utility>
#include <variant>

namespace mapsync::server {

namespace {

constexpr const char* kTag = "server";

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* to_string(ServerPhase p) {
    switch (p) {
        case ServerPhase::Idle:              return "Idle";
        case ServerPhase::Transferring:      return "Transferring";
        case ServerPhase::WaitingForClients: return "WaitingForClients";
        case ServerPhase::Playing:           return "Playing";
    }
    return "?";
}

const char* default_description(ServerPhase p) {
    switch (p) {
        case ServerPhase::Idle:              return "Waiting for a world";
        case ServerPhase::Transferring:      return "Sending world to clients";
        case ServerPhase::WaitingForClients: return "Waiting for clients to load the world";
        case ServerPhase::Playing:           return "Game in progress";
    }
    return "";
}

// ============================================================================
// Phase handlers
// ============================================================================

class MapServer::PhaseHandler : public state::StateHandler<ServerPhase> {
public:
    PhaseHandler(MapServer& server, ServerPhase handled, std::initializer_list<ServerPhase> allowed)
        : StateHandler(handled, allowed)
        , server_(server)
    {
    }

protected:
    MapServer& server_;
};

class MapServer::IdleHandler final : public PhaseHandler {
public:
    explicit IdleHandler(MapServer& server)
        : PhaseHandler(server, ServerPhase::Idle, {ServerPhase::Transferring})
    {
    }
};

class MapServer::TransferringHandler final : public PhaseHandler {
public:
    explicit TransferringHandler(MapServer& server)
        : PhaseHandler(server, ServerPhase::Transferring,
                       {ServerPhase::WaitingForClients, ServerPhase::Idle})
    {
    }

    void on_enter(state::StateContext<ServerPhase>& ctx) override {
        const std::size_t started = server_.coordinator_.start_transfer_all();
        ctx.set_data("workers_started", started);
        logf(LogLevel::Info, kTag, "transferring '%s' to %zu client(s)", server_.mapId_.c_str(), started);
    }

    void on_exit(state::StateContext<ServerPhase>& ctx) override {
        ctx.remove_data("workers_started");
    }

    void on_update(state::StateContext<ServerPhase>& /*ctx*/, float /*dt*/) override {
        if (server_.coordinator_.is_idle()) {
            server_.phases_.request_state_change(ServerPhase::WaitingForClients);
            return;
        }

        const auto snapshot = server_.coordinator_.progress_snapshot();
        if (snapshot.clientToChunkProgress.empty() || !server_.coordinator_.has_blob()) return;

        const auto total = transfer::chunk_count(server_.coordinator_.blob()->total_size(),
                                                 server_.config_.chunk_size);
        if (total == 0) return;

        std::int64_t sent = 0;
        for (const auto& [id, index] : snapshot.clientToChunkProgress) {
            sent += index;
        }
        const float fraction = static_cast<float>(sent) /
                               static_cast<float>(static_cast<std::int64_t>(total) *
                                                  static_cast<std::int64_t>(snapshot.clientToChunkProgress.size()));
        server_.phases_.update_progress(fraction);
    }
};

class MapServer::WaitingForClientsHandler final : public PhaseHandler {
public:
    explicit WaitingForClientsHandler(MapServer& server)
        : PhaseHandler(server, ServerPhase::WaitingForClients,
                       {ServerPhase::Playing, ServerPhase::Transferring, ServerPhase::Idle})
    {
    }

    void on_update(state::StateContext<ServerPhase>& /*ctx*/, float /*dt*/) override {
        if (!server_.all_clients_ready()) return;

        logf(LogLevel::Info, kTag, "all clients hold '%s', starting play", server_.mapId_.c_str());
        server_.broadcast_gameplay(proto::TransferComplete{server_.mapId_});
        server_.phases_.request_state_change(ServerPhase::Playing);
    }
};

class MapServer::PlayingHandler final : public PhaseHandler {
public:
    explicit PlayingHandler(MapServer& server)
        : PhaseHandler(server, ServerPhase::Playing, {ServerPhase::Transferring, ServerPhase::Idle})
    {
    }
};

// ============================================================================
// MapServer
// ============================================================================

MapServer::MapServer(std::shared_ptr<transport::IServerTransport> gameplay,
                     std::shared_ptr<transport::IServerTransport> bulk,
                     TransferConfig config)
    : config_(std::move(config))
    , connections_(std::move(gameplay), std::move(bulk))
    , coordinator_(*this, config_)
    , phases_(ServerPhase::Idle, std::nullopt, "server")
{
    phases_.register_handler(std::make_unique<IdleHandler>(*this));
    phases_.register_handler(std::make_unique<TransferringHandler>(*this));
    phases_.register_handler(std::make_unique<WaitingForClientsHandler>(*this));
    phases_.register_handler(std::make_unique<PlayingHandler>(*this));

    auto listener = std::make_shared<state::CallbackStateListener<ServerPhase>>();
    listener->onStateChanged = [this](ServerPhase oldPhase, ServerPhase newPhase,
                                      const state::StateContext<ServerPhase>&) {
        if (onPhaseChanged) onPhaseChanged(oldPhase, newPhase);
    };
    phases_.add_listener(std::move(listener));

    connections_.onGameplayConnect = [this](ClientId id) {
        inbox_.push(InboundEvent{InboundEvent::Kind::Connect, id, std::nullopt});
    };
    connections_.onGameplayDisconnect = [this](ClientId id) {
        inbox_.push(InboundEvent{InboundEvent::Kind::Disconnect, id, std::nullopt});
    };
    connections_.onGameplayMessage = [this](ClientId id, proto::Message msg) {
        inbox_.push(InboundEvent{InboundEvent::Kind::Message, id, std::move(msg)});
    };

    coordinator_.onWorkerFailed = [this](ClientId id, const std::string& reason) {
        handle_worker_failed(id, reason);
    };
}

MapServer::~MapServer() = default;

void MapServer::on_init(IEngineServices& engine) {
    engine_ = &engine;
    logf(LogLevel::Info, kTag, "map server ready (chunk %zu bytes, %d chunks/tick, threshold %zu bytes)",
         config_.chunk_size, config_.max_chunks_per_tick, config_.backpressure_threshold);
}

void MapServer::on_tick(float dt) {
    connections_.poll();
    process_inbox();
    apply_pending_worlds();

    coordinator_.update(dt);
    phases_.update(dt);
}

void MapServer::on_shutdown() {
    coordinator_.release();
    inbox_.clear();
    logf(LogLevel::Info, kTag, "map server shut down in phase %s", to_string(phase()));
    engine_ = nullptr;
}

void MapServer::publish_world(transfer::WorldBlobPtr blob, std::uint64_t seed, std::string reason) {
    if (!blob) {
        logf(LogLevel::Warning, kTag, "ignoring publish of an empty world");
        return;
    }
    pendingWorlds_.push(PendingWorld{std::move(blob), seed, std::move(reason)});
}

void MapServer::apply_pending_worlds() {
    auto batch = pendingWorlds_.drain();

    // Only the newest world matters.
    while (!batch.empty()) {
        if (queuedWorld_) {
            logf(LogLevel::Info, kTag, "world '%s' superseded before it was sent",
                 queuedWorld_->blob->mapId.c_str());
        }
        queuedWorld_ = std::move(batch.front());
        batch.pop();
    }

    if (!queuedWorld_) return;

    // Clients ignore a TransferBegin while they download, so a running
    // transfer is allowed to finish before the next world goes out.
    if (transfer_in_flight()) {
        if (!loggedQueuedWorld_) {
            logf(LogLevel::Info, kTag, "holding world '%s' until the running transfer of '%s' finishes",
                 queuedWorld_->blob->mapId.c_str(), mapId_.c_str());
            loggedQueuedWorld_ = true;
        }
        return;
    }

    PendingWorld world = std::move(*queuedWorld_);
    queuedWorld_.reset();
    loggedQueuedWorld_ = false;
    apply_world(std::move(world));
}

bool MapServer::transfer_in_flight() const {
    if (coordinator_.has_active_transfers()) return true;

    for (const auto& profile : registry_.connected_profiles()) {
        const auto s = state::parse_game_state(profile.currentState);
        if (!s) continue;
        if (state::is_map_transfer_in_progress(*s)) return true;
        if (state::is_map_regeneration_state(*s) && !state::is_transfer_complete_state(*s)) return true;
    }
    return false;
}

std::optional<std::string> MapServer::queued_map_id() const {
    if (!queuedWorld_) return std::nullopt;
    return queuedWorld_->blob->mapId;
}

void MapServer::apply_world(PendingWorld world) {
    const ServerPhase current = phase();
    coordinator_.publish(world.blob);
    mapId_ = world.blob->mapId;

    switch (current) {
        case ServerPhase::Idle:
            phases_.request_state_change(ServerPhase::Transferring);
            break;

        case ServerPhase::Playing: {
            proto::MapRegenerationStart regen;
            regen.newMapSeed = world.seed;
            regen.reason = world.reason.empty() ? "map regenerated" : world.reason;
            regen.timestamp = now_ms();
            broadcast_gameplay(regen);
            logf(LogLevel::Info, kTag, "regenerating map as '%s' (seed %llu): %s", mapId_.c_str(),
                 static_cast<unsigned long long>(world.seed), regen.reason.c_str());
            phases_.request_state_change(ServerPhase::Transferring);
            break;
        }

        case ServerPhase::WaitingForClients:
            phases_.request_state_change(ServerPhase::Transferring);
            break;

        case ServerPhase::Transferring:
            // No worker had begun streaming; the ones waiting for an identity are replaced.
            // Already in the phase, so on_enter will not run again.
            logf(LogLevel::Info, kTag, "restarting transfers for '%s'", mapId_.c_str());
            coordinator_.start_transfer_all();
            break;
    }
}

// ============================================================================
// Inbound
// ============================================================================

void MapServer::process_inbox() {
    auto batch = inbox_.drain();
    while (!batch.empty()) {
        InboundEvent& ev = batch.front();
        switch (ev.kind) {
            case InboundEvent::Kind::Connect:
                handle_connect(ev.id);
                break;
            case InboundEvent::Kind::Disconnect:
                handle_disconnect(ev.id);
                break;
            case InboundEvent::Kind::Message:
                if (ev.msg) handle_message(ev.id, *ev.msg);
                break;
        }
        batch.pop();
    }
}

void MapServer::handle_connect(ClientId id) {
    registry_.on_connect(id);

    // The worker waits in PendingId until the client identifies itself.
    if (phase() != ServerPhase::Idle && coordinator_.has_blob()) {
        coordinator_.start_transfer(id);
    }
}

void MapServer::handle_disconnect(ClientId id) {
    coordinator_.on_client_disconnect(id);
    registry_.on_disconnect(id);
}

void MapServer::handle_message(ClientId id, proto::Message& msg) {
    std::visit([this, id](auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, proto::ClientIdentification>) {
            handle_identification(id, m);
        }
        else if constexpr (std::is_same_v<T, proto::ClientStateChange>) {
            handle_state_change(id, m);
        }
        else {
            logf(LogLevel::Warning, kTag, "client %u sent server-only message %s",
                 id, proto::message_name(proto::Message{m}));
        }
    }, msg);
}

void MapServer::handle_identification(ClientId id, const proto::ClientIdentification& msg) {
    if (msg.clientUniqueId.empty()) {
        logf(LogLevel::Warning, kTag, "client %u identified with an empty id", id);
        return;
    }
    registry_.identify(id, msg.clientUniqueId, msg.preferredName);

    if (phase() != ServerPhase::Idle && coordinator_.has_blob()) {
        coordinator_.start_transfer(id);
    }
}

void MapServer::handle_state_change(ClientId id, const proto::ClientStateChange& msg) {
    if (!registry_.set_state(id, msg.newState)) {
        logf(LogLevel::Warning, kTag, "state change from unknown client %u", id);
        return;
    }
    logf(LogLevel::Debug, kTag, "client %u: %s -> %s", id, msg.oldState.c_str(), msg.newState.c_str());

    const auto reported = state::parse_game_state(msg.newState);
    if (!reported) {
        logf(LogLevel::Warning, kTag, "client %u reported unknown state '%s'", id, msg.newState.c_str());
        return;
    }

    // Late joiners are released individually once the game runs.
    if (phase() == ServerPhase::Playing && state::is_transfer_complete_state(*reported) && !mapId_.empty()) {
        logf(LogLevel::Info, kTag, "client %u caught up on '%s'", id, mapId_.c_str());
        send(transfer::ChannelKind::Gameplay, id, proto::TransferComplete{mapId_});
    }
}

void MapServer::handle_worker_failed(ClientId id, const std::string& reason) {
    const auto uniqueId = registry_.unique_id(id);
    logf(LogLevel::Warning, kTag, "dropping client %u (%s): %s", id,
         uniqueId ? uniqueId->c_str() : "unidentified", reason.c_str());
    connections_.disconnect(id, uniqueId.value_or(std::string{}));
}

bool MapServer::all_clients_ready() const {
    std::size_t ready = 0;
    for (const auto& profile : registry_.connected_profiles()) {
        if (!profile.identified()) continue;

        const auto s = state::parse_game_state(profile.currentState);
        if (s && state::is_error_state(*s)) continue;
        if (!s || !state::is_transfer_complete_state(*s)) return false;
        ++ready;
    }
    return ready > 0;
}

// ============================================================================
// ITransferChannels
// ============================================================================

std::optional<std::string> MapServer::unique_id_for(ClientId gameplayId) const {
    return registry_.unique_id(gameplayId);
}

transfer::ReportedState MapServer::reported_state(ClientId gameplayId) const {
    return registry_.reported_state(gameplayId);
}

bool MapServer::is_gameplay_connected(ClientId gameplayId) const {
    return registry_.is_connected(gameplayId);
}

std::vector<ClientId> MapServer::connected_clients() const {
    return registry_.connected();
}

std::optional<ClientId> MapServer::bulk_connection_for(const std::string& uniqueId) const {
    return connections_.bulk_connection_for(uniqueId);
}

std::size_t MapServer::write_buffer_size(transfer::ChannelKind channel, ClientId id) const {
    return connections_.write_buffer_size(channel, id);
}

void MapServer::send(transfer::ChannelKind channel, ClientId id, const proto::Message& msg) {
    connections_.send(channel, id, msg);
}

void MapServer::broadcast_gameplay(const proto::Message& msg) {
    connections_.broadcast_gameplay(msg);
}

} // namespace mapsync::server
