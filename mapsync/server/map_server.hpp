#pragma once

// MapServer - Authoritative side of the map transfer protocol.
// Runs as an IServerApp on ServerEngine's tick thread.

#include "client_registry.hpp"
#include "dual_connection_manager.hpp"

#include <mapsync/core/app_interface.hpp>
#include <mapsync/core/config.hpp>
#include <mapsync/core/message_queue.hpp>
#include <mapsync/state/state_manager.hpp>
#include <mapsync/transfer/transfer_coordinator.hpp>
#include <mapsync/transfer/world_blob.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mapsync::server {

// ============================================================================
// ServerPhase
// ============================================================================

enum class ServerPhase : std::uint8_t {
    Idle,               // no world published
    Transferring,       // workers are streaming the current world
    WaitingForClients,  // every worker is done, some clients are still building
    Playing,
};

const char* to_string(ServerPhase p);
const char* default_description(ServerPhase p);

// ============================================================================
// MapServer
// ============================================================================

class MapServer final : public IServerApp, private transfer::ITransferChannels {
public:
    MapServer(std::shared_ptr<transport::IServerTransport> gameplay,
              std::shared_ptr<transport::IServerTransport> bulk,
              TransferConfig config);
    ~MapServer() override;

    MapServer(const MapServer&) = delete;
    MapServer& operator=(const MapServer&) = delete;

    // --- IServerApp ---

    void on_init(IEngineServices& engine) override;
    void on_tick(float dt) override;
    void on_shutdown() override;

    /// Safe from any thread. Takes effect on the next tick in which no client
    /// is in the middle of a download; until then the newest world waits.
    /// While Playing, clients are told to regenerate first.
    void publish_world(transfer::WorldBlobPtr blob, std::uint64_t seed = 0, std::string reason = {});

    // --- Queries (tick thread) ---

    ServerPhase phase() const { return phases_.current_state(); }
    const std::string& current_map_id() const { return mapId_; }

    /// Map id of a world published while a transfer was still running.
    std::optional<std::string> queued_map_id() const;

    const ClientRegistry& registry() const { return registry_; }
    const transfer::TransferCoordinator& coordinator() const { return coordinator_; }
    DualConnectionManager& connections() { return connections_; }

    std::function<void(ServerPhase oldPhase, ServerPhase newPhase)> onPhaseChanged;

private:
    class PhaseHandler;
    class IdleHandler;
    class TransferringHandler;
    class WaitingForClientsHandler;
    class PlayingHandler;

    struct InboundEvent {
        enum class Kind : std::uint8_t { Connect, Disconnect, Message };

        Kind kind{Kind::Message};
        ClientId id{kInvalidClientId};
        std::optional<proto::Message> msg;
    };

    struct PendingWorld {
        transfer::WorldBlobPtr blob;
        std::uint64_t seed{0};
        std::string reason;
    };

    // --- ITransferChannels ---

    std::optional<std::string> unique_id_for(ClientId gameplayId) const override;
    transfer::ReportedState reported_state(ClientId gameplayId) const override;
    bool is_gameplay_connected(ClientId gameplayId) const override;
    std::vector<ClientId> connected_clients() const override;
    std::optional<ClientId> bulk_connection_for(const std::string& uniqueId) const override;
    std::size_t write_buffer_size(transfer::ChannelKind channel, ClientId id) const override;
    void send(transfer::ChannelKind channel, ClientId id, const proto::Message& msg) override;
    void broadcast_gameplay(const proto::Message& msg) override;

    void process_inbox();
    void handle_connect(ClientId id);
    void handle_disconnect(ClientId id);
    void handle_message(ClientId id, proto::Message& msg);
    void handle_identification(ClientId id, const proto::ClientIdentification& msg);
    void handle_state_change(ClientId id, const proto::ClientStateChange& msg);

    void apply_pending_worlds();

    /// A worker has begun streaming, or a client reports a download or rebuild in progress.
    bool transfer_in_flight() const;

    void apply_world(PendingWorld world);
    void handle_worker_failed(ClientId id, const std::string& reason);

    /// Every connected, identified client holds the world, and there is at least one.
    bool all_clients_ready() const;

    TransferConfig config_;
    ClientRegistry registry_;
    DualConnectionManager connections_;
    transfer::TransferCoordinator coordinator_;
    state::StateManager<ServerPhase> phases_;

    MessageQueue<InboundEvent> inbox_;
    MessageQueue<PendingWorld> pendingWorlds_;
    std::optional<PendingWorld> queuedWorld_;
    bool loggedQueuedWorld_{false};

    std::string mapId_;
    IEngineServices* engine_{nullptr};
};

} // namespace mapsync::server
