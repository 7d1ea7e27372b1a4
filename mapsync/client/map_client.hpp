#pragma once

// MapClient - Client side of the map transfer protocol.
// Owns the gameplay and bulk transports and the GameState machine.

#include "transfer_handlers.hpp"
#include "transfer_session.hpp"
#include "world_integration.hpp"

#include <mapsync/core/config.hpp>
#include <mapsync/core/message_queue.hpp>
#include <mapsync/protocol/messages.hpp>
#include <mapsync/transport/transport.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mapsync::client {

class MapClient {
public:
    /// An empty uniqueId generates a random one.
    MapClient(std::shared_ptr<transport::IClientTransport> gameplay,
              std::shared_ptr<transport::IClientTransport> bulk,
              IWorldIntegration& world,
              TransferConfig config,
              std::string preferredName,
              std::string uniqueId = {});
    ~MapClient();

    MapClient(const MapClient&) = delete;
    MapClient& operator=(const MapClient&) = delete;

    /// Lobby or ConnectionLost -> Connecting. The caller opens the gameplay
    /// connection; its connect event moves the client to Connected.
    bool begin_connecting();

    /// Error, ConnectionLost or Playing -> Lobby. Closes both connections.
    bool return_to_lobby();

    /// Polls both transports, dispatches what arrived, then runs the current state.
    void update(float dt);

    /// Called when a state needs the bulk connection and it is not open.
    /// Without one the bulk transport is expected to connect on its own.
    void set_bulk_connector(std::function<void()> connector) { bulkConnector_ = std::move(connector); }

    // --- Queries ---

    state::GameState state() const { return manager_.current_state(); }
    const GameStateContext& context() const { return manager_.context(); }
    GameStateManager& state_manager() { return manager_; }

    const std::string& unique_id() const { return uniqueId_; }
    const std::string& preferred_name() const { return preferredName_; }
    const TransferSession& session() const { return session_; }
    const std::map<std::string, std::int32_t>& peer_progress() const { return session_.peerProgress; }

    std::function<void(state::GameState oldState, state::GameState newState)> onStateChanged;

private:
    struct InboundEvent {
        enum class Kind : std::uint8_t {
            GameplayConnect,
            GameplayDisconnect,
            BulkConnect,
            BulkDisconnect,
            Message,
        };

        Kind kind{Kind::Message};
        bool bulk{false};
        std::optional<proto::Message> msg;
    };

    void wire_transports();
    void process_inbox();

    void handle_gameplay_connect();
    void handle_gameplay_disconnect();
    void handle_bulk_connect();
    void handle_message(bool fromBulk, proto::Message& msg);

    void on_transfer_begin(const proto::TransferBegin& msg);

    /// Enters Error when the announced world is larger than max_world_size.
    bool fits_size_limit(const proto::TransferBegin& msg);
    void on_map_chunk(const proto::MapChunk& msg);
    void on_transfer_complete(const proto::TransferComplete& msg);
    void on_regeneration_start(const proto::MapRegenerationStart& msg);

    void send_gameplay(const proto::Message& msg);
    void send_identification(transport::IClientTransport& transport);

    /// Re-sends the current state so the server sees it after its TransferBegin.
    void report_current_state();

    void request_bulk_connection();

    std::shared_ptr<transport::IClientTransport> gameplay_;
    std::shared_ptr<transport::IClientTransport> bulk_;
    IWorldIntegration& world_;
    TransferConfig config_;

    std::string preferredName_;
    std::string uniqueId_;

    GameStateManager manager_;
    TransferSession session_;
    HandlerContext handlerContext_;

    MessageQueue<InboundEvent> inbox_;
    std::function<void()> bulkConnector_;
};

/// "client-" followed by 16 random hex digits.
std::string generate_client_unique_id();

} // namespace mapsync::client
