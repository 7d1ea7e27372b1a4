#include "transfer_handlers.hpp"

#include <mapsync/core/logger.hpp>

#include <cstdio>
#include <exception>
#include <memory>
#include <string>

namespace mapsync::client {

using state::GameState;

namespace {

constexpr const char* kTag = "client";

// ============================================================================
// Base
// ============================================================================

class ClientHandler : public state::StateHandler<GameState> {
public:
    ClientHandler(HandlerContext& ctx, GameState handled, std::initializer_list<GameState> allowed)
        : StateHandler(handled, allowed)
        , ctx_(ctx)
    {
    }

protected:
    void go(GameState next) { ctx_.manager.request_state_change(next); }

    void fail(const std::string& message) { ctx_.manager.transition_to_error(message); }

    void report_receive_progress() {
        const auto& buf = ctx_.session.buffer;
        char status[96];
        std::snprintf(status, sizeof(status), "Received %d/%d chunks",
                      buf.chunks_received(), buf.total_chunks());
        ctx_.manager.update_progress(buf.fraction_complete(), status);
    }

    /// Hands session.decoded to the world integration once.
    bool apply_decoded() {
        auto& s = ctx_.session;
        if (s.worldApplied) return true;
        if (!s.decoded) {
            fail("no decoded world to apply");
            return false;
        }
        try {
            ctx_.world.release_world();
            ctx_.world.apply_world(s.decoded);
        } catch (const std::exception& e) {
            fail(std::string("applying world failed: ") + e.what());
            return false;
        }
        s.worldApplied = true;
        return true;
    }

    /// Counts toward the stall timeout; true if it expired.
    bool stalled(float dt) {
        ctx_.session.stallTime += dt;
        return ctx_.session.stallTime >= ctx_.config.stall_timeout;
    }

    HandlerContext& ctx_;
};

// ============================================================================
// Connection
// ============================================================================

class LobbyHandler final : public ClientHandler {
public:
    explicit LobbyHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::Lobby, {GameState::Connecting, GameState::Error})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.clear();
        ctx_.session.peerProgress.clear();
    }
};

class ConnectingHandler final : public ClientHandler {
public:
    explicit ConnectingHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::Connecting,
                        {GameState::Connected, GameState::ConnectionLost, GameState::Error})
    {
    }
};

class ConnectedHandler final : public ClientHandler {
public:
    explicit ConnectedHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::Connected,
                        {GameState::MapTransferInitiated, GameState::MapTransferComplete,
                         GameState::ConnectionLost, GameState::Error})
    {
    }
};

// ============================================================================
// Map transfer
// ============================================================================

class InitiatedHandler final : public ClientHandler {
public:
    explicit InitiatedHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapTransferInitiated,
                        {GameState::MapTransferTransferring, GameState::MapTransferComplete,
                         GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& c) override {
        ctx_.session.bulkWait = 0.0f;
        if (ctx_.session.expected) {
            c.set_data("map_id", ctx_.session.expected->mapId);
            c.set_data("total_chunks", ctx_.session.expected->totalChunks);
        }
        if (!ctx_.bulkConnected() && ctx_.connectBulk) {
            ctx_.connectBulk();
        }
    }

    void on_exit(GameStateContext& c) override {
        c.remove_data("map_id");
        c.remove_data("total_chunks");
    }

    void on_update(GameStateContext& /*c*/, float dt) override {
        if (ctx_.bulkConnected()) {
            go(GameState::MapTransferTransferring);
            return;
        }
        ctx_.session.bulkWait += dt;
        if (ctx_.session.bulkWait >= ctx_.config.bulk_connect_timeout) {
            fail("bulk connection timed out");
        }
    }
};

class TransferringHandler final : public ClientHandler {
public:
    explicit TransferringHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapTransferTransferring,
                        {GameState::MapTransferReassembling, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.stallTime = 0.0f;
        report_receive_progress();
    }

    void on_update(GameStateContext& /*c*/, float dt) override {
        if (ctx_.session.buffer.is_complete()) {
            go(GameState::MapTransferReassembling);
            return;
        }
        if (stalled(dt)) {
            fail("map transfer stalled at chunk " +
                 std::to_string(ctx_.session.buffer.chunks_received()) + "/" +
                 std::to_string(ctx_.session.buffer.total_chunks()));
        }
    }
};

class ReassemblingHandler final : public ClientHandler {
public:
    explicit ReassemblingHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapTransferReassembling,
                        {GameState::MapTransferBuildingAssets, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_update(GameStateContext& /*c*/, float /*dt*/) override {
        if (reassemble_and_decode(ctx_)) {
            go(GameState::MapTransferBuildingAssets);
        }
    }
};

class BuildingAssetsHandler final : public ClientHandler {
public:
    explicit BuildingAssetsHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapTransferBuildingAssets,
                        {GameState::MapTransferComplete, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_update(GameStateContext& /*c*/, float /*dt*/) override {
        if (!apply_decoded()) return;
        if (ctx_.world.world_ready()) {
            go(GameState::MapTransferComplete);
        }
    }
};

class CompleteHandler final : public ClientHandler {
public:
    explicit CompleteHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapTransferComplete,
                        {GameState::Playing, GameState::MapTransferInitiated,
                         GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.release_chunks();
        ctx_.manager.update_progress(1.0f);
    }
};

// ============================================================================
// Play
// ============================================================================

class PlayingHandler final : public ClientHandler {
public:
    explicit PlayingHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::Playing,
                        {GameState::MapRegenerationCleanup, GameState::MapTransferComplete,
                         GameState::Lobby, GameState::ConnectionLost, GameState::Error})
    {
    }
};

// ============================================================================
// Map regeneration
// ============================================================================

class CleanupHandler final : public ClientHandler {
public:
    explicit CleanupHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapRegenerationCleanup,
                        {GameState::MapRegenerationDownloading, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& c) override {
        ctx_.world.release_world();
        if (!ctx_.session.regenerationReason.empty()) {
            c.set_data("reason", ctx_.session.regenerationReason);
        }
    }

    void on_exit(GameStateContext& c) override {
        c.remove_data("reason");
    }

    void on_update(GameStateContext& /*c*/, float /*dt*/) override {
        go(GameState::MapRegenerationDownloading);
    }
};

class DownloadingHandler final : public ClientHandler {
public:
    explicit DownloadingHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapRegenerationDownloading,
                        {GameState::MapRegenerationRebuilding, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.stallTime = 0.0f;
        if (!ctx_.bulkConnected() && ctx_.connectBulk) {
            ctx_.connectBulk();
        }
    }

    void on_update(GameStateContext& /*c*/, float dt) override {
        auto& s = ctx_.session;
        if (s.has_transfer() && s.buffer.is_complete()) {
            go(GameState::MapRegenerationRebuilding);
            return;
        }
        if (s.has_transfer()) {
            report_receive_progress();
        }
        if (stalled(dt)) {
            fail(s.has_transfer() ? "map download stalled" : "no map announced after regeneration");
        }
    }
};

class RebuildingHandler final : public ClientHandler {
public:
    explicit RebuildingHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapRegenerationRebuilding,
                        {GameState::MapRegenerationComplete, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_update(GameStateContext& /*c*/, float /*dt*/) override {
        auto& s = ctx_.session;
        if (!s.worldApplied && !s.decoded && !reassemble_and_decode(ctx_)) {
            return;
        }
        if (!apply_decoded()) return;
        if (ctx_.world.world_ready()) {
            go(GameState::MapRegenerationComplete);
        }
    }
};

class RegenerationCompleteHandler final : public ClientHandler {
public:
    explicit RegenerationCompleteHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::MapRegenerationComplete,
                        {GameState::Playing, GameState::ConnectionLost, GameState::Error})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.release_chunks();
        ctx_.manager.update_progress(1.0f);
    }
};

// ============================================================================
// Failure
// ============================================================================

class ConnectionLostHandler final : public ClientHandler {
public:
    explicit ConnectionLostHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::ConnectionLost, {GameState::Lobby, GameState::Connecting})
    {
    }

    void on_enter(GameStateContext& /*c*/) override {
        ctx_.session.clear();
    }
};

class ErrorHandler final : public ClientHandler {
public:
    explicit ErrorHandler(HandlerContext& ctx)
        : ClientHandler(ctx, GameState::Error, {GameState::Lobby})
    {
    }

    void on_enter(GameStateContext& c) override {
        ctx_.session.clear();
        if (const auto* msg = c.get_data<std::string>(GameStateManager::kErrorMessageKey)) {
            ctx_.manager.update_progress(0.0f, *msg);
        }
    }

    void on_exit(GameStateContext& c) override {
        c.remove_data(GameStateManager::kErrorMessageKey);
    }
};

} // namespace

bool reassemble_and_decode(HandlerContext& ctx) {
    auto& s = ctx.session;
    try {
        auto bytes = s.buffer.reassemble();

        auto decoded = std::make_shared<world::WorldSnapshot>();
        std::string err;
        if (!world::decode_world(bytes, decoded.get(), &err)) {
            ctx.manager.transition_to_error("DeserializationError: " + err);
            return false;
        }
        if (s.expected && decoded->mapId != s.expected->mapId) {
            logf(LogLevel::Warning, kTag, "world announced as '%s' decodes as '%s'",
                 s.expected->mapId.c_str(), decoded->mapId.c_str());
        }

        logf(LogLevel::Info, kTag, "decoded world '%s' (%dx%dx%d, %zu bytes)", decoded->mapId.c_str(),
             decoded->width, decoded->height, decoded->depth, bytes.size());
        s.decoded = std::move(decoded);
        s.buffer.clear();
        return true;
    } catch (const transfer::TransferError& e) {
        ctx.manager.transition_to_error(std::string("DeserializationError: ") + e.what());
        return false;
    }
}

void register_transfer_handlers(HandlerContext& ctx) {
    auto& m = ctx.manager;
    m.register_handler(std::make_unique<LobbyHandler>(ctx));
    m.register_handler(std::make_unique<ConnectingHandler>(ctx));
    m.register_handler(std::make_unique<ConnectedHandler>(ctx));
    m.register_handler(std::make_unique<InitiatedHandler>(ctx));
    m.register_handler(std::make_unique<TransferringHandler>(ctx));
    m.register_handler(std::make_unique<ReassemblingHandler>(ctx));
    m.register_handler(std::make_unique<BuildingAssetsHandler>(ctx));
    m.register_handler(std::make_unique<CompleteHandler>(ctx));
    m.register_handler(std::make_unique<PlayingHandler>(ctx));
    m.register_handler(std::make_unique<CleanupHandler>(ctx));
    m.register_handler(std::make_unique<DownloadingHandler>(ctx));
    m.register_handler(std::make_unique<RebuildingHandler>(ctx));
    m.register_handler(std::make_unique<RegenerationCompleteHandler>(ctx));
    m.register_handler(std::make_unique<ConnectionLostHandler>(ctx));
    m.register_handler(std::make_unique<ErrorHandler>(ctx));
}

} // namespace mapsync::client
