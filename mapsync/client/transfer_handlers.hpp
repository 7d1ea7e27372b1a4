#pragma once

// State handlers that carry a client from connection to play, including
// map transfer and map regeneration.

#include "transfer_session.hpp"
#include "world_integration.hpp"

#include <mapsync/core/config.hpp>
#include <mapsync/state/game_state.hpp>
#include <mapsync/state/state_manager.hpp>

#include <functional>

namespace mapsync::client {

using GameStateManager = state::StateManager<state::GameState>;
using GameStateContext = state::StateContext<state::GameState>;

/// Everything the handlers touch. Owned by MapClient.
struct HandlerContext {
    GameStateManager& manager;
    TransferSession& session;
    IWorldIntegration& world;
    const TransferConfig& config;

    /// Starts a bulk connection attempt if none is open or pending.
    std::function<void()> connectBulk;
    std::function<bool()> bulkConnected;
};

/// Registers one handler per GameState on ctx.manager.
void register_transfer_handlers(HandlerContext& ctx);

/// Reassembles the session's chunks and decodes the world into session.decoded.
/// On failure enters the error state with a "DeserializationError: ..." message.
bool reassemble_and_decode(HandlerContext& ctx);

} // namespace mapsync::client
