#pragma once

#include "types.hpp"

namespace mapsync {

// ============================================================================
// IEngineServices - Engine provides this to the server application
// ============================================================================

class IEngineServices {
public:
    virtual ~IEngineServices() = default;

    /// Current server tick (increments each fixed-timestep update).
    virtual Tick current_tick() const = 0;

    /// Server tick rate (ticks per second).
    virtual float tick_rate() const = 0;

    /// Fixed delta time per tick (1.0 / tick_rate).
    virtual float tick_dt() const = 0;
};

// ============================================================================
// IServerApp - Application driven by ServerEngine's tick loop
// ============================================================================

class IServerApp {
public:
    virtual ~IServerApp() = default;

    /// Called once when engine starts.
    virtual void on_init(IEngineServices& engine) = 0;

    /// Called once per tick. The app polls its own transports here.
    virtual void on_tick(float dt) = 0;

    /// Called once when engine shuts down.
    virtual void on_shutdown() = 0;
};

} // namespace mapsync
