#pragma once

#include "state_context.hpp"

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <vector>

namespace mapsync::state {

// ============================================================================
// StateHandler - Behaviour bound to one state
// ============================================================================

/// A handler declares the single state it handles and the states it may
/// leave to. The lifecycle hooks run on the tick thread.
template <typename State>
class StateHandler {
public:
    StateHandler(State handled, std::initializer_list<State> allowed)
        : handled_(handled)
        , allowed_(allowed)
    {
    }

    virtual ~StateHandler() = default;

    State handled_state() const { return handled_; }
    const std::vector<State>& allowed_transitions() const { return allowed_; }

    bool can_transition_to(State target) const {
        return std::find(allowed_.begin(), allowed_.end(), target) != allowed_.end();
    }

    virtual void on_enter(StateContext<State>& /*ctx*/) {}
    virtual void on_exit(StateContext<State>& /*ctx*/) {}
    virtual void on_update(StateContext<State>& /*ctx*/, float /*dt*/) {}

private:
    State handled_;
    std::vector<State> allowed_;
};

// ============================================================================
// IStateListener - Observes transitions and progress
// ============================================================================

template <typename State>
class IStateListener {
public:
    virtual ~IStateListener() = default;

    virtual void on_state_changed(State oldState, State newState, const StateContext<State>& ctx) = 0;
    virtual void on_progress_updated(const StateContext<State>& /*ctx*/) {}
};

/// Listener built from callbacks.
template <typename State>
class CallbackStateListener final : public IStateListener<State> {
public:
    std::function<void(State, State, const StateContext<State>&)> onStateChanged;
    std::function<void(const StateContext<State>&)> onProgressUpdated;

    void on_state_changed(State oldState, State newState, const StateContext<State>& ctx) override {
        if (onStateChanged) onStateChanged(oldState, newState, ctx);
    }

    void on_progress_updated(const StateContext<State>& ctx) override {
        if (onProgressUpdated) onProgressUpdated(ctx);
    }
};

} // namespace mapsync::state
