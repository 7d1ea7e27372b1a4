#pragma once

#include "state_context.hpp"
#include "state_handler.hpp"

#include <mapsync/core/logger.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mapsync::state {

// ============================================================================
// StateManager - Validated finite state machine with lifecycle hooks
// ============================================================================

/// Drives one StateContext through the handlers registered for each state.
///
/// State is an enum with `to_string(State)` and `default_description(State)`
/// reachable by argument-dependent lookup.
///
/// - request_state_change() is single-flight: a request issued while another
///   transition is running (from a hook, a listener or another thread) is
///   rejected, never queued.
/// - A target is legal only if the current handler lists it. With no handler
///   registered for the current state any target is accepted.
/// - Exceptions thrown by handlers and listeners are logged and contained.
template <typename State>
class StateManager {
public:
    using Handler = StateHandler<State>;
    using Listener = IStateListener<State>;
    using Context = StateContext<State>;

    explicit StateManager(State initial,
                          std::optional<State> errorState = std::nullopt,
                          std::string name = "state")
        : context_(initial)
        , errorState_(errorState)
        , name_(std::move(name))
    {
        logf(LogLevel::Debug, name_.c_str(), "initialized in %s", to_string(initial));
    }

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    // --- Handlers ---

    /// Replaces any handler already registered for the same state.
    Handler& register_handler(std::unique_ptr<Handler> handler) {
        const State s = handler->handled_state();
        auto [it, inserted] = handlers_.insert_or_assign(s, std::move(handler));
        if (!inserted) {
            logf(LogLevel::Warning, name_.c_str(), "replaced handler for %s", to_string(s));
        }
        return *it->second;
    }

    void unregister_handler(State s) { handlers_.erase(s); }

    Handler* handler_for(State s) const {
        auto it = handlers_.find(s);
        return it == handlers_.end() ? nullptr : it->second.get();
    }

    // --- Listeners ---

    void add_listener(std::shared_ptr<Listener> listener) {
        if (listener) listeners_.push_back(std::move(listener));
    }

    void remove_listener(const Listener* listener) {
        std::erase_if(listeners_, [listener](const auto& l) { return l.get() == listener; });
    }

    // --- Queries ---

    State current_state() const { return context_.current_state(); }
    const Context& context() const { return context_; }
    Context& context() { return context_; }
    bool is_transitioning() const { return transitioning_; }

    bool can_transition_to(State target) const {
        const Handler* h = handler_for(context_.current_state());
        return h == nullptr || h->can_transition_to(target);
    }

    // --- Transitions ---

    /// Returns true if the machine is in `next` afterwards.
    bool request_state_change(State next, StateData data = {}) {
        bool expected = false;
        if (!transitioning_.compare_exchange_strong(expected, true)) {
            logf(LogLevel::Warning, name_.c_str(),
                 "transition already in progress, ignoring request to %s", to_string(next));
            return false;
        }
        TransitionGuard guard(transitioning_);

        const State current = context_.current_state();
        if (next == current) {
            logf(LogLevel::Debug, name_.c_str(), "already in %s", to_string(next));
            return true;
        }

        Handler* oldHandler = handler_for(current);
        if (oldHandler == nullptr) {
            logf(LogLevel::Warning, name_.c_str(),
                 "no handler for %s, allowing transition to %s", to_string(current), to_string(next));
        } else if (!oldHandler->can_transition_to(next)) {
            logf(LogLevel::Error, name_.c_str(), "invalid transition from %s to %s",
                 to_string(current), to_string(next));
            return false;
        }

        logf(LogLevel::Info, name_.c_str(), "transitioning from %s to %s",
             to_string(current), to_string(next));

        if (oldHandler) {
            try {
                oldHandler->on_exit(context_);
            } catch (const std::exception& e) {
                logf(LogLevel::Error, name_.c_str(), "error exiting %s: %s", to_string(current), e.what());
            }
        }

        context_.enter_state(next);
        context_.merge_data(std::move(data));

        if (Handler* newHandler = handler_for(next)) {
            try {
                newHandler->on_enter(context_);
            } catch (const std::exception& e) {
                logf(LogLevel::Error, name_.c_str(), "error entering %s: %s", to_string(next), e.what());
            }
        } else {
            logf(LogLevel::Warning, name_.c_str(), "no handler registered for %s", to_string(next));
        }

        notify_state_changed(current, next);
        return true;
    }

    /// Stores `error_message` in the context and enters the error state.
    bool transition_to_error(const std::string& message) {
        if (!errorState_) {
            logf(LogLevel::Error, name_.c_str(), "error without error state: %s", message.c_str());
            return false;
        }

        logf(LogLevel::Error, name_.c_str(), "%s", message.c_str());
        context_.set_data(kErrorMessageKey, message);
        return request_state_change(*errorState_);
    }

    /// Clamped to [0,1]. An empty status keeps the current one.
    void update_progress(float progress, std::string status = {}) {
        if (context_.set_progress(progress, std::move(status))) {
            notify_progress();
        }
    }

    /// Dispatches to the current handler unless a transition is running.
    void update(float dt) {
        if (transitioning_) return;

        Handler* h = handler_for(context_.current_state());
        if (!h) return;

        try {
            h->on_update(context_, dt);
        } catch (const std::exception& e) {
            logf(LogLevel::Error, name_.c_str(), "error updating %s: %s",
                 to_string(context_.current_state()), e.what());
        }
    }

    static constexpr const char* kErrorMessageKey = "error_message";

private:
    class TransitionGuard {
    public:
        explicit TransitionGuard(std::atomic<bool>& flag) : flag_(flag) {}
        ~TransitionGuard() { flag_ = false; }

        TransitionGuard(const TransitionGuard&) = delete;
        TransitionGuard& operator=(const TransitionGuard&) = delete;

    private:
        std::atomic<bool>& flag_;
    };

    void notify_state_changed(State oldState, State newState) {
        auto listeners = listeners_;
        for (auto& l : listeners) {
            try {
                l->on_state_changed(oldState, newState, context_);
            } catch (const std::exception& e) {
                logf(LogLevel::Error, name_.c_str(), "state listener failed: %s", e.what());
            }
        }
    }

    void notify_progress() {
        auto listeners = listeners_;
        for (auto& l : listeners) {
            try {
                l->on_progress_updated(context_);
            } catch (const std::exception& e) {
                logf(LogLevel::Error, name_.c_str(), "progress listener failed: %s", e.what());
            }
        }
    }

    Context context_;
    std::optional<State> errorState_;
    std::string name_;

    std::unordered_map<State, std::unique_ptr<Handler>> handlers_;
    std::vector<std::shared_ptr<Listener>> listeners_;
    std::atomic<bool> transitioning_{false};
};

} // namespace mapsync::state
