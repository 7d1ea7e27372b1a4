#pragma once

#include <algorithm>
#include <any>
#include <chrono>
#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>

namespace mapsync::state {

template <typename State>
class StateManager;

/// Arbitrary key/value data attached to the running state.
using StateData = std::unordered_map<std::string, std::any>;

// ============================================================================
// StateContext - Current/previous state, progress, status and scoped data
// ============================================================================

/// Only the owning StateManager changes the state, progress and status.
/// Handlers and callers may read everything and edit the data map.
template <typename State>
class StateContext {
    friend class StateManager<State>;

public:
    using Clock = std::chrono::steady_clock;

    static constexpr float kProgressNotifyEpsilon = 0.01f;

    explicit StateContext(State initial)
        : current_(initial)
        , previous_(initial)
        , status_(default_description(initial))
        , enteredAt_(Clock::now())
        , updatedAt_(enteredAt_)
    {
    }

    State current_state() const { return current_; }
    State previous_state() const { return previous_; }

    float progress() const { return progress_; }
    const std::string& status_message() const { return status_; }

    Clock::time_point state_entered_at() const { return enteredAt_; }
    Clock::time_point last_updated_at() const { return updatedAt_; }

    double seconds_in_state() const {
        return std::chrono::duration<double>(Clock::now() - enteredAt_).count();
    }

    // --- State-scoped data ---

    template <typename T>
    void set_data(const std::string& key, T value) {
        data_[key] = std::move(value);
        touch();
    }

    /// nullptr when the key is missing or holds another type.
    template <typename T>
    const T* get_data(const std::string& key) const {
        auto it = data_.find(key);
        return it == data_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    template <typename T>
    T get_data_or(const std::string& key, T fallback) const {
        const T* v = get_data<T>(key);
        return v ? *v : fallback;
    }

    bool has_data(const std::string& key) const { return data_.count(key) != 0; }
    void remove_data(const std::string& key) { data_.erase(key); }
    void clear_data() { data_.clear(); }
    std::size_t data_size() const { return data_.size(); }

private:
    void enter_state(State next) {
        previous_ = current_;
        current_ = next;
        progress_ = 0.0f;
        status_ = default_description(next);
        enteredAt_ = Clock::now();
        updatedAt_ = enteredAt_;
    }

    void merge_data(StateData data) {
        for (auto& [key, value] : data) {
            data_[key] = std::move(value);
        }
    }

    /// Returns true when listeners should hear about the change.
    bool set_progress(float progress, std::string status) {
        const float clamped = std::clamp(progress, 0.0f, 1.0f);
        const bool moved = std::fabs(clamped - progress_) > kProgressNotifyEpsilon;
        const bool statusChanged = !status.empty() && status != status_;

        progress_ = clamped;
        if (!status.empty()) {
            status_ = std::move(status);
        }
        touch();
        return moved || statusChanged;
    }

    void touch() { updatedAt_ = Clock::now(); }

    State current_;
    State previous_;
    float progress_{0.0f};
    std::string status_;
    StateData data_;
    Clock::time_point enteredAt_;
    Clock::time_point updatedAt_;
};

} // namespace mapsync::state
