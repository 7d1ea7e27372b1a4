#pragma once

// ClientRegistry - Per-client profiles, keyed by gameplay connection.
// Written from the message path, read by transfer workers on the tick thread.

#include <mapsync/core/types.hpp>
#include <mapsync/state/game_state.hpp>
#include <mapsync/transfer/transfer_channels.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mapsync::server {

struct ClientProfile {
    enum class Status : std::uint8_t {
        Connected,
        Disconnected,
    };

    ClientId gameplayId{kInvalidClientId};
    std::string clientUniqueId;
    std::string userName;

    // Raw state name last reported by the client (ClientStateChange.newState).
    std::string currentState;
    std::uint64_t stateSequence{0};

    Status status{Status::Connected};

    bool identified() const { return !clientUniqueId.empty(); }
};

class ClientRegistry {
public:
    ClientRegistry() = default;

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    void on_connect(ClientId gameplayId);

    /// Binds an identity to a connection. A disconnected profile with the
    /// same unique id is restored (its last reported state and name carry over
    /// unless a new name is given). Returns true if a profile was restored.
    bool identify(ClientId gameplayId, const std::string& uniqueId, const std::string& userName);

    /// Returns false for an unknown connection.
    bool set_state(ClientId gameplayId, const std::string& stateName);

    /// Moves an identified profile to the disconnected set; anonymous ones are dropped.
    void on_disconnect(ClientId gameplayId);

    std::optional<ClientProfile> find(ClientId gameplayId) const;
    std::optional<ClientProfile> find_inactive(const std::string& uniqueId) const;

    std::optional<std::string> unique_id(ClientId gameplayId) const;

    /// Sequence 0 for an unknown connection or one that never reported.
    transfer::ReportedState reported_state(ClientId gameplayId) const;

    bool is_connected(ClientId gameplayId) const;
    std::vector<ClientId> connected() const;
    std::vector<ClientProfile> connected_profiles() const;

    std::size_t connected_count() const;
    std::size_t inactive_count() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<ClientId, ClientProfile> active_;
    std::unordered_map<std::string, ClientProfile> inactive_;
    std::uint64_t nextSequence_{1};
};

} // namespace mapsync::server
