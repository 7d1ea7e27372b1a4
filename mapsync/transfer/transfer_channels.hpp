#pragma once

#include <mapsync/core/types.hpp>
#include <mapsync/protocol/messages.hpp>
#include <mapsync/state/game_state.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mapsync::transfer {

enum class ChannelKind : std::uint8_t {
    Gameplay = 0,
    Bulk = 1,
};

const char* to_string(ChannelKind kind);

/// Last state a client reported. `sequence` grows with every report, so a
/// worker can tell reports made after its TransferBegin from older ones.
/// sequence 0 means the client never reported; state is empty for a name
/// this build does not know.
struct ReportedState {
    std::optional<state::GameState> state;
    std::uint64_t sequence{0};
};

// ============================================================================
// ITransferChannels - What workers need from the server
// ============================================================================

/// Workers are keyed by gameplay ClientId. The bulk connection is found via
/// the client's unique id; a nullopt answer means "not yet, ask again next tick".
class ITransferChannels {
public:
    virtual ~ITransferChannels() = default;

    // --- Client profiles ---

    virtual std::optional<std::string> unique_id_for(ClientId gameplayId) const = 0;
    virtual ReportedState reported_state(ClientId gameplayId) const = 0;
    virtual bool is_gameplay_connected(ClientId gameplayId) const = 0;

    /// Gameplay ids of every connected client, identified or not.
    virtual std::vector<ClientId> connected_clients() const = 0;

    // --- Connections ---

    virtual std::optional<ClientId> bulk_connection_for(const std::string& uniqueId) const = 0;
    virtual std::size_t write_buffer_size(ChannelKind channel, ClientId id) const = 0;
    virtual void send(ChannelKind channel, ClientId id, const proto::Message& msg) = 0;
    virtual void broadcast_gameplay(const proto::Message& msg) = 0;
};

} // namespace mapsync::transfer
