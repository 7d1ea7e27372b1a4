#pragma once

#include "transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mapsync::transport {

// ============================================================================
// LocalTransport - In-process transport for tests and single-process runs
// ============================================================================

/// One LocalServerTransport accepts any number of LocalClientTransports.
/// Events (connect, data, disconnect) are queued and delivered in order on the
/// receiving side's poll(). Data sent by the server counts toward
/// write_buffer_size() until the client polls it.

class LocalClientTransport;
class LocalServerTransport;

struct LocalTransportPair {
    std::shared_ptr<LocalClientTransport> client;
    std::shared_ptr<LocalServerTransport> server;
};

LocalTransportPair create_local_transport_pair();

namespace detail {

struct LocalEvent {
    enum class Kind : std::uint8_t { Connect, Receive, Disconnect };

    Kind kind{Kind::Receive};
    ClientId id{kInvalidClientId};
    std::vector<std::uint8_t> data;
};

} // namespace detail

// ============================================================================
// LocalClientTransport
// ============================================================================

class LocalClientTransport : public IClientTransport {
    friend class LocalServerTransport;

public:
    ~LocalClientTransport() override;

    void send(std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    bool is_connected() const override { return state_ == State::Connected; }
    void disconnect() override;

    ClientId id() const { return id_; }

    /// Bytes the server has sent that this client has not polled yet.
    std::size_t pending_bytes() const { return pendingBytes_; }

private:
    enum class State : std::uint8_t { Pending, Connected, Disconnected };

    LocalClientTransport(std::weak_ptr<LocalServerTransport> server, ClientId id);

    void deliver(std::vector<std::uint8_t> data);
    void remote_disconnect();

    std::weak_ptr<LocalServerTransport> server_;
    ClientId id_;

    std::mutex mutex_;
    std::queue<detail::LocalEvent> incoming_;
    std::atomic<std::size_t> pendingBytes_{0};
    std::atomic<State> state_{State::Pending};
};

// ============================================================================
// LocalServerTransport
// ============================================================================

class LocalServerTransport : public IServerTransport,
                             public std::enable_shared_from_this<LocalServerTransport> {
    friend class LocalClientTransport;

public:
    static std::shared_ptr<LocalServerTransport> create();

    /// Creates a client linked to this server. The connect event is delivered
    /// to both sides on their next poll().
    std::shared_ptr<LocalClientTransport> connect_client();

    void send(ClientId id, std::span<const std::uint8_t> data) override;
    void broadcast(std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    void disconnect(ClientId id) override;
    std::size_t write_buffer_size(ClientId id) const override;

    std::size_t connected_count() const { return accepted_.size(); }

private:
    LocalServerTransport() = default;

    void post(detail::LocalEvent event);
    std::shared_ptr<LocalClientTransport> find_client(ClientId id) const;

    mutable std::mutex mutex_;
    std::queue<detail::LocalEvent> incoming_;
    std::unordered_map<ClientId, std::weak_ptr<LocalClientTransport>> clients_;
    ClientId nextClientId_{1};

    // Tick thread only.
    std::unordered_set<ClientId> accepted_;
};

} // namespace mapsync::transport
