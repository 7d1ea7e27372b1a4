#include "local_transport.hpp"

namespace mapsync::transport {

using detail::LocalEvent;

// ============================================================================
// Factory
// ============================================================================

LocalTransportPair create_local_transport_pair() {
    auto server = LocalServerTransport::create();
    auto client = server->connect_client();
    return {client, server};
}

// ============================================================================
// LocalClientTransport
// ============================================================================

LocalClientTransport::LocalClientTransport(std::weak_ptr<LocalServerTransport> server, ClientId id)
    : server_(std::move(server))
    , id_(id)
{
    incoming_.push(LocalEvent{LocalEvent::Kind::Connect, id_, {}});
}

LocalClientTransport::~LocalClientTransport() {
    if (state_ != State::Disconnected) {
        state_ = State::Disconnected;
        if (auto srv = server_.lock()) {
            srv->post(LocalEvent{LocalEvent::Kind::Disconnect, id_, {}});
        }
    }
}

void LocalClientTransport::send(std::span<const std::uint8_t> data) {
    // Sending while the connect is pending is allowed; the server sees the
    // connect event first.
    if (state_ == State::Disconnected) return;

    if (auto srv = server_.lock()) {
        srv->post(LocalEvent{LocalEvent::Kind::Receive, id_,
                             std::vector<std::uint8_t>(data.begin(), data.end())});
    }
}

void LocalClientTransport::poll(std::uint32_t /*timeoutMs*/) {
    std::queue<LocalEvent> events;
    {
        std::lock_guard lock(mutex_);
        std::swap(events, incoming_);
    }

    while (!events.empty()) {
        LocalEvent& ev = events.front();
        switch (ev.kind) {
            case LocalEvent::Kind::Connect:
                if (state_ == State::Pending) {
                    state_ = State::Connected;
                    if (onConnect) onConnect();
                }
                break;

            case LocalEvent::Kind::Receive:
                pendingBytes_ -= ev.data.size();
                if (state_ == State::Connected && onReceive) {
                    onReceive(ev.data);
                }
                break;

            case LocalEvent::Kind::Disconnect:
                if (state_ != State::Disconnected) {
                    state_ = State::Disconnected;
                }
                if (onDisconnect) onDisconnect();
                break;
        }
        events.pop();
    }
}

void LocalClientTransport::disconnect() {
    if (state_ == State::Disconnected) return;
    state_ = State::Disconnected;

    {
        std::lock_guard lock(mutex_);
        std::queue<LocalEvent>().swap(incoming_);
        pendingBytes_ = 0;
    }

    if (auto srv = server_.lock()) {
        srv->post(LocalEvent{LocalEvent::Kind::Disconnect, id_, {}});
    }

    if (onDisconnect) {
        onDisconnect();
    }
}

void LocalClientTransport::deliver(std::vector<std::uint8_t> data) {
    if (state_ == State::Disconnected) return;

    std::lock_guard lock(mutex_);
    pendingBytes_ += data.size();
    incoming_.push(LocalEvent{LocalEvent::Kind::Receive, id_, std::move(data)});
}

void LocalClientTransport::remote_disconnect() {
    if (state_ == State::Disconnected) return;
    state_ = State::Disconnected;

    std::lock_guard lock(mutex_);
    incoming_.push(LocalEvent{LocalEvent::Kind::Disconnect, id_, {}});
}

// ============================================================================
// LocalServerTransport
// ============================================================================

std::shared_ptr<LocalServerTransport> LocalServerTransport::create() {
    return std::shared_ptr<LocalServerTransport>(new LocalServerTransport());
}

std::shared_ptr<LocalClientTransport> LocalServerTransport::connect_client() {
    std::lock_guard lock(mutex_);
    const ClientId id = nextClientId_++;

    auto client = std::shared_ptr<LocalClientTransport>(
        new LocalClientTransport(weak_from_this(), id));
    clients_[id] = client;
    incoming_.push(LocalEvent{LocalEvent::Kind::Connect, id, {}});
    return client;
}

void LocalServerTransport::send(ClientId id, std::span<const std::uint8_t> data) {
    if (accepted_.count(id) == 0) return;

    if (auto cli = find_client(id)) {
        cli->deliver(std::vector<std::uint8_t>(data.begin(), data.end()));
    }
}

void LocalServerTransport::broadcast(std::span<const std::uint8_t> data) {
    for (ClientId id : accepted_) {
        send(id, data);
    }
}

void LocalServerTransport::poll(std::uint32_t /*timeoutMs*/) {
    std::queue<LocalEvent> events;
    {
        std::lock_guard lock(mutex_);
        std::swap(events, incoming_);
    }

    while (!events.empty()) {
        LocalEvent& ev = events.front();
        switch (ev.kind) {
            case LocalEvent::Kind::Connect:
                accepted_.insert(ev.id);
                if (onClientConnect) onClientConnect(ev.id);
                break;

            case LocalEvent::Kind::Receive:
                if (accepted_.count(ev.id) != 0 && onReceive) {
                    onReceive(ev.id, ev.data);
                }
                break;

            case LocalEvent::Kind::Disconnect:
                if (accepted_.erase(ev.id) != 0 && onClientDisconnect) {
                    onClientDisconnect(ev.id);
                }
                {
                    std::lock_guard lock(mutex_);
                    clients_.erase(ev.id);
                }
                break;
        }
        events.pop();
    }
}

void LocalServerTransport::disconnect(ClientId id) {
    if (accepted_.erase(id) == 0) return;

    if (auto cli = find_client(id)) {
        cli->remote_disconnect();
    }
    {
        std::lock_guard lock(mutex_);
        clients_.erase(id);
    }

    if (onClientDisconnect) {
        onClientDisconnect(id);
    }
}

std::size_t LocalServerTransport::write_buffer_size(ClientId id) const {
    auto cli = find_client(id);
    return cli ? cli->pending_bytes() : 0;
}

void LocalServerTransport::post(LocalEvent event) {
    std::lock_guard lock(mutex_);
    incoming_.push(std::move(event));
}

std::shared_ptr<LocalClientTransport> LocalServerTransport::find_client(ClientId id) const {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(id);
    return it != clients_.end() ? it->second.lock() : nullptr;
}

} // namespace mapsync::transport
