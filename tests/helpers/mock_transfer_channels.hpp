#pragma once

/**
 * @file mock_transfer_channels.hpp
 * @brief Scriptable ITransferChannels for worker and coordinator tests.
 *
 * Records every message sent and lets tests set identities, reported states,
 * bulk bindings and write buffer sizes per connection.
 */

#include <mapsync/transfer/transfer_channels.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace test_helpers {

class MockTransferChannels final : public mapsync::transfer::ITransferChannels {
public:
    using ChannelKind = mapsync::transfer::ChannelKind;
    using GameState = mapsync::state::GameState;

    struct Sent {
        ChannelKind channel;
        mapsync::ClientId id;
        mapsync::proto::Message msg;
    };

    struct Client {
        bool connected{true};
        std::optional<std::string> uniqueId;
        mapsync::transfer::ReportedState reported;
    };

    // =========================================================================
    // Test setup
    // =========================================================================

    /** @brief Adds a connected gameplay client, identified if uniqueId is non-empty. */
    void add_client(mapsync::ClientId id, const std::string& uniqueId = {}) {
        Client c;
        if (!uniqueId.empty()) c.uniqueId = uniqueId;
        clients_[id] = c;
    }

    void identify(mapsync::ClientId id, const std::string& uniqueId) { clients_[id].uniqueId = uniqueId; }

    void drop_client(mapsync::ClientId id) { clients_[id].connected = false; }

    /** @brief Simulates a ClientStateChange from the client. */
    void report(mapsync::ClientId id, GameState state) {
        clients_[id].reported.state = state;
        clients_[id].reported.sequence = ++sequence_;
    }

    void bind_bulk(const std::string& uniqueId, mapsync::ClientId bulkId) { bulk_[uniqueId] = bulkId; }
    void unbind_bulk(const std::string& uniqueId) { bulk_.erase(uniqueId); }

    void set_write_buffer(ChannelKind channel, mapsync::ClientId id, std::size_t bytes) {
        writeBuffer_[{channel, id}] = bytes;
    }

    /** @brief Each MapChunk sent adds its payload size to the connection's write buffer. */
    void set_accumulate_writes(bool on) { accumulate_ = on; }

    void clear_sent() {
        sent_.clear();
        broadcasts_.clear();
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    const std::vector<Sent>& sent() const { return sent_; }
    const std::vector<mapsync::proto::Message>& broadcasts() const { return broadcasts_; }

    template <typename T>
    std::vector<T> sent_of(mapsync::ClientId id, std::optional<ChannelKind> channel = std::nullopt) const {
        std::vector<T> out;
        for (const auto& s : sent_) {
            if (s.id != id) continue;
            if (channel && s.channel != *channel) continue;
            if (const T* m = std::get_if<T>(&s.msg)) out.push_back(*m);
        }
        return out;
    }

    std::size_t chunk_count(mapsync::ClientId id, ChannelKind channel) const {
        return sent_of<mapsync::proto::MapChunk>(id, channel).size();
    }

    // =========================================================================
    // ITransferChannels
    // =========================================================================

    std::optional<std::string> unique_id_for(mapsync::ClientId id) const override {
        auto it = clients_.find(id);
        if (it == clients_.end() || !it->second.connected) return std::nullopt;
        return it->second.uniqueId;
    }

    mapsync::transfer::ReportedState reported_state(mapsync::ClientId id) const override {
        auto it = clients_.find(id);
        if (it == clients_.end()) return {};
        return it->second.reported;
    }

    bool is_gameplay_connected(mapsync::ClientId id) const override {
        auto it = clients_.find(id);
        return it != clients_.end() && it->second.connected;
    }

    std::vector<mapsync::ClientId> connected_clients() const override {
        std::vector<mapsync::ClientId> ids;
        for (const auto& [id, c] : clients_) {
            if (c.connected) ids.push_back(id);
        }
        return ids;
    }

    std::optional<mapsync::ClientId> bulk_connection_for(const std::string& uniqueId) const override {
        auto it = bulk_.find(uniqueId);
        if (it == bulk_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t write_buffer_size(ChannelKind channel, mapsync::ClientId id) const override {
        auto it = writeBuffer_.find({channel, id});
        return it == writeBuffer_.end() ? 0 : it->second;
    }

    void send(ChannelKind channel, mapsync::ClientId id, const mapsync::proto::Message& msg) override {
        if (accumulate_) {
            if (const auto* chunk = std::get_if<mapsync::proto::MapChunk>(&msg)) {
                writeBuffer_[{channel, id}] += chunk->payload.size();
            }
        }
        sent_.push_back(Sent{channel, id, msg});
    }

    void broadcast_gameplay(const mapsync::proto::Message& msg) override {
        broadcasts_.push_back(msg);
    }

private:
    std::map<mapsync::ClientId, Client> clients_;
    std::map<std::string, mapsync::ClientId> bulk_;
    std::map<std::pair<ChannelKind, mapsync::ClientId>, std::size_t> writeBuffer_;
    std::vector<Sent> sent_;
    std::vector<mapsync::proto::Message> broadcasts_;
    std::uint64_t sequence_{0};
    bool accumulate_{false};
};

} // namespace test_helpers
