#pragma once

/**
 * @file scripted_client.hpp
 * @brief Protocol-level client over LocalTransport for server tests.
 *
 * Sends exactly what the test tells it to and records everything it receives
 * on both connections, so server behaviour can be checked message by message.
 */

#include <mapsync/protocol/serialization.hpp>
#include <mapsync/transfer/reassembly_buffer.hpp>
#include <mapsync/transport/local_transport.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace test_helpers {

class ScriptedClient {
public:
    ScriptedClient(mapsync::transport::LocalServerTransport& gameplayServer,
                   mapsync::transport::LocalServerTransport& bulkServer,
                   std::string uniqueId)
        : uniqueId_(std::move(uniqueId))
        , gameplay_(gameplayServer.connect_client())
        , bulk_(bulkServer.connect_client())
    {
        gameplay_->onReceive = [this](std::span<const std::uint8_t> d) { record(d, gameplayInbox_); };
        bulk_->onReceive = [this](std::span<const std::uint8_t> d) { record(d, bulkInbox_); };
    }

    /** @brief Sends ClientIdentification on both connections. */
    void identify(const std::string& name = "tester") {
        send_gameplay(mapsync::proto::ClientIdentification{uniqueId_, name});
        bulk_->send(mapsync::proto::serialize(mapsync::proto::ClientIdentification{uniqueId_, name}));
    }

    /** @brief Sends ClientStateChange from the last reported state. */
    void report(const std::string& newState) {
        send_gameplay(mapsync::proto::ClientStateChange{lastState_, newState});
        lastState_ = newState;
    }

    void send_gameplay(const mapsync::proto::Message& msg) { gameplay_->send(mapsync::proto::serialize(msg)); }

    void poll() {
        gameplay_->poll();
        bulk_->poll();
    }

    void disconnect() {
        gameplay_->disconnect();
        bulk_->disconnect();
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    const std::string& unique_id() const { return uniqueId_; }
    mapsync::ClientId gameplay_id() const { return gameplay_->id(); }
    bool gameplay_connected() const { return gameplay_->is_connected(); }

    const std::vector<mapsync::proto::Message>& gameplay_inbox() const { return gameplayInbox_; }
    const std::vector<mapsync::proto::Message>& bulk_inbox() const { return bulkInbox_; }

    template <typename T>
    std::vector<T> gameplay_of() const { return of<T>(gameplayInbox_); }

    template <typename T>
    std::vector<T> bulk_of() const { return of<T>(bulkInbox_); }

    /** @brief Rebuilds the blob from every MapChunk received for mapId. */
    std::vector<std::uint8_t> reassemble(const std::string& mapId) const {
        mapsync::transfer::ReassemblyBuffer buf;
        bool sized = false;
        for (const auto& c : bulk_of<mapsync::proto::MapChunk>()) {
            if (c.mapId != mapId) continue;
            if (!sized) {
                buf.reset(c.totalChunks, std::nullopt);
                sized = true;
            }
            buf.apply(c.chunkIndex, c.payload);
        }
        return buf.reassemble();
    }

    void clear() {
        gameplayInbox_.clear();
        bulkInbox_.clear();
    }

private:
    static void record(std::span<const std::uint8_t> data, std::vector<mapsync::proto::Message>& into) {
        if (auto msg = mapsync::proto::deserialize(data)) into.push_back(std::move(*msg));
    }

    template <typename T>
    static std::vector<T> of(const std::vector<mapsync::proto::Message>& msgs) {
        std::vector<T> out;
        for (const auto& m : msgs) {
            if (const T* v = std::get_if<T>(&m)) out.push_back(*v);
        }
        return out;
    }

    std::string uniqueId_;
    std::string lastState_{"Lobby"};
    std::shared_ptr<mapsync::transport::LocalClientTransport> gameplay_;
    std::shared_ptr<mapsync::transport::LocalClientTransport> bulk_;
    std::vector<mapsync::proto::Message> gameplayInbox_;
    std::vector<mapsync::proto::Message> bulkInbox_;
};

} // namespace test_helpers
