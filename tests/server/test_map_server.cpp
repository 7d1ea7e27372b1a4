/**
 * @file test_map_server.cpp
 * @brief Tests for MapServer phases, late joiners and regeneration.
 *
 * Clients are scripted at the protocol level over LocalTransport.
 */

#include <catch2/catch.hpp>

#include <mapsync/server/map_server.hpp>

#include "helpers/scripted_client.hpp"
#include "helpers/test_utils.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mapsync;
using namespace mapsync::server;
using namespace mapsync::transport;
using namespace test_helpers;

namespace {

constexpr float kDt = 1.0f / 30.0f;

struct ServerFixture {
    std::shared_ptr<LocalServerTransport> gameplay = LocalServerTransport::create();
    std::shared_ptr<LocalServerTransport> bulk = LocalServerTransport::create();
    TransferConfig config;
    std::unique_ptr<MapServer> server;
    std::vector<std::unique_ptr<ScriptedClient>> clients;
    std::vector<std::pair<ServerPhase, ServerPhase>> phaseChanges;

    explicit ServerFixture(TransferConfig cfg = {}) : config(cfg) {
        server = std::make_unique<MapServer>(gameplay, bulk, config);
        server->onPhaseChanged = [this](ServerPhase a, ServerPhase b) { phaseChanges.emplace_back(a, b); };
    }

    ScriptedClient& add_client(const std::string& uid) {
        clients.push_back(std::make_unique<ScriptedClient>(*gameplay, *bulk, uid));
        return *clients.back();
    }

    /** @brief One server tick followed by every client polling. */
    void tick(int n = 1) {
        for (int i = 0; i < n; ++i) {
            server->on_tick(kDt);
            for (auto& c : clients) c->poll();
        }
    }

    /** @brief Drives one client through a complete first transfer. */
    void deliver(ScriptedClient& c) {
        c.report("Connected");
        tick();
        c.report("MapTransferTransferring");
        tick(2);
        c.report("MapTransferComplete");
        tick();
    }
};

} // namespace

// =============================================================================
// Phases
// =============================================================================

TEST_CASE("Server starts idle", "[server][map_server][phase]") {
    ServerFixture f;
    f.tick(3);

    REQUIRE(f.server->phase() == ServerPhase::Idle);
    REQUIRE(f.server->current_map_id().empty());
}

TEST_CASE("Publishing with no clients waits for clients", "[server][map_server][phase]") {
    ServerFixture f;
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();

    REQUIRE(f.server->current_map_id() == "map-1");
    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);

    f.tick(5);
    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);

    REQUIRE(f.phaseChanges.size() == 2);
    REQUIRE(f.phaseChanges[0] == std::make_pair(ServerPhase::Idle, ServerPhase::Transferring));
    REQUIRE(f.phaseChanges[1] == std::make_pair(ServerPhase::Transferring, ServerPhase::WaitingForClients));
}

TEST_CASE("Null worlds are ignored", "[server][map_server]") {
    ServerFixture f;
    f.server->publish_world(nullptr);
    f.tick();
    REQUIRE(f.server->phase() == ServerPhase::Idle);
}

TEST_CASE("One client goes from transfer to play", "[server][map_server][phase]") {
    ServerFixture f;
    auto blob = make_small_world_blob("map-1");
    auto& c = f.add_client("client-a");
    c.identify();
    f.server->publish_world(blob);

    f.tick();
    REQUIRE(f.server->phase() == ServerPhase::Transferring);
    REQUIRE(f.server->registry().unique_id(c.gameplay_id()) == std::optional<std::string>("client-a"));

    auto begins = c.gameplay_of<proto::TransferBegin>();
    REQUIRE(begins.size() == 1);
    REQUIRE(begins[0].mapId == "map-1");
    REQUIRE(begins[0].totalSize == static_cast<std::int64_t>(blob->total_size()));
    REQUIRE(c.bulk_of<proto::MapChunk>().empty());

    c.report("MapTransferTransferring");
    f.tick(2);

    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);
    REQUIRE(c.reassemble("map-1") == blob->bytes);
    REQUIRE(c.gameplay_of<proto::MapChunk>().empty());
    REQUIRE_FALSE(c.gameplay_of<proto::AllClientProgress>().empty());

    c.report("MapTransferComplete");
    f.tick();

    REQUIRE(f.server->phase() == ServerPhase::Playing);
    auto done = c.gameplay_of<proto::TransferComplete>();
    REQUIRE(done.size() == 1);
    REQUIRE(done[0].mapId == "map-1");
}

TEST_CASE("Play waits for every identified client", "[server][map_server][phase]") {
    ServerFixture f;
    auto& a = f.add_client("a");
    auto& b = f.add_client("b");
    a.identify();
    b.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();

    a.report("MapTransferTransferring");
    b.report("MapTransferTransferring");
    f.tick(2);
    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);

    a.report("MapTransferComplete");
    f.tick(3);
    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);
    REQUIRE(a.gameplay_of<proto::TransferComplete>().empty());

    b.report("MapTransferComplete");
    f.tick();
    REQUIRE(f.server->phase() == ServerPhase::Playing);
    REQUIRE(a.gameplay_of<proto::TransferComplete>().size() == 1);
    REQUIRE(b.gameplay_of<proto::TransferComplete>().size() == 1);
}

// =============================================================================
// Late joiners
// =============================================================================

TEST_CASE("A late joiner gets the world while others play", "[server][map_server][late_join]") {
    ServerFixture f;
    auto& a = f.add_client("a");
    a.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    f.deliver(a);
    REQUIRE(f.server->phase() == ServerPhase::Playing);

    auto& late = f.add_client("late");
    late.identify();
    f.tick();

    REQUIRE(late.gameplay_of<proto::TransferBegin>().size() == 1);
    REQUIRE(f.server->coordinator().has_worker(late.gameplay_id()));

    late.report("MapTransferTransferring");
    f.tick(2);
    REQUIRE(late.reassemble("map-1").size() == f.server->coordinator().blob()->total_size());

    a.clear();
    late.report("MapTransferComplete");
    f.tick();

    REQUIRE(f.server->phase() == ServerPhase::Playing);
    REQUIRE(late.gameplay_of<proto::TransferComplete>().size() == 1);
    REQUIRE(a.gameplay_of<proto::TransferComplete>().empty());
}

TEST_CASE("A client that already holds the world is not sent chunks", "[server][map_server][late_join]") {
    ServerFixture f;
    auto& c = f.add_client("a");
    c.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();

    c.report("MapTransferComplete");
    f.tick(2);

    REQUIRE(c.bulk_of<proto::MapChunk>().empty());
    REQUIRE(f.server->phase() == ServerPhase::Playing);
}

// =============================================================================
// Regeneration
// =============================================================================

TEST_CASE("Publishing during play regenerates the map", "[server][map_server][regen]") {
    ServerFixture f;
    auto& c = f.add_client("a");
    c.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    f.deliver(c);
    REQUIRE(f.server->phase() == ServerPhase::Playing);
    c.clear();

    auto next = make_small_world_blob("map-2", 99);
    f.server->publish_world(next, 99, "vote passed");
    f.tick();

    REQUIRE(f.server->phase() == ServerPhase::Transferring);
    REQUIRE(f.server->current_map_id() == "map-2");

    auto regen = c.gameplay_of<proto::MapRegenerationStart>();
    REQUIRE(regen.size() == 1);
    REQUIRE(regen[0].newMapSeed == 99);
    REQUIRE(regen[0].reason == "vote passed");
    REQUIRE(regen[0].timestamp > 0);

    auto begins = c.gameplay_of<proto::TransferBegin>();
    REQUIRE(begins.size() == 1);
    REQUIRE(begins[0].mapId == "map-2");

    // The old "complete" report must not end the new transfer.
    f.tick(2);
    REQUIRE(c.bulk_of<proto::MapChunk>().empty());

    c.report("MapRegenerationCleanup");
    c.report("MapRegenerationDownloading");
    f.tick(2);
    REQUIRE(c.reassemble("map-2") == next->bytes);

    c.report("MapRegenerationRebuilding");
    c.report("MapRegenerationComplete");
    f.tick(2);
    REQUIRE(f.server->phase() == ServerPhase::Playing);
    REQUIRE(c.gameplay_of<proto::TransferComplete>().back().mapId == "map-2");
}

TEST_CASE("A default regeneration reason is filled in", "[server][map_server][regen]") {
    ServerFixture f;
    auto& c = f.add_client("a");
    c.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    f.deliver(c);

    f.server->publish_world(make_small_world_blob("map-2", 5), 5);
    f.tick();

    auto regen = c.gameplay_of<proto::MapRegenerationStart>();
    REQUIRE(regen.size() == 1);
    REQUIRE_FALSE(regen[0].reason.empty());
}

TEST_CASE("Publishing mid-transfer waits for the running transfer", "[server][map_server][regen]") {
    ServerFixture f;
    auto& c = f.add_client("a");
    c.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    REQUIRE(f.server->phase() == ServerPhase::Transferring);

    f.server->publish_world(make_small_world_blob("map-2", 2));
    f.server->publish_world(make_small_world_blob("map-3", 3));
    f.tick();

    REQUIRE(f.server->current_map_id() == "map-1");
    REQUIRE(f.server->queued_map_id() == std::optional<std::string>("map-3"));
    REQUIRE(c.gameplay_of<proto::TransferBegin>().size() == 1);

    // The newest world follows once the client holds the first.
    f.deliver(c);
    f.tick();

    REQUIRE(c.reassemble("map-1") == make_small_world_blob("map-1")->bytes);
    REQUIRE(f.server->current_map_id() == "map-3");
    REQUIRE_FALSE(f.server->queued_map_id().has_value());
    REQUIRE(f.server->phase() == ServerPhase::Transferring);

    auto begins = c.gameplay_of<proto::TransferBegin>();
    REQUIRE(begins.size() == 2);
    REQUIRE(begins.back().mapId == "map-3");
}

TEST_CASE("A world published before any client identified replaces the first at once", "[server][map_server][regen]") {
    ServerFixture f;
    auto& c = f.add_client("b");
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    f.server->publish_world(make_small_world_blob("map-2", 2));
    f.tick();

    REQUIRE(f.server->current_map_id() == "map-2");
    REQUIRE_FALSE(f.server->queued_map_id().has_value());

    c.identify();
    f.tick(2);
    auto begins = c.gameplay_of<proto::TransferBegin>();
    REQUIRE(begins.size() == 1);
    REQUIRE(begins[0].mapId == "map-2");
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Disconnecting mid-transfer drops the worker", "[server][map_server]") {
    ServerFixture f;
    auto& a = f.add_client("a");
    a.identify();
    f.server->publish_world(make_small_world_blob("map-1"));
    f.tick();
    REQUIRE(f.server->coordinator().has_worker(a.gameplay_id()));

    const ClientId id = a.gameplay_id();
    a.disconnect();
    f.tick();

    REQUIRE_FALSE(f.server->coordinator().has_worker(id));
    REQUIRE_FALSE(f.server->registry().is_connected(id));
    REQUIRE(f.server->registry().find_inactive("a").has_value());
    REQUIRE(f.server->phase() == ServerPhase::WaitingForClients);
}

TEST_CASE("A stalled client is disconnected", "[server][map_server]") {
    TransferConfig cfg;
    cfg.stall_timeout = 0.2f;
    ServerFixture f(cfg);
    auto& c = f.add_client("a");
    c.identify();
    f.server->publish_world(make_small_world_blob("map-1"));

    f.tick(15);

    REQUIRE_FALSE(c.gameplay_connected());
    REQUIRE_FALSE(f.server->registry().is_connected(c.gameplay_id()));
}

TEST_CASE("Server-only messages from clients are ignored", "[server][map_server]") {
    ServerFixture f;
    auto& c = f.add_client("a");
    c.identify();
    c.send_gameplay(proto::TransferComplete{"forged"});
    c.send_gameplay(proto::ClientStateChange{"Lobby", "NotAState"});
    f.tick();

    REQUIRE(f.server->phase() == ServerPhase::Idle);
    REQUIRE(f.server->registry().find(c.gameplay_id())->currentState == "NotAState");
}
