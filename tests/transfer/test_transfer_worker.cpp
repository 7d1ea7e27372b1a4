/**
 * @file test_transfer_worker.cpp
 * @brief Unit tests for the per-client TransferWorker.
 *
 * Tests identity gating, rate limiting, backpressure, the gameplay fallback
 * and the timeouts that end a transfer.
 */

#include <catch2/catch.hpp>

#include <mapsync/transfer/transfer_worker.hpp>

#include "helpers/mock_transfer_channels.hpp"
#include "helpers/test_utils.hpp"

#include <stdexcept>

using namespace mapsync;
using namespace mapsync::transfer;
using namespace test_helpers;
using mapsync::state::GameState;

namespace {

constexpr ClientId kClient = 1;
constexpr ClientId kBulk = 11;
constexpr float kDt = 1.0f / 30.0f;

/** @brief Identified client with a bound bulk connection and a 100000 byte world. */
struct WorkerFixture {
    MockTransferChannels channels;
    WorldBlobPtr blob = make_pattern_blob("map-a", 100000);
    TransferWorker::Settings settings;

    WorkerFixture() {
        channels.add_client(kClient, "client-a");
        channels.bind_bulk("client-a", kBulk);
    }

    TransferWorker make() { return TransferWorker(kClient, blob, channels, settings); }

    /** @brief Sends TransferBegin and has the client answer with a receiving state. */
    void start(TransferWorker& w) {
        w.update(kDt);
        channels.report(kClient, GameState::MapTransferTransferring);
    }
};

} // namespace

// =============================================================================
// Identity
// =============================================================================

TEST_CASE("Worker waits for the client to identify", "[transfer][worker]") {
    MockTransferChannels channels;
    channels.add_client(kClient);
    auto blob = make_pattern_blob("map-a", 1000);
    TransferWorker w(kClient, blob, channels, TransferWorker::Settings{});

    w.update(kDt);
    w.update(kDt);
    REQUIRE(w.status() == TransferWorker::Status::PendingId);
    REQUIRE(channels.sent().empty());

    channels.identify(kClient, "late");
    w.update(kDt);
    REQUIRE(w.status() == TransferWorker::Status::Active);
    REQUIRE(w.client_unique_id() == std::optional<std::string>("late"));

    auto begins = channels.sent_of<mapsync::proto::TransferBegin>(kClient, ChannelKind::Gameplay);
    REQUIRE(begins.size() == 1);
    REQUIRE(begins[0].mapId == "map-a");
    REQUIRE(begins[0].totalChunks == 1);
    REQUIRE(begins[0].totalSize == 1000);
}

TEST_CASE("Worker fails when the client never identifies", "[transfer][worker][timeout]") {
    MockTransferChannels channels;
    channels.add_client(kClient);
    TransferWorker::Settings s;
    s.identityTimeout = 1.0f;
    TransferWorker w(kClient, make_pattern_blob("m", 10), channels, s);

    w.update(0.6f);
    REQUIRE_FALSE(w.is_finished());
    w.update(0.6f);
    REQUIRE(w.status() == TransferWorker::Status::Failed);
    REQUIRE_FALSE(w.failure_reason().empty());
}

TEST_CASE("Worker requires a blob", "[transfer][worker]") {
    MockTransferChannels channels;
    REQUIRE_THROWS_AS(TransferWorker(kClient, nullptr, channels, TransferWorker::Settings{}),
                      std::invalid_argument);
}

// =============================================================================
// Streaming
// =============================================================================

TEST_CASE("Worker sends chunks in order on the bulk channel", "[transfer][worker]") {
    WorkerFixture f;
    auto w = f.make();
    REQUIRE(w.total_chunks() == 13);

    f.start(w);
    w.update(kDt);

    REQUIRE(w.is_complete());
    REQUIRE(f.channels.chunk_count(kClient, ChannelKind::Gameplay) == 0);

    auto chunks = f.channels.sent_of<mapsync::proto::MapChunk>(kBulk, ChannelKind::Bulk);
    REQUIRE(chunks.size() == 13);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].chunkIndex == static_cast<std::int32_t>(i));
        REQUIRE(chunks[i].totalChunks == 13);
        REQUIRE(chunks[i].mapId == "map-a");
    }
    REQUIRE(chunks.back().payload.size() == 1696);
}

TEST_CASE("Worker honours max chunks per tick", "[transfer][worker][rate]") {
    WorkerFixture f;
    f.settings.maxChunksPerTick = 4;
    auto w = f.make();
    f.start(w);

    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 4);
    REQUIRE(w.current_chunk_index() == 4);

    w.update(kDt);
    w.update(kDt);
    REQUIRE(w.current_chunk_index() == 12);
    REQUIRE_FALSE(w.is_finished());

    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 1);
    REQUIRE(w.is_complete());
    REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 13);
}

TEST_CASE("Worker sends nothing before the client is receiving", "[transfer][worker]") {
    WorkerFixture f;
    auto w = f.make();

    w.update(kDt);
    w.update(kDt);
    REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 0);

    SECTION("a non-receiving report keeps it waiting") {
        f.channels.report(kClient, GameState::MapTransferInitiated);
        w.update(kDt);
        REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 0);
        REQUIRE(w.status() == TransferWorker::Status::Active);
    }

    SECTION("a receiving report starts the stream") {
        f.channels.report(kClient, GameState::MapTransferTransferring);
        w.update(kDt);
        REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 13);
    }
}

TEST_CASE("Worker fails when the client never starts receiving", "[transfer][worker][timeout]") {
    WorkerFixture f;
    f.settings.stallTimeout = 1.0f;
    auto w = f.make();

    w.update(kDt);
    f.channels.report(kClient, GameState::MapTransferInitiated);
    for (int i = 0; i < 4; ++i) w.update(0.3f);

    REQUIRE(w.status() == TransferWorker::Status::Failed);
}

TEST_CASE("Empty world completes right after TransferBegin", "[transfer][worker]") {
    MockTransferChannels channels;
    channels.add_client(kClient, "client-a");
    TransferWorker w(kClient, make_pattern_blob("empty", 0), channels, TransferWorker::Settings{});

    w.update(kDt);
    REQUIRE(w.total_chunks() == 0);
    REQUIRE(channels.sent_of<mapsync::proto::TransferBegin>(kClient).size() == 1);

    w.update(kDt);
    REQUIRE(w.is_complete());
}

// =============================================================================
// Client reports
// =============================================================================

TEST_CASE("A complete report after TransferBegin finishes the worker", "[transfer][worker]") {
    WorkerFixture f;
    auto w = f.make();

    w.update(kDt);
    f.channels.report(kClient, GameState::MapTransferComplete);
    w.update(kDt);

    REQUIRE(w.is_complete());
    REQUIRE(w.current_chunk_index() == 0);
    REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 0);
}

TEST_CASE("A complete report from before TransferBegin is ignored", "[transfer][worker]") {
    WorkerFixture f;
    f.channels.report(kClient, GameState::MapTransferComplete);
    auto w = f.make();

    w.update(kDt);
    w.update(kDt);
    REQUIRE_FALSE(w.is_finished());

    f.channels.report(kClient, GameState::MapRegenerationDownloading);
    w.update(kDt);
    REQUIRE(w.is_complete());
    REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 13);
}

TEST_CASE("Worker fails when the gameplay connection closes", "[transfer][worker]") {
    WorkerFixture f;
    auto w = f.make();
    f.start(w);

    f.channels.drop_client(kClient);
    w.update(kDt);

    REQUIRE(w.status() == TransferWorker::Status::Failed);
    REQUIRE(f.channels.chunk_count(kBulk, ChannelKind::Bulk) == 0);
}

// =============================================================================
// Backpressure
// =============================================================================

TEST_CASE("Full bulk buffer sends nothing this tick", "[transfer][worker][backpressure]") {
    WorkerFixture f;
    f.blob = make_pattern_blob("big", 1000 * 8192);
    auto w = f.make();
    REQUIRE(w.total_chunks() == 1000);
    f.start(w);

    // 90% of a 64 KiB buffer is above the 57344 byte threshold.
    f.channels.set_write_buffer(ChannelKind::Bulk, kBulk, 58982);
    w.update(kDt);

    REQUIRE(w.chunks_sent_last_update() == 0);
    REQUIRE(w.current_chunk_index() == 0);
    REQUIRE(w.status() == TransferWorker::Status::Active);

    f.channels.set_write_buffer(ChannelKind::Bulk, kBulk, 0);
    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 500);
    REQUIRE(w.current_chunk_index() == 500);
}

TEST_CASE("Backpressure stops mid-tick and resumes where it left off", "[transfer][worker][backpressure]") {
    WorkerFixture f;
    f.channels.set_accumulate_writes(true);
    auto w = f.make();
    f.start(w);

    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 7);
    REQUIRE(w.current_chunk_index() == 7);

    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 0);

    f.channels.set_write_buffer(ChannelKind::Bulk, kBulk, 0);
    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 6);
    REQUIRE(w.is_complete());

    auto chunks = f.channels.sent_of<mapsync::proto::MapChunk>(kBulk);
    REQUIRE(chunks.size() == 13);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].chunkIndex == static_cast<std::int32_t>(i));
    }
}

TEST_CASE("Backpressure that never clears fails the worker", "[transfer][worker][backpressure]") {
    WorkerFixture f;
    f.settings.stallTimeout = 1.0f;
    auto w = f.make();
    f.start(w);

    f.channels.set_write_buffer(ChannelKind::Bulk, kBulk, 65536);
    for (int i = 0; i < 4; ++i) w.update(0.3f);

    REQUIRE(w.status() == TransferWorker::Status::Failed);
}

TEST_CASE("A saturated client does not slow down another", "[transfer][worker][backpressure]") {
    MockTransferChannels channels;
    channels.add_client(1, "a");
    channels.add_client(2, "b");
    channels.bind_bulk("a", 11);
    channels.bind_bulk("b", 12);
    auto blob = make_pattern_blob("shared", 100000);

    TransferWorker slow(1, blob, channels, TransferWorker::Settings{});
    TransferWorker fast(2, blob, channels, TransferWorker::Settings{});
    slow.update(kDt);
    fast.update(kDt);
    channels.report(1, GameState::MapTransferTransferring);
    channels.report(2, GameState::MapTransferTransferring);

    channels.set_write_buffer(ChannelKind::Bulk, 11, 60000);
    slow.update(kDt);
    fast.update(kDt);

    REQUIRE(slow.current_chunk_index() == 0);
    REQUIRE(fast.is_complete());
    REQUIRE(channels.chunk_count(12, ChannelKind::Bulk) == 13);
}

TEST_CASE("One worker's rate limit does not cap another", "[transfer][worker][rate]") {
    MockTransferChannels channels;
    channels.add_client(1, "a");
    channels.add_client(2, "b");
    channels.bind_bulk("a", 11);
    channels.bind_bulk("b", 12);
    auto blob = make_pattern_blob("shared", 100000);

    TransferWorker::Settings s;
    s.maxChunksPerTick = 4;
    TransferWorker first(1, blob, channels, s);
    TransferWorker second(2, blob, channels, s);
    first.update(kDt);
    second.update(kDt);
    channels.report(1, GameState::MapTransferTransferring);
    channels.report(2, GameState::MapTransferTransferring);

    first.update(kDt);
    second.update(kDt);

    REQUIRE(first.chunks_sent_last_update() == 4);
    REQUIRE(second.chunks_sent_last_update() == 4);
}

// =============================================================================
// Bulk connection
// =============================================================================

TEST_CASE("Worker waits for the bulk connection", "[transfer][worker][bulk]") {
    WorkerFixture f;
    f.channels.unbind_bulk("client-a");
    f.settings.bulkConnectTimeout = 1.0f;
    auto w = f.make();
    f.start(w);

    w.update(0.5f);
    REQUIRE(w.status() == TransferWorker::Status::Active);
    REQUIRE(f.channels.chunk_count(kClient, ChannelKind::Gameplay) == 0);

    SECTION("bulk arrives in time") {
        f.channels.bind_bulk("client-a", kBulk);
        w.update(kDt);
        REQUIRE(w.is_complete());
        REQUIRE_FALSE(w.using_gameplay_fallback());
    }

    SECTION("no fallback fails after the timeout") {
        w.update(0.6f);
        REQUIRE(w.status() == TransferWorker::Status::Failed);
    }
}

TEST_CASE("Gameplay fallback streams slowly over the gameplay channel", "[transfer][worker][bulk]") {
    WorkerFixture f;
    f.channels.unbind_bulk("client-a");
    f.channels.set_accumulate_writes(true);
    f.settings.bulkConnectTimeout = 1.0f;
    f.settings.gameplayFallback = true;
    auto w = f.make();
    f.start(w);

    w.update(1.1f);
    REQUIRE(w.using_gameplay_fallback());
    // 8192 byte chunks against a 7208 byte threshold: one chunk, then blocked.
    REQUIRE(w.chunks_sent_last_update() == 1);
    REQUIRE(f.channels.chunk_count(kClient, ChannelKind::Gameplay) == 1);

    w.update(kDt);
    REQUIRE(w.chunks_sent_last_update() == 0);

    SECTION("bulk arriving later takes over") {
        f.channels.bind_bulk("client-a", kBulk);
        w.update(kDt);
        REQUIRE_FALSE(w.using_gameplay_fallback());
        REQUIRE(w.chunks_sent_last_update() == 7);
        REQUIRE(f.channels.sent_of<mapsync::proto::MapChunk>(kBulk).front().chunkIndex == 1);
    }
}
