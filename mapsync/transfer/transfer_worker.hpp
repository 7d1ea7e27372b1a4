#pragma once

#include "transfer_channels.hpp"
#include "world_blob.hpp"

#include <mapsync/core/config.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mapsync::transfer {

// ============================================================================
// TransferWorker - Streams one world blob to one client
// ============================================================================

/// PendingId -> Active -> Complete, or Failed on a timeout or lost connection.
///
/// - PendingId: the client has not identified itself yet. Nothing is sent;
///   the identity is looked up again every update.
/// - Active: TransferBegin went out on the gameplay channel. Chunks go out on
///   the bulk channel while the client reports a receiving state, at most
///   maxChunksPerTick per update, and only while the connection's write
///   buffer is below the backpressure threshold.
/// - Complete: every chunk was sent, or the client reported it already holds
///   the world.
///
/// Only client reports made after TransferBegin went out are taken into account.
///
/// currentChunkIndex only moves forward; a chunk is never sent twice.
class TransferWorker {
public:
    enum class Status : std::uint8_t {
        PendingId,
        Active,
        Complete,
        Failed,
    };

    struct Settings {
        std::size_t chunkSize{8192};
        int maxChunksPerTick{500};
        std::size_t backpressureThreshold{57344};
        std::size_t gameplayBackpressureThreshold{7208};
        float identityTimeout{10.0f};
        float bulkConnectTimeout{30.0f};
        float stallTimeout{30.0f};
        bool gameplayFallback{false};

        static Settings from_config(const TransferConfig& cfg);
    };

    TransferWorker(ClientId gameplayId, WorldBlobPtr blob, ITransferChannels& channels, Settings settings);

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    void update(float dt);

    Status status() const { return status_; }
    bool is_complete() const { return status_ == Status::Complete; }
    bool is_finished() const { return status_ == Status::Complete || status_ == Status::Failed; }

    ClientId gameplay_id() const { return gameplayId_; }
    const std::optional<std::string>& client_unique_id() const { return uniqueId_; }
    const std::string& map_id() const { return blob_->mapId; }

    std::int32_t current_chunk_index() const { return currentChunkIndex_; }
    std::int32_t total_chunks() const { return totalChunks_; }
    int chunks_sent_last_update() const { return sentLastUpdate_; }
    bool using_gameplay_fallback() const { return usingFallback_; }
    const std::string& failure_reason() const { return failureReason_; }

private:
    bool resolve_identity();
    void begin();
    void update_active(float dt);
    void send_chunk(ChannelKind channel, ClientId target);
    void complete(const char* why);
    void fail(std::string reason);

    ClientId gameplayId_;
    WorldBlobPtr blob_;
    ITransferChannels& channels_;
    Settings settings_;

    Status status_{Status::PendingId};
    std::optional<std::string> uniqueId_;

    std::uint64_t beginSequence_{0};

    std::int32_t currentChunkIndex_{0};
    std::int32_t totalChunks_{0};
    int sentLastUpdate_{0};

    float identityWait_{0.0f};
    float bulkWait_{0.0f};
    float idleTime_{0.0f};

    bool usingFallback_{false};
    bool loggedMissingId_{false};
    bool loggedBulkWait_{false};
    bool loggedBackpressure_{false};

    std::string failureReason_;
};

const char* to_string(TransferWorker::Status status);

} // namespace mapsync::transfer
