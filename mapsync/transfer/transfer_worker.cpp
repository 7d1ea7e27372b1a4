#include "transfer_worker.hpp"

#include "chunker.hpp"

#include <mapsync/core/logger.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace mapsync::transfer {

namespace {
constexpr const char* kTag = "xfer";
}

const char* to_string(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::Gameplay: return "gameplay";
        case ChannelKind::Bulk:     return "bulk";
    }
    return "?";
}

const char* to_string(TransferWorker::Status status) {
    switch (status) {
        case TransferWorker::Status::PendingId: return "PendingId";
        case TransferWorker::Status::Active:    return "Active";
        case TransferWorker::Status::Complete:  return "Complete";
        case TransferWorker::Status::Failed:    return "Failed";
    }
    return "?";
}

TransferWorker::Settings TransferWorker::Settings::from_config(const TransferConfig& cfg) {
    Settings s;
    s.chunkSize = cfg.chunk_size;
    s.maxChunksPerTick = cfg.max_chunks_per_tick;
    s.backpressureThreshold = cfg.backpressure_threshold;
    s.gameplayBackpressureThreshold = cfg.gameplay_backpressure_threshold();
    s.identityTimeout = cfg.identity_timeout;
    s.bulkConnectTimeout = cfg.bulk_connect_timeout;
    s.stallTimeout = cfg.stall_timeout;
    s.gameplayFallback = cfg.gameplay_fallback;
    return s;
}

TransferWorker::TransferWorker(ClientId gameplayId, WorldBlobPtr blob, ITransferChannels& channels,
                               Settings settings)
    : gameplayId_(gameplayId)
    , blob_(std::move(blob))
    , channels_(channels)
    , settings_(settings)
{
    if (!blob_) {
        throw std::invalid_argument("TransferWorker requires a world blob");
    }
    totalChunks_ = chunk_count(blob_->total_size(), settings_.chunkSize);
}

void TransferWorker::update(float dt) {
    if (is_finished()) return;

    sentLastUpdate_ = 0;

    if (!channels_.is_gameplay_connected(gameplayId_)) {
        fail("gameplay connection closed");
        return;
    }

    if (status_ == Status::PendingId) {
        if (!resolve_identity()) {
            identityWait_ += dt;
            if (!loggedMissingId_) {
                logf(LogLevel::Debug, kTag, "client %u has not identified yet, waiting", gameplayId_);
                loggedMissingId_ = true;
            }
            if (identityWait_ >= settings_.identityTimeout) {
                fail("client never identified itself");
            }
            return;
        }
        begin();
        return;
    }

    update_active(dt);
}

bool TransferWorker::resolve_identity() {
    auto id = channels_.unique_id_for(gameplayId_);
    if (!id || id->empty()) return false;
    uniqueId_ = std::move(id);
    return true;
}

void TransferWorker::begin() {
    status_ = Status::Active;
    beginSequence_ = channels_.reported_state(gameplayId_).sequence;

    proto::TransferBegin msg;
    msg.mapId = blob_->mapId;
    msg.totalChunks = totalChunks_;
    msg.totalSize = static_cast<std::int64_t>(blob_->total_size());
    channels_.send(ChannelKind::Gameplay, gameplayId_, msg);

    logf(LogLevel::Info, kTag, "client %u (%s): begin '%s', %d chunks, %zu bytes",
         gameplayId_, uniqueId_->c_str(), blob_->mapId.c_str(), totalChunks_, blob_->total_size());
}

void TransferWorker::update_active(float dt) {
    const ReportedState reported = channels_.reported_state(gameplayId_);
    const bool fresh = reported.sequence > beginSequence_ && reported.state.has_value();

    // The client may already hold this world (rejoin, same map id).
    if (fresh && state::is_transfer_complete_state(*reported.state)) {
        complete("client reports transfer complete");
        return;
    }

    if (currentChunkIndex_ >= totalChunks_) {
        complete("all chunks sent");
        return;
    }

    if (!fresh || !state::is_receiving_state(*reported.state)) {
        idleTime_ += dt;
        if (idleTime_ >= settings_.stallTimeout) {
            fail("client never entered a receiving state");
        }
        return;
    }

    ChannelKind channel = ChannelKind::Bulk;
    ClientId target = kInvalidClientId;
    std::size_t threshold = settings_.backpressureThreshold;

    if (auto bulk = channels_.bulk_connection_for(*uniqueId_)) {
        target = *bulk;
        bulkWait_ = 0.0f;
        if (usingFallback_) {
            logf(LogLevel::Info, kTag, "client %u: bulk connection arrived, leaving gameplay fallback",
                 gameplayId_);
            usingFallback_ = false;
        }
    } else {
        bulkWait_ += dt;
        if (!loggedBulkWait_) {
            logf(LogLevel::Debug, kTag, "client %u: waiting for bulk connection", gameplayId_);
            loggedBulkWait_ = true;
        }
        if (bulkWait_ < settings_.bulkConnectTimeout) {
            return;
        }
        if (!settings_.gameplayFallback) {
            fail("bulk connection was never established");
            return;
        }
        if (!usingFallback_) {
            logf(LogLevel::Warning, kTag,
                 "client %u: no bulk connection after %.1fs, streaming over gameplay connection",
                 gameplayId_, static_cast<double>(bulkWait_));
            usingFallback_ = true;
        }
        channel = ChannelKind::Gameplay;
        target = gameplayId_;
        threshold = settings_.gameplayBackpressureThreshold;
    }

    while (currentChunkIndex_ < totalChunks_ && sentLastUpdate_ < settings_.maxChunksPerTick) {
        const std::size_t buffered = channels_.write_buffer_size(channel, target);
        if (buffered >= threshold) {
            if (!loggedBackpressure_) {
                logf(LogLevel::Debug, kTag, "client %u: backpressure on %s (%zu/%zu bytes buffered)",
                     gameplayId_, to_string(channel), buffered, threshold);
                loggedBackpressure_ = true;
            }
            break;
        }
        send_chunk(channel, target);
        ++currentChunkIndex_;
        ++sentLastUpdate_;
    }

    if (sentLastUpdate_ > 0) {
        idleTime_ = 0.0f;
        loggedBackpressure_ = false;
    } else {
        idleTime_ += dt;
        if (idleTime_ >= settings_.stallTimeout) {
            fail("no chunk could be sent for " + std::to_string(settings_.stallTimeout) + "s");
            return;
        }
    }

    if (currentChunkIndex_ >= totalChunks_) {
        complete("all chunks sent");
    }
}

void TransferWorker::send_chunk(ChannelKind channel, ClientId target) {
    const auto bytes = chunk_payload(blob_->view(), currentChunkIndex_, settings_.chunkSize);

    proto::MapChunk msg;
    msg.mapId = blob_->mapId;
    msg.chunkIndex = currentChunkIndex_;
    msg.totalChunks = totalChunks_;
    msg.payload.assign(bytes.begin(), bytes.end());
    channels_.send(channel, target, msg);
}

void TransferWorker::complete(const char* why) {
    status_ = Status::Complete;
    logf(LogLevel::Info, kTag, "client %u: transfer of '%s' complete (%s, %d/%d chunks sent)",
         gameplayId_, blob_->mapId.c_str(), why, currentChunkIndex_, totalChunks_);
}

void TransferWorker::fail(std::string reason) {
    status_ = Status::Failed;
    failureReason_ = std::move(reason);
    logf(LogLevel::Warning, kTag, "client %u: transfer of '%s' failed at chunk %d/%d: %s",
         gameplayId_, blob_->mapId.c_str(), currentChunkIndex_, totalChunks_, failureReason_.c_str());
}

} // namespace mapsync::transfer
