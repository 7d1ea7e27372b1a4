#include "transfer_coordinator.hpp"
#include "chunker.hpp"

#include <mapsync/core/logger.hpp>

#include <utility>
#include <vector>

namespace mapsync::transfer {

namespace {
constexpr const char* kTag = "xfer";
}

TransferCoordinator::TransferCoordinator(ITransferChannels& channels, TransferConfig config)
    : channels_(channels)
    , config_(std::move(config))
{
}

void TransferCoordinator::publish(WorldBlobPtr blob) {
    if (!workers_.empty()) {
        logf(LogLevel::Info, kTag, "dropping %zu running transfer(s) of '%s'",
             workers_.size(), blob_ ? blob_->mapId.c_str() : "");
    }
    workers_.clear();
    progressTimer_ = 0.0f;
    blob_ = std::move(blob);

    if (blob_) {
        logf(LogLevel::Info, kTag, "published world '%s' (%zu bytes, %d chunks of %zu)",
             blob_->mapId.c_str(), blob_->total_size(),
             chunk_count(blob_->total_size(), config_.chunk_size), config_.chunk_size);
    }
}

void TransferCoordinator::release() {
    publish(nullptr);
}

bool TransferCoordinator::start_transfer(ClientId gameplayId) {
    if (!blob_) {
        logf(LogLevel::Debug, kTag, "no world published, not starting transfer for client %u", gameplayId);
        return false;
    }
    if (workers_.count(gameplayId) != 0) {
        return false;
    }

    workers_.emplace(gameplayId, std::make_unique<TransferWorker>(
        gameplayId, blob_, channels_, TransferWorker::Settings::from_config(config_)));
    logf(LogLevel::Debug, kTag, "worker created for client %u", gameplayId);
    return true;
}

std::size_t TransferCoordinator::start_transfer_all() {
    std::size_t started = 0;
    for (ClientId id : channels_.connected_clients()) {
        if (start_transfer(id)) {
            ++started;
        }
    }
    return started;
}

void TransferCoordinator::on_client_disconnect(ClientId gameplayId) {
    auto it = workers_.find(gameplayId);
    if (it == workers_.end()) return;

    logf(LogLevel::Info, kTag, "client %u disconnected, dropping transfer at chunk %d/%d",
         gameplayId, it->second->current_chunk_index(), it->second->total_chunks());
    workers_.erase(it);
}

bool TransferCoordinator::has_active_transfers() const {
    for (const auto& [id, w] : workers_) {
        if (w->status() == TransferWorker::Status::Active) return true;
    }
    return false;
}

const TransferWorker* TransferCoordinator::worker(ClientId gameplayId) const {
    auto it = workers_.find(gameplayId);
    return it != workers_.end() ? it->second.get() : nullptr;
}

void TransferCoordinator::update(float dt) {
    if (workers_.empty()) return;

    for (auto& [id, w] : workers_) {
        w->update(dt);
    }

    std::vector<ClientId> completed;
    std::vector<std::pair<ClientId, std::string>> failed;

    for (auto it = workers_.begin(); it != workers_.end();) {
        const TransferWorker& w = *it->second;
        if (!w.is_finished()) {
            ++it;
            continue;
        }
        if (w.is_complete()) {
            completed.push_back(it->first);
        } else {
            failed.emplace_back(it->first, w.failure_reason());
        }
        it = workers_.erase(it);
    }

    progressTimer_ += dt;
    const bool sessionDone = workers_.empty();
    if (progressTimer_ >= config_.progress_interval || sessionDone) {
        broadcast_progress();
        progressTimer_ = 0.0f;
    }

    if (sessionDone) {
        logf(LogLevel::Info, kTag, "transfer session for '%s' finished", blob_->mapId.c_str());
    }

    for (ClientId id : completed) {
        if (onWorkerComplete) onWorkerComplete(id);
    }
    for (const auto& [id, reason] : failed) {
        if (onWorkerFailed) onWorkerFailed(id, reason);
    }
}

proto::AllClientProgress TransferCoordinator::progress_snapshot() const {
    proto::AllClientProgress msg;
    if (!blob_) return msg;

    const std::int32_t total = chunk_count(blob_->total_size(), config_.chunk_size);

    for (ClientId id : channels_.connected_clients()) {
        auto uniqueId = channels_.unique_id_for(id);
        if (!uniqueId || uniqueId->empty()) continue;

        auto it = workers_.find(id);
        msg.clientToChunkProgress[*uniqueId] =
            it != workers_.end() ? it->second->current_chunk_index() : total;
    }
    return msg;
}

void TransferCoordinator::broadcast_progress() {
    auto msg = progress_snapshot();
    if (msg.clientToChunkProgress.empty()) return;
    channels_.broadcast_gameplay(msg);
}

} // namespace mapsync::transfer
