#pragma once

#include "transfer_channels.hpp"
#include "transfer_worker.hpp"
#include "world_blob.hpp"

#include <mapsync/core/config.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace mapsync::transfer {

// ============================================================================
// TransferCoordinator - Owns one worker per client for the published world
// ============================================================================

/// A transfer session starts when a world blob is published and lasts until
/// every worker has finished. Publishing a new blob discards the old workers.
class TransferCoordinator {
public:
    TransferCoordinator(ITransferChannels& channels, TransferConfig config);

    /// Replaces the current world. Running workers are dropped.
    void publish(WorldBlobPtr blob);

    /// Drops the world and every worker.
    void release();

    const WorldBlobPtr& blob() const { return blob_; }
    bool has_blob() const { return blob_ != nullptr; }

    /// Creates a worker for one client. False if there is no world or the
    /// client already has a worker.
    bool start_transfer(ClientId gameplayId);

    /// start_transfer() for every connected client. Returns the number of workers created.
    std::size_t start_transfer_all();

    void on_client_disconnect(ClientId gameplayId);

    /// Advances every worker, retires the finished ones, and broadcasts
    /// AllClientProgress every progress_interval while workers are running.
    void update(float dt);

    bool is_idle() const { return workers_.empty(); }

    /// True while some worker has sent TransferBegin and not finished.
    bool has_active_transfers() const;
    std::size_t active_worker_count() const { return workers_.size(); }
    bool has_worker(ClientId gameplayId) const { return workers_.count(gameplayId) != 0; }
    const TransferWorker* worker(ClientId gameplayId) const;

    /// Unique id -> chunks sent. Identified clients without a worker count as done.
    proto::AllClientProgress progress_snapshot() const;

    const TransferConfig& config() const { return config_; }

    std::function<void(ClientId)> onWorkerComplete;
    std::function<void(ClientId, const std::string& reason)> onWorkerFailed;

private:
    void broadcast_progress();

    ITransferChannels& channels_;
    TransferConfig config_;
    WorldBlobPtr blob_;
    std::map<ClientId, std::unique_ptr<TransferWorker>> workers_;
    float progressTimer_{0.0f};
};

} // namespace mapsync::transfer
