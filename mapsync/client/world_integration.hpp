#pragma once

// IWorldIntegration - Where a received world leaves the transfer machinery.
// Renderer, physics and gameplay hook in behind this interface.

#include <mapsync/world/world_snapshot.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mapsync::client {

class IWorldIntegration {
public:
    virtual ~IWorldIntegration() = default;

    /// Map id of the world currently loaded, if any.
    virtual std::optional<std::string> current_map_id() const = 0;

    /// Tears down the loaded world. Called before a replacement is applied.
    virtual void release_world() = 0;

    /// Only called with a fully reassembled and decoded world.
    virtual void apply_world(std::shared_ptr<const world::WorldSnapshot> world) = 0;

    /// True once the applied world can be played.
    virtual bool world_ready() const = 0;
};

// ============================================================================
// LocalWorldIntegration - Keeps the snapshot in memory
// ============================================================================

/// Becomes ready `buildTicks` world_ready() polls after apply_world().
class LocalWorldIntegration final : public IWorldIntegration {
public:
    explicit LocalWorldIntegration(int buildTicks = 0)
        : buildTicks_(buildTicks)
    {
    }

    std::optional<std::string> current_map_id() const override {
        if (!world_) return std::nullopt;
        return world_->mapId;
    }

    void release_world() override {
        world_.reset();
        ticksLeft_ = 0;
    }

    void apply_world(std::shared_ptr<const world::WorldSnapshot> world) override {
        world_ = std::move(world);
        ticksLeft_ = buildTicks_;
        ++applyCount_;
    }

    bool world_ready() const override {
        if (!world_) return false;
        if (ticksLeft_ > 0) {
            --ticksLeft_;
            return false;
        }
        return true;
    }

    const std::shared_ptr<const world::WorldSnapshot>& world() const { return world_; }
    int apply_count() const { return applyCount_; }

private:
    std::shared_ptr<const world::WorldSnapshot> world_;
    int buildTicks_;
    mutable int ticksLeft_{0};
    int applyCount_{0};
};

} // namespace mapsync::client
