#include "enet_common.hpp"

#include <mapsync/core/logger.hpp>

#include <enet/enet.h>

namespace mapsync::transport {

ENetInitializer::ENetInitializer() {
    if (enet_initialize() == 0) {
        initialized_ = true;
    } else {
        logf(LogLevel::Error, "enet", "enet_initialize() failed");
    }
}

ENetInitializer::~ENetInitializer() {
    if (initialized_) {
        enet_deinitialize();
    }
}

} // namespace mapsync::transport
