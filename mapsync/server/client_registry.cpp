#include "client_registry.hpp"

#include <mapsync/core/logger.hpp>

#include <algorithm>

namespace mapsync::server {

namespace {
constexpr const char* kTag = "server";
}

void ClientRegistry::on_connect(ClientId gameplayId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientProfile profile;
    profile.gameplayId = gameplayId;
    active_[gameplayId] = std::move(profile);
}

bool ClientRegistry::identify(ClientId gameplayId, const std::string& uniqueId, const std::string& userName) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = active_.find(gameplayId);
    if (it == active_.end()) {
        logf(LogLevel::Warning, kTag, "identification from unknown connection %u", gameplayId);
        return false;
    }

    ClientProfile& profile = it->second;
    if (profile.identified() && profile.clientUniqueId != uniqueId) {
        logf(LogLevel::Warning, kTag, "connection %u re-identified as '%s' (was '%s')",
             gameplayId, uniqueId.c_str(), profile.clientUniqueId.c_str());
    }

    bool restored = false;
    auto old = inactive_.find(uniqueId);
    if (old != inactive_.end()) {
        profile.currentState = old->second.currentState;
        profile.stateSequence = old->second.stateSequence;
        profile.userName = old->second.userName;
        inactive_.erase(old);
        restored = true;
    }

    profile.clientUniqueId = uniqueId;
    if (!userName.empty()) {
        profile.userName = userName;
    }
    profile.status = ClientProfile::Status::Connected;

    logf(LogLevel::Info, kTag, "client %u identified as '%s' (%s)%s", gameplayId, uniqueId.c_str(),
         profile.userName.c_str(), restored ? ", profile restored" : "");
    return restored;
}

bool ClientRegistry::set_state(ClientId gameplayId, const std::string& stateName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(gameplayId);
    if (it == active_.end()) return false;
    it->second.currentState = stateName;
    it->second.stateSequence = nextSequence_++;
    return true;
}

void ClientRegistry::on_disconnect(ClientId gameplayId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(gameplayId);
    if (it == active_.end()) return;

    ClientProfile profile = std::move(it->second);
    active_.erase(it);

    if (!profile.identified()) return;

    profile.status = ClientProfile::Status::Disconnected;
    profile.gameplayId = kInvalidClientId;
    std::string key = profile.clientUniqueId;
    inactive_[key] = std::move(profile);
}

std::optional<ClientProfile> ClientRegistry::find(ClientId gameplayId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(gameplayId);
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

std::optional<ClientProfile> ClientRegistry::find_inactive(const std::string& uniqueId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inactive_.find(uniqueId);
    if (it == inactive_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ClientRegistry::unique_id(ClientId gameplayId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(gameplayId);
    if (it == active_.end() || !it->second.identified()) return std::nullopt;
    return it->second.clientUniqueId;
}

transfer::ReportedState ClientRegistry::reported_state(ClientId gameplayId) const {
    std::string name;
    transfer::ReportedState out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(gameplayId);
        if (it == active_.end()) return out;
        name = it->second.currentState;
        out.sequence = it->second.stateSequence;
    }
    if (!name.empty()) {
        out.state = state::parse_game_state(name);
    }
    return out;
}

bool ClientRegistry::is_connected(ClientId gameplayId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(gameplayId) != 0;
}

std::vector<ClientId> ClientRegistry::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientId> ids;
    ids.reserve(active_.size());
    for (const auto& [id, profile] : active_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<ClientProfile> ClientRegistry::connected_profiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientProfile> out;
    out.reserve(active_.size());
    for (const auto& [id, profile] : active_) {
        out.push_back(profile);
    }
    std::sort(out.begin(), out.end(),
              [](const ClientProfile& a, const ClientProfile& b) { return a.gameplayId < b.gameplayId; });
    return out;
}

std::size_t ClientRegistry::connected_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::size_t ClientRegistry::inactive_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inactive_.size();
}

void ClientRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.clear();
    inactive_.clear();
}

} // namespace mapsync::server
