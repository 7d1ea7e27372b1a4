#include "serialization.hpp"

#include <mapsync/core/byte_buffer.hpp>
#include <mapsync/core/logger.hpp>

#include <limits>
#include <stdexcept>
#include <type_traits>

namespace mapsync::proto {

const char* message_name(const Message& msg) {
    return std::visit([](const auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ClientIdentification>) return "ClientIdentification";
        else if constexpr (std::is_same_v<T, ClientStateChange>) return "ClientStateChange";
        else if constexpr (std::is_same_v<T, TransferBegin>) return "TransferBegin";
        else if constexpr (std::is_same_v<T, MapChunk>) return "MapChunk";
        else if constexpr (std::is_same_v<T, TransferComplete>) return "TransferComplete";
        else if constexpr (std::is_same_v<T, AllClientProgress>) return "AllClientProgress";
        else if constexpr (std::is_same_v<T, MapRegenerationStart>) return "MapRegenerationStart";
    }, msg);
}

// ============================================================================
// Serialize
// ============================================================================

std::vector<std::uint8_t> serialize(const Message& msg) {
    ByteWriter w;

    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        // --- Identity ---
        if constexpr (std::is_same_v<T, ClientIdentification>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::ClientIdentification));
            w.write_string(m.clientUniqueId);
            w.write_string(m.preferredName);
        }
        else if constexpr (std::is_same_v<T, ClientStateChange>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::ClientStateChange));
            w.write_string(m.oldState);
            w.write_string(m.newState);
        }
        // --- Transfer ---
        else if constexpr (std::is_same_v<T, TransferBegin>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::TransferBegin));
            w.write_string(m.mapId);
            w.write_i32(m.totalChunks);
            w.write_i64(m.totalSize);
        }
        else if constexpr (std::is_same_v<T, MapChunk>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::MapChunk));
            w.write_string(m.mapId);
            w.write_i32(m.chunkIndex);
            w.write_i32(m.totalChunks);
            w.write_blob(m.payload);
        }
        else if constexpr (std::is_same_v<T, TransferComplete>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::TransferComplete));
            w.write_string(m.mapId);
        }
        else if constexpr (std::is_same_v<T, AllClientProgress>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::AllClientProgress));
            if (m.clientToChunkProgress.size() > std::numeric_limits<std::uint16_t>::max()) {
                throw std::runtime_error("AllClientProgress: too many clients");
            }
            w.write_u16(static_cast<std::uint16_t>(m.clientToChunkProgress.size()));
            for (const auto& [clientId, chunkIndex] : m.clientToChunkProgress) {
                w.write_string(clientId);
                w.write_i32(chunkIndex);
            }
        }
        // --- Regeneration ---
        else if constexpr (std::is_same_v<T, MapRegenerationStart>) {
            w.write_u8(static_cast<std::uint8_t>(MessageType::MapRegenerationStart));
            w.write_u64(m.newMapSeed);
            w.write_string(m.reason);
            w.write_i64(m.timestamp);
        }
    }, msg);

    return w.take();
}

// ============================================================================
// Deserialize
// ============================================================================

namespace {

Message read_body(MessageType type, ByteReader& r) {
    switch (type) {
        // --- Identity ---
        case MessageType::ClientIdentification: {
            ClientIdentification m;
            m.clientUniqueId = r.read_string();
            m.preferredName = r.read_string();
            return m;
        }
        case MessageType::ClientStateChange: {
            ClientStateChange m;
            m.oldState = r.read_string();
            m.newState = r.read_string();
            return m;
        }
        // --- Transfer ---
        case MessageType::TransferBegin: {
            TransferBegin m;
            m.mapId = r.read_string();
            m.totalChunks = r.read_i32();
            m.totalSize = r.read_i64();
            return m;
        }
        case MessageType::MapChunk: {
            MapChunk m;
            m.mapId = r.read_string();
            m.chunkIndex = r.read_i32();
            m.totalChunks = r.read_i32();
            m.payload = r.read_blob();
            return m;
        }
        case MessageType::TransferComplete: {
            TransferComplete m;
            m.mapId = r.read_string();
            return m;
        }
        case MessageType::AllClientProgress: {
            AllClientProgress m;
            const std::uint16_t count = r.read_u16();
            for (std::uint16_t i = 0; i < count; ++i) {
                std::string clientId = r.read_string();
                m.clientToChunkProgress[std::move(clientId)] = r.read_i32();
            }
            return m;
        }
        // --- Regeneration ---
        case MessageType::MapRegenerationStart: {
            MapRegenerationStart m;
            m.newMapSeed = r.read_u64();
            m.reason = r.read_string();
            m.timestamp = r.read_i64();
            return m;
        }
    }
    throw std::runtime_error("unknown message type");
}

} // namespace

std::optional<Message> deserialize(std::span<const std::uint8_t> data) {
    if (data.empty()) return std::nullopt;

    try {
        ByteReader r(data);
        auto type = static_cast<MessageType>(r.read_u8());
        Message msg = read_body(type, r);

        if (!r.at_end()) {
            logf(LogLevel::Warning, "proto", "%s has %zu trailing bytes", message_name(msg), r.remaining());
            return std::nullopt;
        }
        return msg;
    } catch (const std::runtime_error& e) {
        logf(LogLevel::Warning, "proto", "dropping malformed message (%zu bytes): %s", data.size(), e.what());
        return std::nullopt;
    }
}

} // namespace mapsync::proto
