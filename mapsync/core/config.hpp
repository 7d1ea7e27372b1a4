#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace mapsync {

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};
};

/// Smallest chunk_size accepted. Clients use it to bound the chunk count a
/// TransferBegin may announce.
static constexpr std::size_t kMinChunkSize = 256;

struct TransferConfig {
    std::size_t chunk_size{8192};
    int max_chunks_per_tick{500};

    // Bulk connections are sized for throughput, gameplay connections for latency.
    std::size_t bulk_buffer_size{65536};
    std::size_t backpressure_threshold{57344};  // 88% of bulk_buffer_size
    std::size_t gameplay_buffer_size{8192};

    // Seconds.
    float identity_timeout{10.0f};
    float bulk_connect_timeout{30.0f};
    float stall_timeout{30.0f};
    float progress_interval{0.5f};

    bool gameplay_fallback{false};

    // Largest world a client accepts, in bytes.
    std::size_t max_world_size{256u * 1024u * 1024u};

    std::size_t gameplay_backpressure_threshold() const {
        return gameplay_buffer_size * 88 / 100;
    }
};

struct NetworkConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t gameplay_port{7777};
    std::uint16_t bulk_port{7778};
    int max_clients{32};
};

struct ServerSettings {
    float tick_rate{30.0f};
};

struct ClientSettings {
    std::string name{"Player"};
    float frame_rate{60.0f};
};

struct MapSyncConfig {
    TransferConfig transfer{};
    NetworkConfig network{};
    LoggingConfig logging{};
    ServerSettings server{};
    ClientSettings client{};
};

class Config {
public:
    static Config& instance();

    /// Returns false if the file cannot be opened; defaults stay in effect.
    bool load_from_file(const std::string& path);
    void load_from_stream(std::istream& in);

    /// Restores every value to its default.
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const MapSyncConfig& get() const { return config_; }
    MapSyncConfig& mutable_config() { return config_; }

    const TransferConfig& transfer() const { return config_.transfer; }
    const NetworkConfig& network() const { return config_.network; }
    const LoggingConfig& logging() const { return config_.logging; }
    const ServerSettings& server() const { return config_.server; }
    const ClientSettings& client() const { return config_.client; }

    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);

private:
    Config() = default;

    MapSyncConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static float parse_float(const std::string& v, float default_value);
    static std::size_t parse_size(const std::string& v, std::size_t default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace mapsync
