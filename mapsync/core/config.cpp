#include "config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <unordered_map>

namespace mapsync {

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::reset() {
    config_ = MapSyncConfig{};
    loaded_from_path_.clear();
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));
    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    try {
        std::size_t idx = 0;
        int out = std::stoi(s, &idx, 10);
        return idx == s.size() ? out : default_value;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

float Config::parse_float(const std::string& v, float default_value) {
    const std::string s = trim(v);
    try {
        std::size_t idx = 0;
        float out = std::stof(s, &idx);
        return idx == s.size() ? out : default_value;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

std::size_t Config::parse_size(const std::string& v, std::size_t default_value) {
    const int n = parse_int(v, -1);
    return n > 0 ? static_cast<std::size_t>(n) : default_value;
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"debug", LogLevel::Debug}, {"trace", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    const int n = parse_int(s, -1);
    if (n >= 0 && n <= static_cast<int>(LogLevel::Error)) return static_cast<LogLevel>(n);
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "transfer") {
        auto& t = config_.transfer;
        if (k == "chunk_size") t.chunk_size = std::max(kMinChunkSize, parse_size(v, t.chunk_size));
        else if (k == "max_chunks_per_tick") t.max_chunks_per_tick = std::max(1, parse_int(v, t.max_chunks_per_tick));
        else if (k == "bulk_buffer_size") t.bulk_buffer_size = parse_size(v, t.bulk_buffer_size);
        else if (k == "backpressure_threshold") t.backpressure_threshold = parse_size(v, t.backpressure_threshold);
        else if (k == "gameplay_buffer_size") t.gameplay_buffer_size = parse_size(v, t.gameplay_buffer_size);
        else if (k == "identity_timeout") t.identity_timeout = parse_float(v, t.identity_timeout);
        else if (k == "bulk_connect_timeout") t.bulk_connect_timeout = parse_float(v, t.bulk_connect_timeout);
        else if (k == "stall_timeout") t.stall_timeout = parse_float(v, t.stall_timeout);
        else if (k == "progress_interval") t.progress_interval = parse_float(v, t.progress_interval);
        else if (k == "gameplay_fallback") t.gameplay_fallback = parse_bool(v, t.gameplay_fallback);
        else if (k == "max_world_size") t.max_world_size = parse_size(v, t.max_world_size);
        else logf(LogLevel::Debug, "config", "ignoring unknown key [%s] %s", sec.c_str(), k.c_str());
        return;
    }

    if (sec == "network") {
        auto& n = config_.network;
        if (k == "host") n.host = v;
        else if (k == "gameplay_port") n.gameplay_port = static_cast<std::uint16_t>(parse_int(v, n.gameplay_port));
        else if (k == "bulk_port") n.bulk_port = static_cast<std::uint16_t>(parse_int(v, n.bulk_port));
        else if (k == "max_clients") n.max_clients = std::max(1, parse_int(v, n.max_clients));
        return;
    }

    if (sec == "server") {
        if (k == "tick_rate") config_.server.tick_rate = parse_float(v, config_.server.tick_rate);
        return;
    }

    if (sec == "client") {
        if (k == "name") config_.client.name = v;
        else if (k == "frame_rate") config_.client.frame_rate = parse_float(v, config_.client.frame_rate);
        return;
    }

    if (sec == "logging") {
        auto& l = config_.logging;
        if (k == "enabled") l.enabled = parse_bool(v, l.enabled);
        else if (k == "level") l.level = log_level_from_string(v, l.level);
        else if (k == "file") l.file = v;
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    load_from_stream(in);
    loaded_from_path_ = path;
    return true;
}

void Config::load_from_stream(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Comments start at the first '#' or ';'.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::min(hash, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

} // namespace mapsync
