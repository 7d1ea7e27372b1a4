// mapsync_client - Headless client that downloads the server's world and
// follows it through regenerations.

#include <mapsync/client/map_client.hpp>
#include <mapsync/client/world_integration.hpp>
#include <mapsync/core/config.hpp>
#include <mapsync/core/logger.hpp>
#include <mapsync/transport/enet_client.hpp>
#include <mapsync/transport/enet_common.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      INI configuration file\n";
    std::cout << "  --host <address>     Server address (default: 127.0.0.1)\n";
    std::cout << "  --port <port>        Gameplay port (default: 7777)\n";
    std::cout << "  --bulk-port <port>   Bulk transfer port (default: 7778)\n";
    std::cout << "  --name <name>        Player name\n";
    std::cout << "  --id <id>            Client unique id (default: random)\n";
    std::cout << "  --verbose            Debug logging\n";
    std::cout << "  --help               Show this help message\n";
}

struct Args {
    std::string configPath;
    std::string host;
    int port = -1;
    int bulkPort = -1;
    std::string name;
    std::string uniqueId;
    bool verbose = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--host") == 0 && i + 1 < argc) {
            args.host = argv[++i];
        }
        else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
            args.port = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--bulk-port") == 0 && i + 1 < argc) {
            args.bulkPort = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--name") == 0 && i + 1 < argc) {
            args.name = argv[++i];
        }
        else if (std::strcmp(arg, "--id") == 0 && i + 1 < argc) {
            args.uniqueId = argv[++i];
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    using mapsync::state::GameState;

    Args args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& cfg = mapsync::Config::instance();
    const bool configRead = args.configPath.empty() || cfg.load_from_file(args.configPath);

    auto& settings = cfg.mutable_config();
    if (!args.host.empty()) settings.network.host = args.host;
    if (args.port > 0) settings.network.gameplay_port = static_cast<std::uint16_t>(args.port);
    if (args.bulkPort > 0) settings.network.bulk_port = static_cast<std::uint16_t>(args.bulkPort);
    if (!args.name.empty()) settings.client.name = args.name;
    if (args.verbose) settings.logging.level = mapsync::LogLevel::Debug;

    mapsync::Logger::instance().init(cfg.logging());
    if (!configRead) {
        mapsync::logf(mapsync::LogLevel::Warning, "client", "could not read %s, using defaults",
                      args.configPath.c_str());
    }

    mapsync::transport::ENetInitializer enetInit;
    if (!enetInit.is_initialized()) {
        mapsync::logf(mapsync::LogLevel::Error, "client", "failed to initialize ENet");
        return 1;
    }

    const auto net = cfg.network();
    auto gameplay = std::make_shared<mapsync::transport::ENetClientTransport>("gameplay");
    auto bulk = std::make_shared<mapsync::transport::ENetClientTransport>("bulk");

    mapsync::client::LocalWorldIntegration world;
    mapsync::client::MapClient client(gameplay, bulk, world, cfg.transfer(), cfg.client().name, args.uniqueId);

    client.set_bulk_connector([bulk, net]() {
        if (bulk->is_connected() || bulk->is_connecting()) return;
        if (!bulk->connect(net.host, net.bulk_port, 0)) {
            mapsync::logf(mapsync::LogLevel::Error, "client", "could not start bulk connection to %s:%u",
                          net.host.c_str(), static_cast<unsigned>(net.bulk_port));
        }
    });

    client.onStateChanged = [&client, &world](GameState oldState, GameState newState) {
        mapsync::logf(mapsync::LogLevel::Info, "client", "%s -> %s",
                      mapsync::state::display_name(oldState), mapsync::state::display_name(newState));
        if (newState == GameState::Playing && world.world()) {
            const auto& w = *world.world();
            mapsync::logf(mapsync::LogLevel::Info, "client", "playing on '%s' (%dx%dx%d)",
                          w.mapId.c_str(), w.width, w.height, w.depth);
        }
        if (newState == GameState::Error) {
            const auto* msg = client.context().get_data<std::string>(
                mapsync::client::GameStateManager::kErrorMessageKey);
            mapsync::logf(mapsync::LogLevel::Error, "client", "%s", msg ? msg->c_str() : "unknown error");
        }
    };

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    client.begin_connecting();
    if (!gameplay->connect(net.host, net.gameplay_port, 0)) {
        mapsync::logf(mapsync::LogLevel::Error, "client", "could not start connection to %s:%u",
                      net.host.c_str(), static_cast<unsigned>(net.gameplay_port));
        return 1;
    }

    using Clock = std::chrono::steady_clock;
    const float frameRate = cfg.client().frame_rate > 0.0f ? cfg.client().frame_rate : 60.0f;
    const auto frame = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<float>(1.0f / frameRate));

    auto last = Clock::now();
    while (g_running) {
        const auto now = Clock::now();
        const float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        try {
            client.update(dt);
        } catch (const std::exception& e) {
            mapsync::logf(mapsync::LogLevel::Error, "client", "update failed: %s", e.what());
            client.return_to_lobby();
            mapsync::Logger::instance().shutdown();
            return 1;
        }

        const GameState s = client.state();
        if (s == GameState::Error || s == GameState::ConnectionLost) {
            break;
        }

        std::this_thread::sleep_until(now + frame);
    }

    const bool failed = client.state() == GameState::Error || client.state() == GameState::ConnectionLost;
    client.return_to_lobby();
    mapsync::Logger::instance().shutdown();
    return failed ? 1 : 0;
}
