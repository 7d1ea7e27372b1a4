// mapsync_server - Headless map distribution server
// Publishes a world and streams it to every client over ENet.

#include <mapsync/core/config.hpp>
#include <mapsync/core/logger.hpp>
#include <mapsync/core/server_engine.hpp>
#include <mapsync/server/map_server.hpp>
#include <mapsync/transport/enet_common.hpp>
#include <mapsync/transport/enet_server.hpp>
#include <mapsync/world/world_snapshot.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifndef MAPSYNC_VERSION
#define MAPSYNC_VERSION "0.0.0-dev"
#endif

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>          INI configuration file\n";
    std::cout << "  --port <port>            Gameplay port (default: 7777)\n";
    std::cout << "  --bulk-port <port>       Bulk transfer port (default: 7778)\n";
    std::cout << "  --max-clients <n>        Maximum clients (default: 32)\n";
    std::cout << "  --tickrate <n>           Server tick rate (default: 30)\n";
    std::cout << "  --seed <n>               World seed (default: 1)\n";
    std::cout << "  --size <w> <h> <d>       World dimensions (default: 256 64 256)\n";
    std::cout << "  --regenerate-every <s>   Publish a new world every s seconds\n";
    std::cout << "  --verbose                Debug logging\n";
    std::cout << "  --quiet                  Disable logging\n";
    std::cout << "  --help                   Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --port 7777 --bulk-port 7778 --seed 42\n";
}

struct Args {
    std::string configPath;
    int port = -1;
    int bulkPort = -1;
    int maxClients = -1;
    float tickRate = -1.0f;
    std::uint64_t seed = 1;
    std::int32_t width = 256;
    std::int32_t height = 64;
    std::int32_t depth = 256;
    float regenerateEvery = 0.0f;
    bool verbose = false;
    bool quiet = false;
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
        else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
            args.port = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--bulk-port") == 0 && i + 1 < argc) {
            args.bulkPort = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--max-clients") == 0 && i + 1 < argc) {
            args.maxClients = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--tickrate") == 0 && i + 1 < argc) {
            args.tickRate = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--seed") == 0 && i + 1 < argc) {
            args.seed = std::strtoull(argv[++i], nullptr, 10);
        }
        else if (std::strcmp(arg, "--size") == 0 && i + 3 < argc) {
            args.width = std::atoi(argv[++i]);
            args.height = std::atoi(argv[++i]);
            args.depth = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--regenerate-every") == 0 && i + 1 < argc) {
            args.regenerateEvery = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

std::string map_id_for(std::uint64_t seed, int generation) {
    return "map-" + std::to_string(seed) + "-" + std::to_string(generation);
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& cfg = mapsync::Config::instance();
    const bool configRead = args.configPath.empty() || cfg.load_from_file(args.configPath);

    auto& settings = cfg.mutable_config();
    if (args.port > 0) settings.network.gameplay_port = static_cast<std::uint16_t>(args.port);
    if (args.bulkPort > 0) settings.network.bulk_port = static_cast<std::uint16_t>(args.bulkPort);
    if (args.maxClients > 0) settings.network.max_clients = args.maxClients;
    if (args.tickRate > 0.0f) settings.server.tick_rate = args.tickRate;
    if (args.quiet) settings.logging.enabled = false;
    if (args.verbose) settings.logging.level = mapsync::LogLevel::Debug;

    mapsync::Logger::instance().init(cfg.logging());
    mapsync::logf(mapsync::LogLevel::Info, "server", "mapsync server v%s", MAPSYNC_VERSION);
    if (!configRead) {
        mapsync::logf(mapsync::LogLevel::Warning, "server", "could not read %s, using defaults",
                      args.configPath.c_str());
    }

    mapsync::transport::ENetInitializer enetInit;
    if (!enetInit.is_initialized()) {
        mapsync::logf(mapsync::LogLevel::Error, "server", "failed to initialize ENet");
        return 1;
    }

    const auto& net = cfg.network();
    auto gameplay = std::make_shared<mapsync::transport::ENetServerTransport>("gameplay");
    auto bulk = std::make_shared<mapsync::transport::ENetServerTransport>("bulk");

    if (!gameplay->start(net.gameplay_port, static_cast<std::size_t>(net.max_clients))) {
        mapsync::logf(mapsync::LogLevel::Error, "server", "failed to listen on gameplay port %u",
                      static_cast<unsigned>(net.gameplay_port));
        return 1;
    }
    if (!bulk->start(net.bulk_port, static_cast<std::size_t>(net.max_clients))) {
        mapsync::logf(mapsync::LogLevel::Error, "server", "failed to listen on bulk port %u",
                      static_cast<unsigned>(net.bulk_port));
        return 1;
    }

    mapsync::server::MapServer server(gameplay, bulk, cfg.transfer());

    server.onPhaseChanged = [](mapsync::server::ServerPhase oldPhase, mapsync::server::ServerPhase newPhase) {
        mapsync::logf(mapsync::LogLevel::Info, "server", "phase %s -> %s",
                      mapsync::server::to_string(oldPhase), mapsync::server::to_string(newPhase));
    };

    int generation = 0;
    std::uint64_t seed = args.seed;

    auto publish = [&](const char* reason) {
        try {
            auto world = mapsync::world::make_test_world(map_id_for(seed, generation), seed,
                                                         args.width, args.height, args.depth);
            server.publish_world(mapsync::world::make_world_blob(world), seed, reason);
            return true;
        } catch (const std::exception& e) {
            mapsync::logf(mapsync::LogLevel::Error, "server", "could not build world: %s", e.what());
            return false;
        }
    };

    if (!publish("initial map")) {
        return 1;
    }

    mapsync::ServerEngine::Config engineConfig;
    engineConfig.tickRate = cfg.server().tick_rate;
    mapsync::ServerEngine engine(engineConfig);

    std::thread engineThread([&engine, &server]() { engine.run(server); });

    mapsync::logf(mapsync::LogLevel::Info, "server", "gameplay port %u, bulk port %u, Ctrl+C stops",
                  static_cast<unsigned>(net.gameplay_port), static_cast<unsigned>(net.bulk_port));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto lastPublish = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (args.regenerateEvery > 0.0f) {
            const auto elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - lastPublish);
            if (elapsed.count() >= args.regenerateEvery) {
                ++generation;
                ++seed;
                publish("scheduled regeneration");
                lastPublish = std::chrono::steady_clock::now();
            }
        }
    }

    mapsync::logf(mapsync::LogLevel::Info, "server", "shutting down");
    engine.stop();
    engineThread.join();

    bulk->stop();
    gameplay->stop();
    mapsync::logf(mapsync::LogLevel::Info, "server", "stopped");
    mapsync::Logger::instance().shutdown();

    return 0;
}
