#include "arena_server.hpp"
#include "arena_json.hpp"
#include "../engine/arena_errors.hpp"

#include <csignal>
#include <iostream>

static std::atomic<bool> g_stop{false};

static void onSignal(int) {
    g_stop = true;
}

static void usage() {
    std::cout << "Usage: spacearena_server [--port N] [--config FILE] [--tick-ms N]\n"
              << "                         [--rate R] [--burst B] [--stats-dir DIR] [--verbose]\n";
}

int main(int argc, char **argv) {
    ServerOptions opts;
    std::string configPath;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        try {
            if (arg == "--port" && hasValue) {
                opts.port = std::stoi(argv[++i]);
            } else if (arg == "--config" && hasValue) {
                configPath = argv[++i];
            } else if (arg == "--tick-ms" && hasValue) {
                opts.tickPeriod = std::chrono::milliseconds(std::stoi(argv[++i]));
            } else if (arg == "--rate" && hasValue) {
                opts.ratePerSec = std::stod(argv[++i]);
            } else if (arg == "--burst" && hasValue) {
                opts.burst = std::stod(argv[++i]);
            } else if (arg == "--stats-dir" && hasValue) {
                opts.statsDir = argv[++i];
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                usage();
                return 0;
            } else {
                std::cerr << "[ArenaServer] Unknown argument: " << arg << "\n";
                usage();
                return 1;
            }
        } catch (const std::exception &) {
            std::cerr << "[ArenaServer] Invalid value for " << arg << ": "
                      << argv[i] << "\n";
            return 1;
        }
    }

    if (opts.port <= 0 || opts.port > 65535) {
        std::cerr << "[ArenaServer] ERROR: port must be in 1..65535\n";
        return 1;
    }
    if (opts.tickPeriod.count() <= 0) {
        std::cerr << "[ArenaServer] ERROR: --tick-ms must be positive\n";
        return 1;
    }

    spacearena::ArenaConfig config;
    try {
        config = configPath.empty() ? spacearena::defaultArenaConfig()
                                    : spacearena::loadArenaConfig(configPath);
    } catch (const spacearena::ArenaError &e) {
        std::cerr << "[ArenaServer] " << e.what() << "\n";
        return 1;
    }
    if (verbose)
        config.verbose = true;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    spacearena::ArenaManager arena(config);
    ArenaServer server(arena, opts);
    if (!server.start())
        return 1;

    std::cout << "[ArenaServer] Arena " << config.width << "x" << config.height
              << ", up to " << config.maxPlayers << " players. Ctrl+C to quit.\n";

    while (!g_stop)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    server.stop();
    return 0;
}
