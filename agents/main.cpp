#include "arena_client.hpp"
#include "agent.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace spacearena;

static std::atomic<bool> g_stop{false};

static void onSignal(int) {
    g_stop = true;
}

static void usage() {
    std::cout << "Usage: spacearena_agent --id ID [--name NAME] [--policy wall|random]\n"
              << "                        [--host IP] [--port N] [--seed N] [--step-ms N]\n"
              << "                        [--fire-every N]\n";
}

int main(int argc, char **argv) {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::string id;
    std::string name;
    std::string policy = "wall";
    unsigned seed = (unsigned)std::chrono::steady_clock::now().time_since_epoch().count();
    int stepMs = 100;
    int fireEvery = 20;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        try {
            if (arg == "--host" && hasValue)            host = argv[++i];
            else if (arg == "--port" && hasValue)       port = std::stoi(argv[++i]);
            else if (arg == "--id" && hasValue)         id = argv[++i];
            else if (arg == "--name" && hasValue)       name = argv[++i];
            else if (arg == "--policy" && hasValue)     policy = argv[++i];
            else if (arg == "--seed" && hasValue)       seed = (unsigned)std::stoul(argv[++i]);
            else if (arg == "--step-ms" && hasValue)    stepMs = std::stoi(argv[++i]);
            else if (arg == "--fire-every" && hasValue) fireEvery = std::stoi(argv[++i]);
            else {
                usage();
                return 1;
            }
        } catch (const std::exception &) {
            std::cerr << "[Agent] Invalid value for " << arg << "\n";
            return 1;
        }
    }

    if (id.empty()) {
        usage();
        return 1;
    }

    std::unique_ptr<Agent> agent;
    if (policy == "random")
        agent.reset(new RandomAgent(seed));
    else if (policy == "wall")
        agent.reset(new WallFollowingAgent(fireEvery));
    else {
        std::cerr << "[Agent] Unknown policy '" << policy << "'\n";
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    ArenaClient client;
    const int maxRetries = 3;
    bool registered = false;
    for (int attempt = 1; attempt <= maxRetries && !g_stop; ++attempt) {
        std::cout << "[Agent] Registration attempt " << attempt << "/" << maxRetries << "\n";

        std::string error;
        if ((client.connected() || client.connect(host, port)) &&
            client.registerPlayer(id, name, error)) {
            registered = true;
            break;
        }
        std::cerr << "[Agent] Registration failed: "
                  << (error.empty() ? "cannot connect" : error) << "\n";
        if (attempt < maxRetries)
            std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    if (!registered) {
        std::cerr << "[Agent] Giving up.\n";
        return 1;
    }

    std::cout << "[Agent] '" << id << "' flying with the " << agent->policyName()
              << " policy. Ctrl+C to quit.\n";

    bool wasOver = false;
    while (!g_stop) {
        Observation obs;
        std::string error;
        if (!client.observe(id, obs, error)) {
            if (error == "ConnectionLost") {
                std::cerr << "[Agent] Lost connection to the arena.\n";
                break;
            }
        } else {
            if (obs.gameOver && !wasOver)
                std::cout << "[Agent] Game over.\n";
            wasOver = obs.gameOver;

            AgentAction act = agent->decide(obs);
            if (!client.perform(id, act, error)) {
                if (error == "ConnectionLost") {
                    std::cerr << "[Agent] Lost connection to the arena.\n";
                    break;
                }
                agent->onRejected(act, error);
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(stepMs));
    }

    if (client.connected() && client.unregisterPlayer(id))
        std::cout << "[Agent] Unregistered '" << id << "'\n";
    return 0;
}
