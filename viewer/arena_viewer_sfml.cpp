#include <SFML/Graphics.hpp>
#include "../shared/tcp.hpp"
#include "../shared/packet.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Read-only view of the arena: polls GET_STATE and draws it.
class ArenaViewer {
private:
    struct Ship {
        std::string id;
        std::string name;
        int x = 0;
        int y = 0;
        int rotation = 0;
        int lives = 0;
        bool shield = false;
        bool active = false;
    };

    struct Shot {
        int x = 0;
        int y = 0;
        int direction = 0;
    };

    struct Snapshot {
        int width = 30;
        int height = 20;
        std::vector<sf::Vector2i> walls;
        std::vector<sf::Vector2i> mines;
        std::vector<Shot> lasers;
        std::vector<Ship> ships;
        bool gameOver = false;
        bool valid = false;
    };

    TCPConnection conn;
    std::atomic<bool> running{true};

    std::mutex stateMutex;
    Snapshot state;

    sf::RenderWindow window;
    sf::Font font;
    bool haveFont = false;

    const int TILE = 30;
    const int HUD = 90;
    const int pollMs;

    int shownWidth = 30;
    int shownHeight = 20;

public:
    ArenaViewer(const std::string &ip, int port, int pollMs)
        : window(sf::VideoMode(900, 600 + 90), "SpaceArena"),
          pollMs(pollMs)
    {
        if (!conn.connectToServer(ip, port)) {
            std::cerr << "[Viewer] Cannot connect to " << ip << ":" << port << "\n";
            running = false;
            return;
        }
        haveFont = font.loadFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
        if (!haveFont)
            std::cerr << "[Viewer] DejaVuSans.ttf not found, HUD text disabled\n";
        std::cout << "[Viewer] Connected to " << ip << ":" << port << "\n";
    }

    int start() {
        if (!running)
            return 1;
        std::thread net(&ArenaViewer::networkThread, this);
        renderLoop();
        running = false;
        conn.shutdown();
        net.join();
        conn.close();
        return 0;
    }

private:
    void networkThread() {
        while (running) {
            Packet res;
            if (!conn.request(Packet::make(PacketType::GET_STATE), res)) {
                if (running)
                    std::cerr << "[Viewer] Connection closed\n";
                running = false;
                break;
            }

            if (res.ok() && res.data.contains("state")) {
                try {
                    Snapshot s = parse(res.data["state"]);
                    std::lock_guard<std::mutex> lk(stateMutex);
                    state = std::move(s);
                } catch (const nlohmann::json::exception &e) {
                    std::cerr << "[Viewer] Bad state payload: " << e.what() << "\n";
                }
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(pollMs));
        }
    }

    static sf::Vector2i cell(const nlohmann::json &c) {
        return sf::Vector2i(c.at(0).get<int>(), c.at(1).get<int>());
    }

    static Snapshot parse(const nlohmann::json &d) {
        Snapshot s;
        s.width = d.value("width", 30);
        s.height = d.value("height", 20);
        s.gameOver = d.value("game_over", false);

        for (auto &w : d.at("walls")) s.walls.push_back(cell(w));
        for (auto &m : d.at("mines")) s.mines.push_back(cell(m));

        for (auto &l : d.at("lasers")) {
            Shot shot;
            sf::Vector2i p = cell(l.at("position"));
            shot.x = p.x;
            shot.y = p.y;
            shot.direction = l.value("direction", 0);
            s.lasers.push_back(shot);
        }

        const auto &players = d.at("players");
        for (auto it = players.begin(); it != players.end(); ++it) {
            Ship ship;
            ship.id = it.key();
            ship.name = it.value().value("name", it.key());
            sf::Vector2i p = cell(it.value().at("position"));
            ship.x = p.x;
            ship.y = p.y;
            ship.rotation = it.value().value("rotation", 0);
            ship.lives = it.value().value("lives", 0);
            ship.shield = it.value().value("shield_active", false);
            ship.active = it.value().value("active", false);
            s.ships.push_back(ship);
        }
        s.valid = true;
        return s;
    }

    void renderLoop() {
        while (window.isOpen() && running) {
            sf::Event e;
            while (window.pollEvent(e)) {
                if (e.type == sf::Event::Closed ||
                    (e.type == sf::Event::KeyPressed && e.key.code == sf::Keyboard::Escape)) {
                    window.close();
                }
            }

            Snapshot s;
            {
                std::lock_guard<std::mutex> lk(stateMutex);
                s = state;
            }
            if (s.valid && (s.width != shownWidth || s.height != shownHeight))
                fitWindow(s.width, s.height);
            draw(s);
            sf::sleep(sf::milliseconds(16));
        }
    }

    void fitWindow(int w, int h) {
        shownWidth = w;
        shownHeight = h;
        unsigned pw = (unsigned)(w * TILE);
        unsigned ph = (unsigned)(h * TILE + HUD);
        window.setSize(sf::Vector2u(pw, ph));
        window.setView(sf::View(sf::FloatRect(0, 0, (float)pw, (float)ph)));
    }

    static sf::Color shipColor(std::size_t index) {
        static const sf::Color colors[] = {
            sf::Color(255, 0, 0), sf::Color(0, 0, 255),
            sf::Color(0, 255, 0), sf::Color(255, 255, 0)
        };
        return colors[index % 4];
    }

    void draw(const Snapshot &s) {
        window.clear(sf::Color(0, 0, 0));

        if (!s.valid) {
            drawText("Waiting for arena state...", 50, 200, 28);
            window.display();
            return;
        }

        sf::RectangleShape tile(sf::Vector2f(TILE - 2, TILE - 2));
        tile.setFillColor(sf::Color(128, 128, 128));
        for (auto &w : s.walls) {
            tile.setPosition(w.x * TILE + 1, w.y * TILE + 1);
            window.draw(tile);
        }

        for (auto &m : s.mines) {
            sf::CircleShape mine(TILE * 0.3f);
            mine.setFillColor(sf::Color(200, 60, 20));
            mine.setOutlineColor(sf::Color::White);
            mine.setOutlineThickness(1);
            mine.setPosition(m.x * TILE + TILE * 0.2f, m.y * TILE + TILE * 0.2f);
            window.draw(mine);
        }

        for (auto &l : s.lasers) {
            bool horizontal = (l.direction == 90 || l.direction == 270);
            sf::RectangleShape beam(horizontal ? sf::Vector2f(TILE, 3) : sf::Vector2f(3, TILE));
            beam.setFillColor(sf::Color::Red);
            if (horizontal)
                beam.setPosition(l.x * TILE, l.y * TILE + TILE / 2 - 1);
            else
                beam.setPosition(l.x * TILE + TILE / 2 - 1, l.y * TILE);
            window.draw(beam);
        }

        for (std::size_t i = 0; i < s.ships.size(); ++i) {
            const Ship &ship = s.ships[i];
            if (!ship.active) continue;

            float cx = ship.x * TILE + TILE / 2.0f;
            float cy = ship.y * TILE + TILE / 2.0f;

            sf::Color c = shipColor(i);
            sf::CircleShape halo(TILE * 0.75f);
            halo.setOrigin(TILE * 0.75f, TILE * 0.75f);
            halo.setPosition(cx, cy);
            halo.setFillColor(sf::Color(c.r, c.g, c.b, 128));
            window.draw(halo);

            sf::CircleShape hull(TILE * 0.4f, 3);
            hull.setOrigin(TILE * 0.4f, TILE * 0.4f);
            hull.setPosition(cx, cy);
            hull.setRotation((float)ship.rotation);
            hull.setFillColor(sf::Color::White);
            window.draw(hull);

            if (ship.shield) {
                sf::CircleShape ring(TILE * 1.5f / 2);
                ring.setOrigin(TILE * 1.5f / 2, TILE * 1.5f / 2);
                ring.setPosition(cx, cy);
                ring.setFillColor(sf::Color::Transparent);
                ring.setOutlineColor(sf::Color(0, 200, 255));
                ring.setOutlineThickness(2);
                window.draw(ring);
            }
        }

        drawHud(s);
        window.display();
    }

    void drawHud(const Snapshot &s) {
        float y = (float)(s.height * TILE + 5);
        float x = 10;
        for (std::size_t i = 0; i < s.ships.size(); ++i) {
            const Ship &ship = s.ships[i];

            sf::CircleShape dot(10);
            dot.setFillColor(shipColor(i));
            dot.setPosition(x, y + 4);
            window.draw(dot);

            std::string line = ship.name + "  lives " + std::to_string(ship.lives);
            if (!ship.active) line += "  (out)";
            if (ship.shield) line += "  [shield]";
            drawText(line, x + 28, y, 18);
            x += 220;
        }

        if (s.gameOver)
            drawText("GAME OVER", 10, y + 40, 28);
    }

    void drawText(const std::string &msg, float x, float y, unsigned size) {
        if (!haveFont) return;
        sf::Text t;
        t.setFont(font);
        t.setCharacterSize(size);
        t.setFillColor(sf::Color::White);
        t.setString(msg);
        t.setPosition(x, y);
        window.draw(t);
    }
};

int main(int argc, char **argv) {
    if (argc < 3) {
        std::cout << "Usage: spacearena_viewer <ip> <port> [poll_ms]\n";
        return 1;
    }

    int port = 0;
    int pollMs = 100;
    try {
        port = std::stoi(argv[2]);
        if (argc >= 4) pollMs = std::stoi(argv[3]);
    } catch (const std::exception &) {
        std::cerr << "[Viewer] Invalid port or poll interval\n";
        return 1;
    }

    ArenaViewer viewer(argv[1], port, pollMs);
    return viewer.start();
}
