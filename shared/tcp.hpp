#ifndef SPACEARENA_TCP_HPP
#define SPACEARENA_TCP_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

#include "packet.hpp"

// Newline-framed packets over one blocking stream socket. Owns the fd.
class TCPConnection {
public:
    // A peer that sends a longer line without '\n' is dropped.
    static constexpr std::size_t kMaxLine = 1 << 20;

    TCPConnection() = default;
    explicit TCPConnection(int fd, std::string peer = "");
    ~TCPConnection();

    TCPConnection(const TCPConnection &) = delete;
    TCPConnection &operator=(const TCPConnection &) = delete;
    TCPConnection(TCPConnection &&other) noexcept;
    TCPConnection &operator=(TCPConnection &&other) noexcept;

    // host is a dotted address or a resolvable name.
    bool connectToServer(const std::string &host, int port);

    void close();
    // Wakes any thread blocked reading this socket; the fd stays owned.
    void shutdown();

    bool isOpen() const { return m_fd != -1; }
    int fd() const { return m_fd; }
    const std::string &peer() const { return m_peer; }

    // 0 blocks forever.
    bool setRecvTimeout(int ms);

    bool sendPacket(const Packet &p);

    // Next non-empty line, without the '\n'.
    bool recvLine(std::string &line);

    // false on a closed socket or an unparseable line.
    bool recvPacket(Packet &p);

    bool request(const Packet &req, Packet &res);

private:
    bool sendAll(const std::string &bytes);

    int m_fd = -1;
    std::string m_peer;
    std::string m_buf;
};

// Accept loop on its own thread; each accepted socket goes to the handler.
class TCPServer {
public:
    using Handler = std::function<void(TCPConnection)>;

    TCPServer() = default;
    ~TCPServer();

    TCPServer(const TCPServer &) = delete;
    TCPServer &operator=(const TCPServer &) = delete;

    // port 0 picks a free port; see port().
    bool start(int port, Handler handler);
    void stop();

    bool running() const { return m_running; }
    int port() const { return m_port; }

private:
    void acceptLoop(Handler handler);

    int m_listenFd = -1;
    int m_port = 0;
    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
};

#endif
