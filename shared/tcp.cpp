#include "tcp.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

static void setNoDelay(int fd) {
    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
        perror("setsockopt(TCP_NODELAY)");
}

static std::string peerName(const sockaddr_in &addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

// ========================================================
// TCPConnection
// ========================================================

TCPConnection::TCPConnection(int fd, std::string peer)
    : m_fd(fd), m_peer(std::move(peer))
{
}

TCPConnection::~TCPConnection() {
    close();
}

TCPConnection::TCPConnection(TCPConnection &&other) noexcept
    : m_fd(other.m_fd),
      m_peer(std::move(other.m_peer)),
      m_buf(std::move(other.m_buf))
{
    other.m_fd = -1;
}

TCPConnection &TCPConnection::operator=(TCPConnection &&other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        m_peer = std::move(other.m_peer);
        m_buf = std::move(other.m_buf);
        other.m_fd = -1;
    }
    return *this;
}

void TCPConnection::close() {
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_buf.clear();
}

void TCPConnection::shutdown() {
    if (m_fd != -1)
        ::shutdown(m_fd, SHUT_RDWR);
}

bool TCPConnection::connectToServer(const std::string &host, int port) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        std::cerr << "[TCP] Cannot resolve " << host << ": " << gai_strerror(rc) << "\n";
        return false;
    }

    for (addrinfo *ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            perror("socket");
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            m_fd = fd;
            m_peer = peerName(*reinterpret_cast<sockaddr_in*>(ai->ai_addr));
            break;
        }
        perror("connect");
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (m_fd == -1)
        return false;

    setNoDelay(m_fd);
    return true;
}

bool TCPConnection::setRecvTimeout(int ms) {
    if (m_fd == -1)
        return false;

    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        perror("setsockopt(SO_RCVTIMEO)");
        return false;
    }
    return true;
}

bool TCPConnection::sendAll(const std::string &bytes) {
    std::size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::send(m_fd, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0) {
            perror("send");
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

bool TCPConnection::sendPacket(const Packet &p) {
    if (m_fd == -1)
        return false;
    return sendAll(p.serialize());
}

bool TCPConnection::recvLine(std::string &line) {
    if (m_fd == -1)
        return false;

    while (true) {
        std::size_t nl;
        while ((nl = m_buf.find('\n')) != std::string::npos) {
            line.assign(m_buf, 0, nl);
            m_buf.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                return true;
        }

        if (m_buf.size() > kMaxLine) {
            std::cerr << "[TCP] " << m_peer << " sent an oversized line, dropping\n";
            return false;
        }

        char chunk[4096];
        ssize_t n = ::recv(m_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        m_buf.append(chunk, (std::size_t)n);
    }
}

bool TCPConnection::recvPacket(Packet &p) {
    std::string line;
    if (!recvLine(line))
        return false;

    try {
        p = Packet::deserialize(line);
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "[TCP] Packet parse error: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool TCPConnection::request(const Packet &req, Packet &res) {
    return sendPacket(req) && recvPacket(res);
}

// ========================================================
// TCPServer
// ========================================================

TCPServer::~TCPServer() {
    stop();
}

bool TCPServer::start(int port, Handler handler) {
    if (m_running) {
        std::cerr << "[TCPServer] Already running\n";
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        perror("socket");
        return false;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("bind");
        ::close(fd);
        return false;
    }
    if (::listen(fd, 16) < 0) {
        perror("listen");
        ::close(fd);
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
        m_port = ntohs(addr.sin_port);
    else
        m_port = port;

    m_listenFd = fd;
    m_running = true;
    m_acceptThread = std::thread(&TCPServer::acceptLoop, this, std::move(handler));
    return true;
}

void TCPServer::acceptLoop(Handler handler) {
    while (m_running) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept(m_listenFd, reinterpret_cast<sockaddr*>(&caddr), &clen);

        if (cfd < 0) {
            if (errno == EINTR || errno == ECONNABORTED)
                continue;
            if (m_running)
                perror("accept");
            break;
        }

        setNoDelay(cfd);
        handler(TCPConnection(cfd, peerName(caddr)));
    }
}

void TCPServer::stop() {
    if (!m_running.exchange(false))
        return;

    ::shutdown(m_listenFd, SHUT_RDWR);
    if (m_acceptThread.joinable())
        m_acceptThread.join();

    ::close(m_listenFd);
    m_listenFd = -1;
}
