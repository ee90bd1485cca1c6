// Unix socket IPC between clipfolio instances, the compositor plugin and
// shortcut bindings. Request: one line, then EOF. Reply: one JSON line.

#include "clipfolio/ControlSocket.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace clipfolio {

static constexpr size_t MAX_REQUEST = 1024 * 1024;

static bool fillAddress(const std::string& path, sockaddr_un& addr) {
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) return false;
    addr = {};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

static bool writeAll(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<size_t>(n);
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else {
            return false;
        }
    }
    return true;
}

static std::string readAll(int fd, size_t limit) {
    std::string data;
    char buf[4096];
    while (data.size() < limit) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            data.append(buf, static_cast<size_t>(n));
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return data;
}

// Reads up to the first newline or EOF. nullopt when the deadline passes
// first or the connection fails.
static std::optional<std::string> readLine(int fd, size_t limit,
                                           std::chrono::steady_clock::time_point deadline) {
    std::string data;
    char buf[4096];
    while (data.size() < limit) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return std::nullopt;

        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready == -1 && errno == EINTR) continue;
        if (ready <= 0) return std::nullopt;

        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            size_t start = data.size();
            data.append(buf, static_cast<size_t>(n));
            size_t newline = data.find('\n', start);
            if (newline != std::string::npos) {
                data.resize(newline);
                return data;
            }
        } else if (n == 0) {
            return data;
        } else if (errno != EINTR) {
            return std::nullopt;
        }
    }
    return data;
}

// ============================================================================
// Client
// ============================================================================

std::optional<std::string> sendControlLine(const std::string& socketPath,
                                           const std::string& line, int timeoutSec) {
    sockaddr_un addr{};
    if (!fillAddress(socketPath, addr)) return std::nullopt;

    int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock == -1) return std::nullopt;

    struct timeval tv{timeoutSec, 0};
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        ::close(sock);
        return std::nullopt;
    }

    if (!writeAll(sock, line + "\n")) {
        ::close(sock);
        return std::nullopt;
    }
    shutdown(sock, SHUT_WR);

    std::string reply = readAll(sock, MAX_REQUEST);
    ::close(sock);

    while (!reply.empty() && (reply.back() == '\n' || reply.back() == '\r')) reply.pop_back();
    return reply;
}

// ============================================================================
// Server
// ============================================================================

ControlServer::ControlServer(std::string socketPath, std::chrono::milliseconds requestTimeout)
    : m_path(std::move(socketPath)), m_requestTimeout(requestTimeout) {
}

ControlServer::~ControlServer() {
    close();
}

bool ControlServer::listen() {
    sockaddr_un addr{};
    if (!fillAddress(m_path, addr)) {
        spdlog::error("[Control] Invalid socket path '{}'", m_path);
        return false;
    }

    // A live instance owns the path; a dead one leaves a stale file behind
    int liveCheck = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (liveCheck != -1) {
        bool alive = connect(liveCheck, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
        ::close(liveCheck);
        if (alive) {
            spdlog::warn("[Control] Another instance is listening on {}", m_path);
            return false;
        }
    }
    unlink(m_path.c_str());

    m_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_fd == -1) return false;

    if (bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1 ||
        ::listen(m_fd, 5) == -1) {
        spdlog::error("[Control] Cannot listen on {}: {}", m_path, std::strerror(errno));
        ::close(m_fd);
        m_fd = -1;
        return false;
    }

    spdlog::info("[Control] Listening on {}", m_path);
    return true;
}

void ControlServer::close() {
    if (m_fd < 0) return;
    ::close(m_fd);
    m_fd = -1;
    unlink(m_path.c_str());
}

bool ControlServer::acceptOne(const Handler& handler) {
    if (m_fd < 0) return false;

    int client = accept4(m_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (client == -1) return false;

    // The reply must not stall the loop either
    auto timeoutUs = std::chrono::duration_cast<std::chrono::microseconds>(m_requestTimeout).count();
    struct timeval tv{static_cast<time_t>(timeoutUs / 1000000),
                      static_cast<suseconds_t>(timeoutUs % 1000000)};
    setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    auto received = readLine(client, MAX_REQUEST,
                             std::chrono::steady_clock::now() + m_requestTimeout);
    if (!received) {
        spdlog::warn("[Control] Dropping client: no complete request within {} ms",
                     m_requestTimeout.count());
        ::close(client);
        return true;
    }

    std::string line = std::move(*received);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (!line.empty()) {
        spdlog::debug("[Control] <- {}", line);
        writeAll(client, handler(line) + "\n");
    }
    ::close(client);
    return true;
}

} // namespace clipfolio
