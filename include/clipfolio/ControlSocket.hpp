#pragma once
// Single Responsibility: single-instance control socket (one line per connection)

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace clipfolio {

// Sends one command line to a running instance and returns its reply;
// nullopt when nothing is listening
std::optional<std::string> sendControlLine(const std::string& socketPath,
                                           const std::string& line, int timeoutSec = 5);

class ControlServer {
public:
    using Handler = std::function<std::string(const std::string& line)>;

    // requestTimeout bounds the whole read of one request
    explicit ControlServer(std::string socketPath,
                           std::chrono::milliseconds requestTimeout = std::chrono::seconds(2));
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Replaces a stale socket file; false when another instance answers or
    // the socket cannot be bound
    bool listen();
    void close();

    int fd() const { return m_fd; }
    const std::string& path() const { return m_path; }

    // Accepts one client, reads its line and writes handler(line) back.
    // A client that neither ends its line nor closes in time is dropped
    bool acceptOne(const Handler& handler);

private:
    std::string m_path;
    std::chrono::milliseconds m_requestTimeout;
    int m_fd = -1;
};

} // namespace clipfolio
