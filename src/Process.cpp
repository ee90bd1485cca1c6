#include "clipfolio/Process.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clipfolio {

// ============================================================================
// fork + exec helpers
// ============================================================================

static std::vector<char*> toCArgs(const Argv& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    return args;
}

static void redirectToNull(int fd) {
    int null = open("/dev/null", O_RDWR);
    if (null >= 0) {
        dup2(null, fd);
        close(null);
    }
}

// Child side: never returns
[[noreturn]] static void execChild(const std::vector<char*>& args) {
    execvp(args[0], args.data());
    _exit(127);
}

static int waitChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool runCommand(const Argv& argv) {
    if (argv.empty()) return false;
    auto args = toCArgs(argv);

    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("[Process] fork failed for {}: {}", argv[0], std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        redirectToNull(STDIN_FILENO);
        redirectToNull(STDOUT_FILENO);
        redirectToNull(STDERR_FILENO);
        execChild(args);
    }

    int rc = waitChild(pid);
    if (rc != 0) spdlog::debug("[Process] {} exited with {}", argv[0], rc);
    return rc == 0;
}

std::optional<std::string> captureOutput(const Argv& argv) {
    if (argv.empty()) return std::nullopt;
    auto args = toCArgs(argv);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        spdlog::error("[Process] pipe failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(fds[0]);
        close(fds[1]);
        spdlog::error("[Process] fork failed for {}: {}", argv[0], std::strerror(errno));
        return std::nullopt;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        redirectToNull(STDIN_FILENO);
        redirectToNull(STDERR_FILENO);
        execChild(args);
    }

    close(fds[1]);
    std::string output;
    char buf[65536];
    for (;;) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fds[0]);

    if (waitChild(pid) != 0) return std::nullopt;
    return output;
}

bool feedInput(const Argv& argv, std::string_view input) {
    if (argv.empty()) return false;
    auto args = toCArgs(argv);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        spdlog::error("[Process] pipe failed: {}", std::strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(fds[0]);
        close(fds[1]);
        spdlog::error("[Process] fork failed for {}: {}", argv[0], std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        dup2(fds[0], STDIN_FILENO);
        redirectToNull(STDOUT_FILENO);
        redirectToNull(STDERR_FILENO);
        execChild(args);
    }

    close(fds[0]);

    // A reader that exits early must not kill us with SIGPIPE
    struct sigaction ignore{}, previous{};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore, &previous);

    bool complete = true;
    size_t offset = 0;
    while (offset < input.size()) {
        ssize_t n = write(fds[1], input.data() + offset, input.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else {
            complete = false;
            break;
        }
    }
    close(fds[1]);
    sigaction(SIGPIPE, &previous, nullptr);

    int rc = waitChild(pid);
    if (!complete) spdlog::warn("[Process] {} closed its input early", argv[0]);
    return complete && rc == 0;
}

bool spawnDetached(const Argv& argv) {
    if (argv.empty()) return false;
    auto args = toCArgs(argv);

    // Double fork so the grandchild is reparented and never becomes a zombie
    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("[Process] fork failed for {}: {}", argv[0], std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        setsid();
        if (fork() != 0) _exit(0);
        redirectToNull(STDIN_FILENO);
        redirectToNull(STDOUT_FILENO);
        redirectToNull(STDERR_FILENO);
        execChild(args);
    }
    return waitChild(pid) == 0;
}

} // namespace clipfolio
