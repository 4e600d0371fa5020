#include "util/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ci::util {

namespace {

std::string errnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

}

ExecResult execCapture(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("execCapture: empty argv");

    int outPipe[2], errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) != 0) throw std::runtime_error(errnoText("pipe2 failed"));
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        throw std::runtime_error(errnoText("pipe2 failed"));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        throw std::runtime_error(errnoText("fork failed"));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (dup2(outPipe[1], STDOUT_FILENO) == -1 || dup2(errPipe[1], STDERR_FILENO) == -1) _exit(127);
        execvp(args[0], args.data());
        _exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);

    ExecResult result;
    int fds[2] = {outPipe[0], errPipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};

    char buf[8192];
    while (fds[0] >= 0 || fds[1] >= 0) {
        pollfd pfds[2];
        nfds_t n = 0;
        int idx[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[n] = {fds[i], POLLIN, 0};
            idx[n++] = i;
        }

        if (::poll(pfds, n, -1) < 0) {
            if (errno == EINTR) continue;
            closeFd(fds[0]);
            closeFd(fds[1]);
            waitpid(pid, nullptr, 0);
            throw std::runtime_error(errnoText("poll failed"));
        }

        for (nfds_t k = 0; k < n; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const int i = idx[k];
            const ssize_t got = ::read(fds[i], buf, sizeof(buf));
            if (got > 0) sinks[i]->append(buf, static_cast<size_t>(got));
            else if (got == 0 || errno != EINTR) closeFd(fds[i]);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(errnoText("waitpid failed"));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    return result;
}

bool onPath(const std::string& program) {
    const char* env = std::getenv("PATH");
    if (!env) return false;

    const std::string_view path(env);
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(':', start);
        if (end == std::string_view::npos) end = path.size();
        const auto dir = path.substr(start, end - start);
        const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : std::string(dir)) / program;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
        start = end + 1;
    }
    return false;
}

}
