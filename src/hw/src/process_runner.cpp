#include "hw/engine_runner.hpp"
#include "core/log.hpp"

#ifdef _WIN32
#include <cstdio>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace tlc::hw {

#ifdef _WIN32

RunOutput ProcessEngineRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    (void)timeout; // _popen offers no deadline; the smoke encodes are bounded by their own duration
    RunOutput out;
    if (argv.empty()) return out;
    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += "\"" + a + "\"";
    }
    cmd += " 2>&1";
    FILE* pipe = _popen(cmd.c_str(), "r");
    if (!pipe) {
        log::warn("Failed to launch " + argv.front());
        return out;
    }
    out.launched = true;
    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) out.output.append(buf, n);
    out.exit_code = _pclose(pipe);
    return out;
}

#else

RunOutput ProcessEngineRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    RunOutput out;
    if (argv.empty()) return out;

    int fds[2];
    if (pipe(fds) != 0) {
        log::warn(std::string("pipe() failed: ") + std::strerror(errno));
        return out;
    }

    pid_t pid = fork();
    if (pid < 0) {
        log::warn(std::string("fork() failed: ") + std::strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return out;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);
    out.launched = true;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            out.timed_out = true;
            kill(pid, SIGKILL);
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int r = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) continue;
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n <= 0) break;
        out.output.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
        if (out.exit_code == 127) out.launched = false;
    } else {
        out.exit_code = -1;
    }
    return out;
}

#endif

} // namespace tlc::hw
