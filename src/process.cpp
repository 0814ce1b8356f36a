#include "process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace collab {

ProcessResult run_process(const std::vector<std::string>& argv, const std::string& cwd) {
    ProcessResult result;
    if (argv.empty()) {
        result.err = "No command given";
        return result;
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        result.err = std::string("Failed to create pipes: ") + std::strerror(errno);
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        result.err = std::string("Failed to create pipes: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.err = std::string("Failed to fork process: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    std::array<char, 4096> buffer;
    struct pollfd fds[2];
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;

    while (open_fds > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            // EOF or error
            close(fds[i].fd);
            fds[i].fd = -1;
            --open_fds;
        }
    }
    for (auto& pfd : fds) {
        if (pfd.fd >= 0) close(pfd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.err += std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127 && result.out.empty() && result.err.empty()) {
            result.err = "Failed to execute " + argv[0];
        }
    }
    return result;
}

} // namespace collab
