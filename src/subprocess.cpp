#include "subprocess.hpp"
#include "errors.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pipe(std::array<int, 2>& pipefd) {
    for (int fd : pipefd) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
    pipefd = {-1, -1};
}

std::vector<char*> build_argv(std::vector<std::string>& storage) {
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return argv;
}

// Drains both pipes until EOF so neither side can block on a full buffer.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    std::array<pollfd, 2> fds{{{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}}};
    std::array<std::string*, 2> sinks{{&out, &err}};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw AutocommitError(UnexpectedError{"poll failed: " + std::string(std::strerror(errno))});
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

std::string format_command(const std::vector<std::string>& args) {
    std::string result;
    for (const auto& arg : args) {
        if (!result.empty()) result += ' ';
        if (arg.find_first_of(" \t\n\"'") != std::string::npos) {
            std::string quoted = "'";
            for (char c : arg) {
                if (c == '\'') quoted += "'\\''";
                else quoted += c;
            }
            result += quoted + "'";
        } else {
            result += arg;
        }
    }
    return result;
}

CommandResult run_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw AutocommitError(UnexpectedError{"run_command called without a program"});
    }
    spdlog::debug("Running {}", format_command(args));

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    if (::pipe(out_pipe.data()) < 0 || ::pipe(err_pipe.data()) < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw AutocommitError::tool("Could not create pipes", format_command(args), std::strerror(errno));
    }

    std::vector<std::string> storage = args;
    std::vector<char*> argv = build_argv(storage);

    pid_t pid = ::fork();
    if (pid < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw AutocommitError::tool("Could not fork", format_command(args), std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        ::execvp(argv[0], argv.data());
        std::string msg = std::string(argv[0]) + ": " + std::strerror(errno) + "\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg.data(), msg.size());
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    CommandResult result;
    try {
        drain(out_pipe[0], err_pipe[0], result.stdout_output, result.stderr_output);
    } catch (...) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::waitpid(pid, nullptr, 0);
        throw;
    }
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw AutocommitError::tool("waitpid failed", format_command(args), std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
