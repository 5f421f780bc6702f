//! # POSIX Process Runner
//!
//! fork + execve with pipe-based output capture. Both pipes are drained
//! with poll() while the child runs so a chatty child cannot block on a
//! full pipe buffer.

#include "core/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cannyup {

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty())
            out += ' ';
        bool quote = arg.empty() || arg.find_first_of(" \t\"'$") != std::string::npos;
        if (quote) {
            out += '\'' + arg + '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

namespace {

void close_pair(int fds[2]) {
    if (fds[0] >= 0)
        close(fds[0]);
    if (fds[1] >= 0)
        close(fds[1]);
}

/// Reads from both descriptors until each reports EOF.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

Result<ProcessResult, Error> PosixProcessRunner::run(const CommandSpec& command,
                                                     const ProcessEnvironment& env) {
    if (command.argv.empty()) {
        return Error::environment("empty command line");
    }

    auto program = env.find_executable(command.argv[0]);
    if (!program) {
        return Error::environment("command not found: " + command.argv[0]);
    }

    fs::path workdir = command.cwd ? *command.cwd : env.cwd();
    CANNYUP_LOG_DEBUG("process", "exec " << describe_command(command.argv)
                                         << (workdir.empty() ? "" : " (in " + workdir.string() + ")"));

    // Build argv/envp before fork(): no allocation in the child.
    std::vector<char*> c_argv;
    c_argv.reserve(command.argv.size() + 1);
    for (const auto& a : command.argv) {
        c_argv.push_back(const_cast<char*>(a.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<std::string> env_strings = env.to_envp();
    std::vector<char*> c_envp;
    c_envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings) {
        c_envp.push_back(e.data());
    }
    c_envp.push_back(nullptr);

    std::string program_str = program->string();
    std::string workdir_str = workdir.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (command.mode == OutputMode::Capture) {
        if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
            int saved = errno;
            close_pair(out_pipe);
            close_pair(err_pipe);
            return Error::environment(std::string("failed to create pipes: ") +
                                      std::strerror(saved));
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return Error::environment(std::string("failed to fork: ") + std::strerror(saved));
    }

    if (pid == 0) {
        if (command.mode == OutputMode::Capture) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close_pair(out_pipe);
            close_pair(err_pipe);
        } else if (command.mode == OutputMode::Discard) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        if (!workdir_str.empty() && chdir(workdir_str.c_str()) != 0) {
            _exit(126);
        }
        execve(program_str.c_str(), c_argv.data(), c_envp.data());
        _exit(127);
    }

    ProcessResult result;
    if (command.mode == OutputMode::Capture) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        drain(out_pipe[0], err_pipe[0], result.stdout_output, result.stderr_output);
        close(out_pipe[0]);
        close(err_pipe[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error::environment(std::string("failed to wait for ") + command.argv[0] + ": " +
                                      std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    CANNYUP_LOG_DEBUG("process", command.argv[0] << " exited with " << result.exit_code);
    return result;
}

} // namespace cannyup
