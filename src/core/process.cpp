#include <vsearch_deploy/core/process.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vsearch_deploy {

namespace {

Error MakeRunnerError(const std::vector<std::string>& argv,
                      const std::string& what) {
    return Error{"RunCommand", argv.empty() ? "" : argv.front(),
                 what + ": " + std::strerror(errno), std::nullopt,
                 ErrorCategory::Internal, std::nullopt};
}

bool IsExecutableFile(const std::string& path) {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

// Read stdout and stderr of the child until both reach EOF. Both pipes are
// polled together so a child filling one of them never blocks.
void DrainPipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    std::array<pollfd, 2> fds{{{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}}};
    std::array<std::string*, 2> sinks{{&out, &err}};
    std::array<char, 4096> buf{};
    int open_count = 2;

    while (open_count > 0) {
        int rc = poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // anonymous namespace

Result<CommandOutput, Error> ProcessCommandRunner::Run(
    const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Result<CommandOutput, Error>::Err(Error{
            "RunCommand", "", "empty command line", std::nullopt,
            ErrorCategory::Internal, std::nullopt});
    }

    LogDebug("exec", FormatCommand(argv));

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return Result<CommandOutput, Error>::Err(MakeRunnerError(argv, "pipe failed"));
    }
    if (pipe(err_pipe) != 0) {
        auto error = MakeRunnerError(argv, "pipe failed");
        close(out_pipe[0]);
        close(out_pipe[1]);
        return Result<CommandOutput, Error>::Err(std::move(error));
    }

    pid_t pid = fork();
    if (pid < 0) {
        auto error = MakeRunnerError(argv, "fork failed");
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<CommandOutput, Error>::Err(std::move(error));
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        execvp(cargv[0], cargv.data());

        const char prefix[] = "cannot execute ";
        ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        ignored = write(STDERR_FILENO, cargv[0], std::strlen(cargv[0]));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    CommandOutput output;
    DrainPipes(out_pipe[0], err_pipe[0], output.out, output.err);
    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result<CommandOutput, Error>::Err(
                MakeRunnerError(argv, "waitpid failed"));
        }
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    } else {
        output.exit_code = 1;
    }

    LogDebug("exec", argv.front() + " exited with " +
                         std::to_string(output.exit_code));
    return Result<CommandOutput, Error>::Ok(std::move(output));
}

bool ProcessCommandRunner::IsAvailable(std::string_view tool) {
    return FindOnPath(tool, env_).has_value();
}

std::optional<std::string> FindOnPath(std::string_view tool,
                                      const IEnvironment& env) {
    if (tool.empty()) return std::nullopt;

    std::string name(tool);
    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return name;
        return std::nullopt;
    }

    auto path = env.Get("PATH");
    if (!path.has_value()) return std::nullopt;

    std::istringstream dirs(*path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = dir + "/" + name;
        if (IsExecutableFile(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '"' + arg + '"';
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace vsearch_deploy
