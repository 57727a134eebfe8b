#pragma once

#include <vsearch_deploy/core/environment.hpp>
#include <vsearch_deploy/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// CommandOutput — captured result of one external command.
// ---------------------------------------------------------------------------
struct CommandOutput {
    int exit_code = 0;
    std::string out;
    std::string err;

    [[nodiscard]] bool Succeeded() const noexcept { return exit_code == 0; }
};

// ---------------------------------------------------------------------------
// ICommandRunner — executes external tools.
//
// Run() returns Ok for any command that was started, whatever its exit code;
// callers inspect CommandOutput::exit_code. Err is reserved for failures of
// the runner itself (no pipe, no fork). A program that cannot be executed
// yields exit code 127.
// ---------------------------------------------------------------------------
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    ICommandRunner(const ICommandRunner&) = delete;
    ICommandRunner& operator=(const ICommandRunner&) = delete;
    ICommandRunner(ICommandRunner&&) = delete;
    ICommandRunner& operator=(ICommandRunner&&) = delete;

    [[nodiscard]] virtual Result<CommandOutput, Error> Run(
        const std::vector<std::string>& argv) = 0;

    // True if `tool` can be resolved to an executable.
    [[nodiscard]] virtual bool IsAvailable(std::string_view tool) = 0;

protected:
    ICommandRunner() = default;
};

// ---------------------------------------------------------------------------
// ProcessCommandRunner — fork/execvp implementation. No shell is involved:
// every argument reaches the program exactly as given.
// ---------------------------------------------------------------------------
class ProcessCommandRunner : public ICommandRunner {
public:
    ProcessCommandRunner() = default;

    [[nodiscard]] Result<CommandOutput, Error> Run(
        const std::vector<std::string>& argv) override;

    [[nodiscard]] bool IsAvailable(std::string_view tool) override;

private:
    ProcessEnvironment env_;
};

// Resolve `tool` against PATH (or check it directly when it contains '/').
std::optional<std::string> FindOnPath(std::string_view tool,
                                      const IEnvironment& env);

// Render argv for log output, quoting arguments that contain spaces.
std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace vsearch_deploy
