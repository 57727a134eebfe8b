#include <vsearch_deploy/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace vsearch_deploy {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace vsearch_deploy
