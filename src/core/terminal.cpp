#include <docmcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace docmcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool UseColorLogs() {
    return IsStderrTty() && !NoColorEnvSet();
}

} // namespace docmcp
