#include <mcp_bridge/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_bridge {

bool IsTerminal(StdStream stream) {
    const int fd = stream == StdStream::Out ? STDOUT_FILENO : STDERR_FILENO;
    return isatty(fd) != 0;
}

bool ColorAllowed(bool is_terminal) {
    return is_terminal && std::getenv("NO_COLOR") == nullptr;
}

bool ColorEnabledFor(StdStream stream) {
    return ColorAllowed(IsTerminal(stream));
}

} // namespace mcp_bridge
