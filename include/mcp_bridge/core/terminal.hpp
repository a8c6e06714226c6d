#pragma once

namespace mcp_bridge {

enum class StdStream { Out, Err };

bool IsTerminal(StdStream stream);

/// Color is used on terminals only, and never when NO_COLOR is set
/// (https://no-color.org/).
bool ColorAllowed(bool is_terminal);

/// Tables and errors go to stdout/stderr, logs to stderr.
bool ColorEnabledFor(StdStream stream);

} // namespace mcp_bridge
