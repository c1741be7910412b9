#pragma once

namespace docmcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

// Colored logs only when stderr is a TTY and NO_COLOR is unset. The tool
// host's stderr is normally a pipe owned by the parent, so it logs plain.
bool UseColorLogs();

} // namespace docmcp
