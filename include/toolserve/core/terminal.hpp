#pragma once

namespace toolserve {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether console logs should be colored: explicit flags win,
/// then NO_COLOR, then TTY detection.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace toolserve
