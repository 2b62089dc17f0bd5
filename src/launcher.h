#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <string>

// ============================================================================
// Launcher
// ============================================================================

namespace Launcher {

// Runs `command` through the shell, detached from this process; returns
// false only if the process could not be started.
bool spawn(const std::string& command);

} // namespace Launcher

#endif
