#pragma once

#include <string>

namespace gridroute {

// Routes raylib TraceLog() output into std::cerr so it shows up next to our own
// diagnostics (and in the LogTee file when one is active).

// Accepts (case-insensitive): all, trace, debug, info, warn, warning, error, fatal, none.
// Returns `fallback` for anything else.
int ParseRaylibLogLevel(const std::string& s, int fallback);

const char* RaylibLogLevelName(int level);

// Installs the forwarding callback. minLevel >= 0 also sets raylib's own threshold.
void InstallRaylibLogCallback(int minLevel);

// Restores raylib's default logger.
void UninstallRaylibLogCallback();

} // namespace gridroute
