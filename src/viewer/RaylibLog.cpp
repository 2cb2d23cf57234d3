#include "viewer/RaylibLog.hpp"

#include "viewer/RaylibShim.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <mutex>

namespace gridroute {

namespace {

std::mutex g_logMutex;
int g_minLevel = -1;

void ForwardTraceLog(int logLevel, const char* text, va_list args)
{
  std::scoped_lock<std::mutex> lock(g_logMutex);
  if (g_minLevel >= 0 && logLevel < g_minLevel) return;

  char buf[2048];
  buf[0] = '\0';
  if (text) std::vsnprintf(buf, sizeof(buf), text, args);

  const std::size_t len = std::strlen(buf);
  std::cerr << "[raylib:" << RaylibLogLevelName(logLevel) << "] " << (len ? buf : "(null)");
  if (len == 0 || buf[len - 1] != '\n') std::cerr << "\n";
  std::cerr.flush();
}

} // namespace

int ParseRaylibLogLevel(const std::string& s, int fallback)
{
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (k == "all") return LOG_ALL;
  if (k == "trace") return LOG_TRACE;
  if (k == "debug") return LOG_DEBUG;
  if (k == "info") return LOG_INFO;
  if (k == "warn" || k == "warning") return LOG_WARNING;
  if (k == "error") return LOG_ERROR;
  if (k == "fatal") return LOG_FATAL;
  if (k == "none" || k == "off") return LOG_NONE;
  return fallback;
}

const char* RaylibLogLevelName(int level)
{
  switch (level) {
    case LOG_TRACE: return "TRACE";
    case LOG_DEBUG: return "DEBUG";
    case LOG_INFO: return "INFO";
    case LOG_WARNING: return "WARN";
    case LOG_ERROR: return "ERROR";
    case LOG_FATAL: return "FATAL";
    default: return "LOG";
  }
}

void InstallRaylibLogCallback(int minLevel)
{
  {
    std::scoped_lock<std::mutex> lock(g_logMutex);
    g_minLevel = minLevel;
  }
  if (minLevel >= 0) SetTraceLogLevel(minLevel);
  SetTraceLogCallback(ForwardTraceLog);
}

void UninstallRaylibLogCallback()
{
  SetTraceLogCallback(nullptr);
}

} // namespace gridroute
