#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace gridroute {

// RAII helper that mirrors std::cout/std::cerr into a log file.
//
// Console output is untouched. Each line written to the file may be prefixed with
// a UTC timestamp and the source stream:
//   2026-03-02T09:14:55.120Z [ERR] unreachable: no path from 'house_3' ...
//
// Previous logs are rotated on start: <log> -> <log>.1 -> <log>.2 ... (keepFiles deep).

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops a previous session first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers. Safe to call repeatedly.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

  // "YYYY-MM-DDTHH:MM:SS.mmmZ"
  static std::string TimestampUtcNow();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace gridroute
