#include "gridroute/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <streambuf>
#include <system_error>
#include <utility>

namespace gridroute {

namespace {

std::filesystem::path BackupPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

// Shared state for the two tee buffers: one file, one lock, one line cursor.
struct LogSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
};

class TeeStreamBuf final : public std::streambuf {
public:
  TeeStreamBuf(std::streambuf* console, LogSink* sink, const char* tag)
      : m_console(console)
      , m_sink(sink)
      , m_tag(tag)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::scoped_lock<std::mutex> lock(m_sink->mutex);
    const std::streamsize written = m_console->sputn(s, n);
    writeFileLocked(s, n);
    return written;
  }

  int sync() override
  {
    std::scoped_lock<std::mutex> lock(m_sink->mutex);
    const int rc = m_console->pubsync();
    m_sink->file.flush();
    return (rc == 0 && m_sink->file) ? 0 : -1;
  }

private:
  // File errors never affect the console stream.
  void writeFileLocked(const char* s, std::streamsize n)
  {
    std::ofstream& f = m_sink->file;
    if (!f) return;

    if (!m_sink->prefixLines) {
      f.write(s, n);
      return;
    }

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_sink->atLineStart) {
        f << LogTee::TimestampUtcNow() << " [" << m_tag << "] ";
        m_sink->atLineStart = false;
      }

      const char* nl = p;
      while (nl < end && *nl != '\n') ++nl;
      const bool hasNl = nl < end;
      const char* stop = hasNl ? nl + 1 : end;
      f.write(p, stop - p);
      p = stop;

      if (hasNl) {
        m_sink->atLineStart = true;
        f.flush();
      }
    }
  }

  std::streambuf* m_console = nullptr;
  LogSink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  LogSink sink;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeStreamBuf> coutBuf;
  std::unique_ptr<TeeStreamBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kNone;
  return m_impl ? m_impl->path : kNone;
}

std::string LogTee::TimestampUtcNow()
{
  using namespace std::chrono;
  const auto now = system_clock::now().time_since_epoch();
  const auto secs = duration_cast<seconds>(now);
  const auto ms = duration_cast<milliseconds>(now - secs);

  const std::time_t tt = static_cast<std::time_t>(secs.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
  return buf;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = BackupPath(basePath, i - 1);
    const std::filesystem::path dst = BackupPath(basePath, i);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->sink.prefixLines = opt.prefixLines;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeStreamBuf>(impl->origCout, &impl->sink, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeStreamBuf>(impl->origCerr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so teardown output does not reach a closing file.
  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace gridroute
