#include "geocity/LogTee.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>

namespace geocity {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms);

  const std::time_t tt = static_cast<std::time_t>(secs.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>((ms - secs).count()));
  return std::string(buf);
}

// The log file shared by both tee buffers.
struct FileSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;

  // Writes n bytes, prefixing each new line. Caller holds the mutex.
  std::streamsize write(const char* s, std::streamsize n, const char* tag)
  {
    std::streambuf* out = file.rdbuf();
    if (!out) return 0;
    if (!prefixLines) return out->sputn(s, n);

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (atLineStart) {
        const std::string prefix = UtcTimestamp() + " [" + tag + "] ";
        if (out->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size())) !=
            static_cast<std::streamsize>(prefix.size())) {
          return p - s;
        }
        atLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const std::streamsize chunk = nl ? static_cast<std::streamsize>(nl - p + 1) : static_cast<std::streamsize>(end - p);
      const std::streamsize wr = out->sputn(p, chunk);
      if (wr < chunk) return (p - s) + std::max<std::streamsize>(0, wr);

      p += chunk;
      if (nl) {
        atLineStart = true;
        // Keep the file current line by line so a crash loses nothing already printed.
        out->pubsync();
      }
    }
    return n;
  }
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, FileSink* sink, const char* tag) : m_console(console), m_sink(sink), m_tag(tag) {}

  std::streambuf* console() const { return m_console; }

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
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const std::streamsize a = m_console->sputn(s, n);
    const std::streamsize b = m_sink->write(s, n, m_tag);
    return std::min(a, b);
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const int a = m_console->pubsync();
    const int b = m_sink->file.rdbuf() ? m_sink->file.rdbuf()->pubsync() : -1;
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streambuf* m_console = nullptr;
  FileSink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  FileSink sink;
  std::unique_ptr<TeeBuf> out;
  std::unique_ptr<TeeBuf> err;
};

LogTee::LogTee() = default;

LogTee::~LogTee() { stop(); }

std::filesystem::path LogTee::path() const
{
  return m_impl ? m_impl->path : std::filesystem::path();
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;

    const std::filesystem::path dst = RotatedPath(basePath, i);
    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      std::ostringstream oss;
      oss << "failed to rotate log '" << src.string() << "' -> '" << dst.string() << "': " << ec.message();
      outError = oss.str();
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
    impl->out = std::make_unique<TeeBuf>(std::cout.rdbuf(), &impl->sink, "OUT");
    std::cout.rdbuf(impl->out.get());
  }
  if (opt.teeStderr) {
    impl->err = std::make_unique<TeeBuf>(std::cerr.rdbuf(), &impl->sink, "ERR");
    std::cerr.rdbuf(impl->err.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Detach before the file closes so late output only reaches the console.
  if (m_impl->out && std::cout.rdbuf() == m_impl->out.get()) std::cout.rdbuf(m_impl->out->console());
  if (m_impl->err && std::cerr.rdbuf() == m_impl->err.get()) std::cerr.rdbuf(m_impl->err->console());

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace geocity
