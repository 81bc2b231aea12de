#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace geocity {

// RAII helper that copies std::cout/std::cerr output into a log file.
//
// Console output is unchanged. In the file, every line is prefixed with a UTC
// timestamp and the stream tag:
//   2026-01-27T16:40:12.345Z [OUT] generated 128x128 world
//
// Existing logs rotate as <log> -> <log>.1 -> ... -> <log>.keepFiles.

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

  // Restarts if already active.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers.
  void stop();

  bool active() const { return m_impl != nullptr; }
  std::filesystem::path path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace geocity
