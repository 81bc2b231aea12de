#pragma once

// Strict argument parsing helpers for the GeoCity command line tools.
//
// Every parser rejects leading/trailing junk and reports failure through its
// return value; the output is only written on success.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace geocity::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  // from_chars does not take a leading '+'.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Decimal or 0x-prefixed hex.
inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);

  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Finite values only.
inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;
  if (std::isspace(static_cast<unsigned char>(s.front()))) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseF32(std::string_view s, float* out)
{
  if (!out) return false;
  double v = 0.0;
  if (!ParseF64(s, &v)) return false;
  if (std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) return false;
  *out = static_cast<float>(v);
  return true;
}

// 0/1, true/false, on/off, yes/no in any letter case.
inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string k(s);
  for (char& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (k == "0" || k == "false" || k == "off" || k == "no") {
    *out = false;
    return true;
  }
  if (k == "1" || k == "true" || k == "on" || k == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "128x96" (or "128X96"); both sides must be positive.
inline bool ParseWxH(std::string_view s, int* outW, int* outH)
{
  if (!outW || !outH) return false;
  const std::size_t pos = s.find_first_of("xX");
  if (pos == std::string_view::npos) return false;
  int w = 0;
  int h = 0;
  if (!ParseI32(s.substr(0, pos), &w) || !ParseI32(s.substr(pos + 1), &h)) return false;
  if (w <= 0 || h <= 0) return false;
  *outW = w;
  *outH = h;
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace geocity::cli
