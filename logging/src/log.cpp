#include "log.hpp"
#include "sinks_console.hpp"
#include <cctype>
#include <ctime>
#include <iostream>

namespace trs::log {

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
  std::string s;
  s.reserve(name.size());
  for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (s == "off")     return LogLevel::kOff;
  if (s == "fatal")   return LogLevel::kFatal;
  if (s == "error")   return LogLevel::kError;
  if (s == "warn" || s == "warning") return LogLevel::kWarn;
  if (s == "info")    return LogLevel::kInfo;
  if (s == "debug")   return LogLevel::kDebug;
  if (s == "verbose") return LogLevel::kVerbose;
  return std::nullopt;
}

ConsoleSink::ConsoleSink() : out_(std::clog) {}

void ConsoleSink::write(const LogRecord& r) noexcept {
  const std::time_t secs = static_cast<std::time_t>(r.ts_ns / 1000000000ull);
  const unsigned millis = static_cast<unsigned>((r.ts_ns / 1000000ull) % 1000ull);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char stamp[32];
  const size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);
  stamp[n] = '\0';

  std::scoped_lock lk(mu_);
  try {
    out_ << stamp << '.' << (millis / 100) << ((millis / 10) % 10) << (millis % 10) << 'Z'
         << " [" << ToString(r.level) << "] "
         << r.app_id << '/' << r.ctx_id << ": " << r.message;
    if (r.file) out_ << " (" << r.file << ':' << r.line << ')';
    out_ << '\n';
    out_.flush();
  } catch (const std::ios_base::failure&) {
    out_.clear();
  }
}

} // namespace trs::log
