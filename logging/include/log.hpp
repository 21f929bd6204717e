// logging/include/log.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <utility>
#include <sstream>
#include <optional>

namespace trs::log {

// ---------- Log levels ----------
enum class LogLevel : uint8_t { kOff, kFatal, kError, kWarn, kInfo, kDebug, kVerbose };

inline constexpr std::string_view ToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kFatal:   return "FATAL";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kWarn:    return "WARN";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kVerbose: return "VERBOSE";
    default:                 return "OFF";
  }
}

// Accepts "off", "fatal", "error", "warn", "info", "debug", "verbose" in any case.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// ---------- Record & sink ----------
struct LogRecord {
  std::string app_id;  // process-wide, e.g. "TRS"
  std::string ctx_id;  // component, e.g. "STOR"
  LogLevel    level;
  std::string message;
  // wall-clock timestamp in ns since epoch
  uint64_t    ts_ns;
  const char* file = nullptr;
  uint32_t    line = 0;
};

// Sinks are shared by every logger and may be called from several threads at once.
struct ISink {
  virtual ~ISink() = default;
  virtual void write(const LogRecord& rec) noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;

// ---------- Manager (global config & sinks) ----------
class LogManager {
public:
  static LogManager& Instance() {
    static LogManager g;
    return g;
  }

  void SetAppId(std::string app) {
    std::scoped_lock lk(mu_);
    app_id_ = std::move(app);
  }

  // Default level for loggers created afterwards
  void SetDefaultLevel(LogLevel lvl) {
    std::scoped_lock lk(mu_);
    default_level_ = lvl;
  }

  void AddSink(SinkPtr s) {
    std::scoped_lock lk(mu_);
    sinks_.push_back(std::move(s));
  }

  void ClearSinks() {
    std::scoped_lock lk(mu_);
    sinks_.clear();
  }

  void Snapshot(std::vector<SinkPtr>& out, std::string& app, LogLevel& def) const {
    std::scoped_lock lk(mu_);
    out = sinks_; app = app_id_; def = default_level_;
  }

private:
  LogManager() = default;
  mutable std::mutex mu_;
  std::vector<SinkPtr> sinks_;
  std::string app_id_{"TRS"};
  LogLevel default_level_{LogLevel::kInfo};
};

// ---------- Logger (per-context) ----------
// A logger copies the manager's sinks and level when it is created; sinks added
// later are not seen by existing loggers.
class Logger {
public:
  static Logger CreateLogger(std::string ctxId, std::optional<LogLevel> level = std::nullopt) {
    std::vector<SinkPtr> sinks; std::string app; LogLevel def{};
    LogManager::Instance().Snapshot(sinks, app, def);
    return Logger(std::move(ctxId), std::move(app), std::move(sinks), level.value_or(def));
  }

  LogLevel Level() const noexcept { return level_; }
  void SetLevel(LogLevel lvl) noexcept { level_ = lvl; }

  bool IsEnabled(LogLevel lvl) const noexcept {
    if (level_ == LogLevel::kOff || lvl == LogLevel::kOff) return false;
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level_);
  }

  void Log(LogLevel lvl, std::string_view msg, const char* file = nullptr, uint32_t line = 0) const {
    if (!IsEnabled(lvl)) return;
    LogRecord r;
    r.app_id = app_id_;
    r.ctx_id = ctx_id_;
    r.level  = lvl;
    r.message = std::string(msg);
    r.file = file;
    r.line = line;
    r.ts_ns = NowNs();
    for (const auto& s : sinks_) if (s) s->write(r);
  }

  void Fatal (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kFatal, m,f,l); }
  void Error (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kError, m,f,l); }
  void Warn  (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kWarn,  m,f,l); }
  void Info  (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kInfo,  m,f,l); }
  void Debug (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kDebug, m,f,l); }

  // "{}" placeholders are replaced in order by operator<< of the arguments
  template <typename... Args>
  void LogF(LogLevel lvl, const char* file, uint32_t line, std::string_view fmt, Args&&... args) const {
    if (!IsEnabled(lvl)) return;
    std::ostringstream oss;
    FormatInto(oss, fmt, std::forward<Args>(args)...);
    Log(lvl, oss.str(), file, line);
  }

  template <typename... Args> void FatalF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kFatal,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void ErrorF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kError,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void WarnF  (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kWarn,    f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void InfoF  (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kInfo,    f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void DebugF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kDebug,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void VerboseF(const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kVerbose, f,l,fmt,std::forward<Args>(a)...); }

  const std::string& ContextId() const noexcept { return ctx_id_; }

private:
  Logger(std::string ctx, std::string app, std::vector<SinkPtr> sinks, LogLevel lvl)
      : ctx_id_(std::move(ctx)), app_id_(std::move(app)),
        sinks_(std::move(sinks)), level_(lvl) {}

  static uint64_t NowNs() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
  }

  static void ReplaceFirstBrace(std::ostringstream& oss, std::string_view& fmt) {
    auto pos = fmt.find("{}");
    if (pos == std::string_view::npos) { oss << fmt; fmt = {}; return; }
    oss << fmt.substr(0, pos);
    fmt.remove_prefix(pos + 2);
  }
  template <typename T, typename... Rest>
  static void FormatInto(std::ostringstream& oss, std::string_view fmt, T&& value, Rest&&... rest) {
    ReplaceFirstBrace(oss, fmt);
    oss << std::forward<T>(value);
    if constexpr (sizeof...(rest) == 0) { oss << fmt; }
    else { FormatInto(oss, fmt, std::forward<Rest>(rest)...); }
  }
  static void FormatInto(std::ostringstream& oss, std::string_view fmt) { oss << fmt; }

  std::string ctx_id_;
  std::string app_id_;
  std::vector<SinkPtr> sinks_;
  LogLevel level_;
};

// ---------- Convenience macros to capture file/line ----------
#define TRS_LOGFATAL(lg, fmt, ...)   (lg).FatalF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define TRS_LOGERROR(lg, fmt, ...)   (lg).ErrorF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define TRS_LOGWARN(lg,  fmt, ...)   (lg).WarnF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define TRS_LOGINFO(lg,  fmt, ...)   (lg).InfoF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define TRS_LOGDEBUG(lg, fmt, ...)   (lg).DebugF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define TRS_LOGVERBOSE(lg, fmt, ...) (lg).VerboseF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)

} // namespace trs::log
