/**
 * @file log.hpp
 * @brief Synchronous printf-style category logger.
 *
 * Lines are written to stderr as:
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [category] message (file:line)
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Two filters apply: the compile-time floor AWP_LOG_MIN_LEVEL (0=DEBUG ..
 * 4=FATAL) removes calls entirely, the runtime level drops them early.
 *
 * An optional hook observes every formatted line. Logging never fails from
 * the caller's point of view.
 */

#ifndef AWP_LOG_HPP_
#define AWP_LOG_HPP_

#include "awp/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(AWP_PLATFORM_LINUX) || defined(AWP_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef AWP_LOG_MIN_LEVEL
#define AWP_LOG_MIN_LEVEL 0
#endif

namespace awp {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Hook invoked with every line that passes the level filters.
 *
 * Runs in the logging thread while the output lock is held; must not log.
 */
using LogHookFn = void (*)(Level level, const char* category, const char* message, void* ctx);

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline std::atomic<Level>& LogLevelAtomic() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline Level LogLevelRef() noexcept { return LogLevelAtomic().load(std::memory_order_relaxed); }

struct LogState {
  std::mutex mtx;
  LogHookFn hook{nullptr};
  void* hook_ctx{nullptr};
  std::atomic<bool> initialized{false};

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(AWP_PLATFORM_LINUX) || defined(AWP_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                      tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1, tm_local->tm_mday,
                        tm_local->tm_hour, tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelAtomic().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept { return detail::LogLevelRef(); }

inline void Init() noexcept {
  detail::LogState::Instance().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& state = detail::LogState::Instance();
  (void)std::fflush(stderr);
  state.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::LogState::Instance().initialized.load(std::memory_order_acquire);
}

/** @brief Install (or clear with nullptr) the line hook. */
inline void SetHook(LogHookFn fn, void* ctx = nullptr) noexcept {
  auto& state = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(state.mtx);
  state.hook = fn;
  state.hook_ctx = ctx;
}

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(detail::LogLevelRef())) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  const char* cat = (category != nullptr) ? category : "";
  auto& state = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(state.mtx);
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf, detail::LevelTag(level), cat, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf, detail::LevelTag(level), cat,
                     message, detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
  if (state.hook != nullptr) {
    state.hook(level, cat, message, state.hook_ctx);
  }
}

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace awp

// ============================================================================
// Macros
// ============================================================================

#define AWP_LOG_DEBUG(cat, fmt, ...)                                                          \
  do {                                                                                        \
    if (AWP_LOG_MIN_LEVEL <= 0) {                                                             \
      ::awp::log::LogWrite(::awp::log::Level::kDebug, cat, __FILE__, __LINE__, fmt,           \
                           ##__VA_ARGS__);                                                    \
    }                                                                                         \
  } while (0)

#define AWP_LOG_INFO(cat, fmt, ...)                                                           \
  do {                                                                                        \
    if (AWP_LOG_MIN_LEVEL <= 1) {                                                             \
      ::awp::log::LogWrite(::awp::log::Level::kInfo, cat, __FILE__, __LINE__, fmt,            \
                           ##__VA_ARGS__);                                                    \
    }                                                                                         \
  } while (0)

#define AWP_LOG_WARN(cat, fmt, ...)                                                           \
  do {                                                                                        \
    if (AWP_LOG_MIN_LEVEL <= 2) {                                                             \
      ::awp::log::LogWrite(::awp::log::Level::kWarn, cat, __FILE__, __LINE__, fmt,            \
                           ##__VA_ARGS__);                                                    \
    }                                                                                         \
  } while (0)

#define AWP_LOG_ERROR(cat, fmt, ...)                                                          \
  do {                                                                                        \
    if (AWP_LOG_MIN_LEVEL <= 3) {                                                             \
      ::awp::log::LogWrite(::awp::log::Level::kError, cat, __FILE__, __LINE__, fmt,           \
                           ##__VA_ARGS__);                                                    \
    }                                                                                         \
  } while (0)

#define AWP_LOG_FATAL(cat, fmt, ...)                                                          \
  do {                                                                                        \
    ::awp::log::LogWrite(::awp::log::Level::kFatal, cat, __FILE__, __LINE__, fmt,             \
                         ##__VA_ARGS__);                                                      \
    std::abort();                                                                             \
  } while (0)

#endif  // AWP_LOG_HPP_
