/**
 * @file log.hpp
 * @brief Leveled printf-style logging for mscale components.
 *
 * Output format (stderr by default):
 *   [2026-10-19 08:15:02.120] [WARN] [Directory] message (directory.hpp:212)
 *
 * Filtering happens twice:
 *   - compile time: MSCALE_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes calls
 *   - run time:     log::SetLevel() drops records below the threshold
 *
 * An embedding process may redirect records with log::SetSink().
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_LOG_HPP_
#define MSCALE_LOG_HPP_

#include "mscale/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(MSCALE_PLATFORM_LINUX) || defined(MSCALE_PLATFORM_MACOS)
#include <sys/time.h>
#endif

#ifndef MSCALE_LOG_MIN_LEVEL
#define MSCALE_LOG_MIN_LEVEL 0
#endif

#ifndef MSCALE_LOG_MAX_MESSAGE
#define MSCALE_LOG_MAX_MESSAGE 512U
#endif

namespace mscale {
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
 * @brief Sink callback receiving one formatted record.
 *
 * @p message is already printf-expanded and truncated to
 * MSCALE_LOG_MAX_MESSAGE - 1 characters.
 */
using SinkFn = void (*)(Level level, const char* category, const char* file,
                        int line, const char* message, void* ctx);

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

struct SinkState {
  std::mutex mutex;
  SinkFn fn = nullptr;
  void* ctx = nullptr;
  bool initialized = false;
};

inline SinkState& Sink() noexcept {
  static SinkState state;
  return state;
}

inline constexpr const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff: return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, uint32_t size) noexcept {
#if defined(MSCALE_PLATFORM_LINUX) || defined(MSCALE_PLATFORM_MACOS)
  struct timeval tv;
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  (void)localtime_r(&sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld",
                      static_cast<long>(tv.tv_usec / 1000));
#else
  time_t sec = std::time(nullptr);
  (void)std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", std::localtime(&sec));
#endif
}

inline void StderrWrite(Level level, const char* category, const char* file,
                        int line, const char* message) noexcept {
  char ts[40];
  FormatTimestamp(ts, sizeof(ts));
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts, LevelTag(level),
                     category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     LevelTag(level), category, message, Basename(file),
                     line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/** Mark the logger as initialized; records go to stderr until SetSink(). */
inline void Init() noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.initialized = true;
}

/** Flush stderr, drop any custom sink and mark the logger uninitialized. */
inline void Shutdown() noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.fn = nullptr;
  sink.ctx = nullptr;
  sink.initialized = false;
  (void)std::fflush(stderr);
}

inline bool IsInitialized() noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  return sink.initialized;
}

/** Route records to @p fn; pass nullptr to restore the stderr writer. */
inline void SetSink(SinkFn fn, void* ctx = nullptr) noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.fn = fn;
  sink.ctx = ctx;
}

/** Parse "debug" / "info" / "warn" / "error" / "fatal" / "off". */
inline bool ParseLevel(const char* str, Level& out) noexcept {
  if (str == nullptr) return false;
  struct Name {
    const char* text;
    Level level;
  };
  static constexpr Name kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    if (::mscale::detail::AsciiCaseEqual(str, n.text)) {
      out = n.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char message[MSCALE_LOG_MAX_MESSAGE];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  if (sink.fn != nullptr) {
    sink.fn(level, category, file, line, message, sink.ctx);
    return;
  }
  detail::StderrWrite(level, category, file, line, message);
}

MSCALE_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace mscale

// ============================================================================
// Macros
// ============================================================================

#define MSCALE_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                       \
    if (MSCALE_LOG_MIN_LEVEL <= 0) {                                         \
      ::mscale::log::LogWrite(::mscale::log::Level::kDebug, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define MSCALE_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                       \
    if (MSCALE_LOG_MIN_LEVEL <= 1) {                                         \
      ::mscale::log::LogWrite(::mscale::log::Level::kInfo, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define MSCALE_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                       \
    if (MSCALE_LOG_MIN_LEVEL <= 2) {                                         \
      ::mscale::log::LogWrite(::mscale::log::Level::kWarn, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define MSCALE_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                       \
    if (MSCALE_LOG_MIN_LEVEL <= 3) {                                         \
      ::mscale::log::LogWrite(::mscale::log::Level::kError, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define MSCALE_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                       \
    ::mscale::log::LogWrite(::mscale::log::Level::kFatal, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                            \
  } while (0)

#endif  // MSCALE_LOG_HPP_
