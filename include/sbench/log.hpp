/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Synchronous, category-tagged, level-filtered logging.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [CLIENT] message (file.hpp:42)
 *
 * The (file:line) suffix is only emitted in debug builds. Each line is
 * formatted into a stack buffer and written with a single fprintf so that
 * concurrent client queues do not interleave partial lines.
 */

#ifndef SBENCH_LOG_HPP_
#define SBENCH_LOG_HPP_

#include "sbench/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <sys/time.h>

namespace sbench {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<uint8_t>& LevelRef() noexcept {
  static std::atomic<uint8_t> level{static_cast<uint8_t>(kDefaultLevel)};
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

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
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv {};
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf {};
  time_t sec = tv.tv_sec;
  (void)localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<long>(tv.tv_usec / 1000));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(static_cast<uint8_t>(level),
                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelRef().load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return true on success, level untouched otherwise.
 */
inline bool ParseLevel(const char* name, Level& level) noexcept {
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"error", Level::kError},
                {"fatal", Level::kFatal}, {"off", Level::kOff}};
  if (name == nullptr) {
    return false;
  }
  for (const auto& entry : kNames) {
    if (std::strcmp(entry.name, name) == 0) {
      level = entry.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// LogWrite
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept
    __attribute__((format(printf, 5, 6)));

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (static_cast<uint8_t>(level) <
      detail::LevelRef().load(std::memory_order_relaxed)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace sbench

// ============================================================================
// Macros
// ============================================================================

#define SBENCH_LOG_DEBUG(cat, fmt, ...)                                     \
  ::sbench::log::LogWrite(::sbench::log::Level::kDebug, cat, __FILE__,      \
                          __LINE__, fmt, ##__VA_ARGS__)
#define SBENCH_LOG_INFO(cat, fmt, ...)                                      \
  ::sbench::log::LogWrite(::sbench::log::Level::kInfo, cat, __FILE__,       \
                          __LINE__, fmt, ##__VA_ARGS__)
#define SBENCH_LOG_WARN(cat, fmt, ...)                                      \
  ::sbench::log::LogWrite(::sbench::log::Level::kWarn, cat, __FILE__,       \
                          __LINE__, fmt, ##__VA_ARGS__)
#define SBENCH_LOG_ERROR(cat, fmt, ...)                                     \
  ::sbench::log::LogWrite(::sbench::log::Level::kError, cat, __FILE__,      \
                          __LINE__, fmt, ##__VA_ARGS__)
#define SBENCH_LOG_FATAL(cat, fmt, ...)                                     \
  ::sbench::log::LogWrite(::sbench::log::Level::kFatal, cat, __FILE__,      \
                          __LINE__, fmt, ##__VA_ARGS__)

#endif  // SBENCH_LOG_HPP_
