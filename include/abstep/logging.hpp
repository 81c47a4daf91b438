/**
 * @file logging.hpp
 * @brief Standardized logging helpers for examples/tools/tests.
 *
 * The minimum level comes from ABSTEP_LOG_LEVEL (debug, info, warn, error) and
 * defaults to info.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace abstep::log {

enum class Level {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

inline std::string_view ToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "unknown";
}

/** @brief Parse a level token; unrecognized tokens map to `fallback`. */
inline Level ParseLevel(std::string_view token, Level fallback = Level::kInfo) {
  for (const Level level : {Level::kDebug, Level::kInfo, Level::kWarn, Level::kError}) {
    if (token == ToString(level)) {
      return level;
    }
  }
  return fallback;
}

inline Level Threshold() {
  static const Level threshold = [] {
    const char* env = std::getenv("ABSTEP_LOG_LEVEL");
    return env ? ParseLevel(env) : Level::kInfo;
  }();
  return threshold;
}

inline bool Enabled(Level level) {
  return level >= Threshold();
}

template <typename... Args>
inline std::string BuildMessage(Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return oss.str();
}

inline void Write(Level level, std::string_view message) {
  if (!Enabled(level)) {
    return;
  }
  FILE* stream = (level == Level::kError) ? stderr : stdout;
  std::fprintf(stream, "[%s] %.*s\n",
               ToString(level).data(),
               static_cast<int>(message.size()),
               message.data());
}

template <typename... Args>
inline void Debug(Args&&... args) {
  if (Enabled(Level::kDebug)) {
    Write(Level::kDebug, BuildMessage(std::forward<Args>(args)...));
  }
}

template <typename... Args>
inline void Info(Args&&... args) {
  Write(Level::kInfo, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Warn(Args&&... args) {
  Write(Level::kWarn, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Error(Args&&... args) {
  Write(Level::kError, BuildMessage(std::forward<Args>(args)...));
}

}  // namespace abstep::log
