/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialized console output
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace Stormfire {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Logs to file in release
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Stormfire - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define STORMFIRE_CRITICAL(system, msg)                                        \
  Stormfire::Logger::Log(Stormfire::LogLevel::CRITICAL, system, msg)
#define STORMFIRE_ERROR(system, msg)                                           \
  Stormfire::Logger::Log(Stormfire::LogLevel::ERROR_LEVEL, system, msg)
#define STORMFIRE_WARN(system, msg)                                            \
  Stormfire::Logger::Log(Stormfire::LogLevel::WARNING, system, msg)
#define STORMFIRE_INFO(system, msg)                                            \
  Stormfire::Logger::Log(Stormfire::LogLevel::INFO, system, msg)
#define STORMFIRE_DEBUG(system, msg)                                           \
  Stormfire::Logger::Log(Stormfire::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating log file
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define STORMFIRE_CRITICAL(system, msg)                                        \
  Stormfire::Logger::Log("CRITICAL", system, msg)
#define STORMFIRE_ERROR(system, msg)                                           \
  Stormfire::Logger::Log("ERROR", system, msg)

#define STORMFIRE_WARN(system, msg) ((void)0)
#define STORMFIRE_INFO(system, msg) ((void)0)
#define STORMFIRE_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define GAMELOOP_CRITICAL(msg) STORMFIRE_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) STORMFIRE_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) STORMFIRE_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) STORMFIRE_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) STORMFIRE_DEBUG("GameLoop", msg)

#define SETTINGS_CRITICAL(msg) STORMFIRE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) STORMFIRE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) STORMFIRE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) STORMFIRE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) STORMFIRE_DEBUG("SettingsManager", msg)

#define SOUND_CRITICAL(msg) STORMFIRE_CRITICAL("SoundManager", msg)
#define SOUND_ERROR(msg) STORMFIRE_ERROR("SoundManager", msg)
#define SOUND_WARN(msg) STORMFIRE_WARN("SoundManager", msg)
#define SOUND_INFO(msg) STORMFIRE_INFO("SoundManager", msg)
#define SOUND_DEBUG(msg) STORMFIRE_DEBUG("SoundManager", msg)

// Effect Systems
#define ATMOSPHERE_CRITICAL(msg) STORMFIRE_CRITICAL("AtmosphereManager", msg)
#define ATMOSPHERE_ERROR(msg) STORMFIRE_ERROR("AtmosphereManager", msg)
#define ATMOSPHERE_WARN(msg) STORMFIRE_WARN("AtmosphereManager", msg)
#define ATMOSPHERE_INFO(msg) STORMFIRE_INFO("AtmosphereManager", msg)
#define ATMOSPHERE_DEBUG(msg) STORMFIRE_DEBUG("AtmosphereManager", msg)

#define SPARKS_CRITICAL(msg) STORMFIRE_CRITICAL("ImpactSparkManager", msg)
#define SPARKS_ERROR(msg) STORMFIRE_ERROR("ImpactSparkManager", msg)
#define SPARKS_WARN(msg) STORMFIRE_WARN("ImpactSparkManager", msg)
#define SPARKS_INFO(msg) STORMFIRE_INFO("ImpactSparkManager", msg)
#define SPARKS_DEBUG(msg) STORMFIRE_DEBUG("ImpactSparkManager", msg)

#define GROUNDFIRE_CRITICAL(msg) STORMFIRE_CRITICAL("GroundFire", msg)
#define GROUNDFIRE_ERROR(msg) STORMFIRE_ERROR("GroundFire", msg)
#define GROUNDFIRE_WARN(msg) STORMFIRE_WARN("GroundFire", msg)
#define GROUNDFIRE_INFO(msg) STORMFIRE_INFO("GroundFire", msg)
#define GROUNDFIRE_DEBUG(msg) STORMFIRE_DEBUG("GroundFire", msg)

#define MISSILE_CRITICAL(msg) STORMFIRE_CRITICAL("MissileManager", msg)
#define MISSILE_ERROR(msg) STORMFIRE_ERROR("MissileManager", msg)
#define MISSILE_WARN(msg) STORMFIRE_WARN("MissileManager", msg)
#define MISSILE_INFO(msg) STORMFIRE_INFO("MissileManager", msg)
#define MISSILE_DEBUG(msg) STORMFIRE_DEBUG("MissileManager", msg)

#define RENDER_CRITICAL(msg) STORMFIRE_CRITICAL("RenderSurface", msg)
#define RENDER_ERROR(msg) STORMFIRE_ERROR("RenderSurface", msg)
#define RENDER_WARN(msg) STORMFIRE_WARN("RenderSurface", msg)
#define RENDER_INFO(msg) STORMFIRE_INFO("RenderSurface", msg)
#define RENDER_DEBUG(msg) STORMFIRE_DEBUG("RenderSurface", msg)

#define CAMERA_ERROR(msg) STORMFIRE_ERROR("Camera", msg)
#define CAMERA_WARN(msg) STORMFIRE_WARN("Camera", msg)
#define CAMERA_INFO(msg) STORMFIRE_INFO("Camera", msg)
#define CAMERA_DEBUG(msg) STORMFIRE_DEBUG("Camera", msg)

// Test and benchmark runs silence the console
#define STORMFIRE_ENABLE_QUIET_MODE() Stormfire::Logger::SetQuietMode(true)
#define STORMFIRE_DISABLE_QUIET_MODE() Stormfire::Logger::SetQuietMode(false)

} // namespace Stormfire

#endif // LOGGER_HPP
