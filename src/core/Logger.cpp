/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Stormfire {
namespace {

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

class FileLogger {
public:
  static FileLogger &Instance() {
    static FileLogger instance;
    return instance;
  }

  void write(const char *level, const char *system, const char *message) {
    if (!m_initialized) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    m_stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << " ["
             << level << "] [" << system << "] " << message << '\n';

    if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
      m_stream.flush();
      m_pending = 0;
    }
  }

private:
  FileLogger() = default;
  ~FileLogger() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }
  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  void open() {
    m_initialized = true;

    // STORMFIRE_APP_NAME comes from CMake's ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("StormfireGames", STORMFIRE_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    namespace fs = std::filesystem;
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }
    pruneOldLogs(logDir);

    auto seconds =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream name;
    name << "stormfire_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";
    m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << STORMFIRE_APP_NAME << " Log ===\n"
               << "Started: " << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
               << "\n\n";
      m_stream.flush();
    }
  }

  void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;
    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with("stormfire_")) {
        logs.push_back(entry);
      }
    }
    // The new file about to be opened counts towards the limit
    if (logs.size() < KEPT_LOG_FILES) {
      return;
    }
    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });
    size_t excess = logs.size() - KEPT_LOG_FILES + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  std::ofstream m_stream;
  bool m_initialized{false};
  size_t m_pending{0};
};

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_quietMode.load(std::memory_order_relaxed)) {
    return;
  }
  std::lock_guard<std::mutex> lock(s_logMutex);
  FileLogger::Instance().write(level, system, message);
}

} // namespace Stormfire

#endif // ifndef DEBUG
