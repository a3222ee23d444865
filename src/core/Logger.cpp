/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compiled into release builds - debug builds log to the console inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace MapForge {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 50;
constexpr const char *LOG_PREFIX = "mapforge_";

std::tm localTime(std::time_t when) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &when);
#else
    localtime_r(&when, &timeinfo);
#endif
    return timeinfo;
}

// One log file per process, opened lazily on the first message
class LoadLog {
public:
    static LoadLog& Instance() {
        static LoadLog instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(Logger::s_logMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            // No writable location: mirror to stderr so load warnings are not lost
            std::fprintf(stderr, "MapForge - [%s] %s: %s\n", system, level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) % 1000;
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << millis.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_INTERVAL) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    LoadLog() = default;

    ~LoadLog() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    LoadLog(const LoadLog&) = delete;
    LoadLog& operator=(const LoadLog&) = delete;

    void open() {
        namespace fs = std::filesystem;
        m_opened = true;

        // MAPFORGE_APP_NAME is defined by CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("MapForge", MAPFORGE_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir);

        std::tm started = localTime(std::time(nullptr));
        std::ostringstream name;
        name << LOG_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << std::format("=== {} load log ===\n", MAPFORGE_APP_NAME);
            m_stream << "Started: " << std::put_time(&started, "%Y-%m-%d %H:%M:%S")
                     << "\n\n";
            m_stream.flush();
        }
    }

    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with(LOG_PREFIX)) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < KEEP_LOG_FILES) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        // Leave room for the file about to be opened
        size_t excess = logs.size() - KEEP_LOG_FILES + 1;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::ofstream m_stream;
    bool m_opened = false;
    size_t m_pending = 0;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    LoadLog::Instance().append(level, system, message);
}

} // namespace MapForge

#endif // ifndef DEBUG
