// IRLG001A.h - Logger
// Component ID: IRLG001A (Infrastructure/Session/Logger)
//
// Process-wide, thread-safe logging with timestamps, levels, optional colour
// and an optional append-mode log file. Beam workers log concurrently, so
// every sink write happens under one mutex.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace Umbra {

//==============================================================================
// Log Levels
//==============================================================================
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

/// @brief Parse "debug", "info", "warn"/"warning", "error", "fatal" (any case)
inline std::optional<LogLevel> levelFromString(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

//==============================================================================
// Logger - Thread-safe logging
//==============================================================================
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// @brief Set minimum log level
    void setLevel(LogLevel level) { m_Level.store(level); }
    LogLevel level() const { return m_Level.load(); }

    bool isEnabled(LogLevel level) const { return level >= m_Level.load(); }

    /// @brief ANSI colour on console output (on by default)
    void setColourEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Colour = enabled;
    }

    /// @brief Append to a log file; an empty path closes the current one
    /// @return false if the file could not be opened
    bool setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (path.empty()) {
            m_LogFile.reset();
            return true;
        }
        auto file = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            return false;
        }
        m_LogFile = std::move(file);
        return true;
    }

    /// @brief Log a message
    void log(LogLevel level, const std::string& message,
             const char* file = nullptr, int line = 0) {
        if (!isEnabled(level)) return;

        std::string formatted = formatMessage(level, message, file, line);

        std::lock_guard<std::mutex> lock(m_Mutex);

        std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
        if (m_Colour) {
            out << colourForLevel(level) << formatted << "\033[0m" << std::endl;
        } else {
            out << formatted << std::endl;
        }

        if (m_LogFile && m_LogFile->is_open()) {
            *m_LogFile << formatted << std::endl;
        }
    }

    // Convenience methods
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warning, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void fatal(const std::string& msg) { log(LogLevel::Fatal, msg); }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
        }
        return "?????";
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatMessage(LogLevel level, const std::string& message,
                                     const char* file, int line) {
        std::ostringstream ss;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        std::tm timeinfo{};
#if defined(_WIN32) || defined(_WIN64)
        localtime_s(&timeinfo, &time);
#else
        localtime_r(&time, &timeinfo);
#endif
        ss << std::put_time(&timeinfo, "%H:%M:%S")
           << " [" << levelName(level) << "] "
           << message;

        if (file && level == LogLevel::Debug) {
            ss << " (" << file << ":" << line << ")";
        }

        return ss.str();
    }

    static const char* colourForLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "\033[90m";  // Grey
            case LogLevel::Info:    return "\033[37m";  // White
            case LogLevel::Warning: return "\033[33m";  // Yellow
            case LogLevel::Error:   return "\033[31m";  // Red
            case LogLevel::Fatal:   return "\033[91m";  // Bright red
        }
        return "";
    }

    std::atomic<LogLevel> m_Level{LogLevel::Info};
    bool m_Colour = true;
    std::unique_ptr<std::ofstream> m_LogFile;
    std::mutex m_Mutex;
};

// Convenience macros
#define LOG_DEBUG(msg) Umbra::Logger::instance().log(Umbra::LogLevel::Debug, msg, __FILE__, __LINE__)
#define LOG_INFO(msg)  Umbra::Logger::instance().info(msg)
#define LOG_WARN(msg)  Umbra::Logger::instance().warn(msg)
#define LOG_ERROR(msg) Umbra::Logger::instance().error(msg)
#define LOG_FATAL(msg) Umbra::Logger::instance().fatal(msg)

} // namespace Umbra
