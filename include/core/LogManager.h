#ifndef BULK_RENAME_LOG_MANAGER_H
#define BULK_RENAME_LOG_MANAGER_H

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <mutex>
#include <fstream>
#include <cstdint>
#include <chrono>

namespace BulkRename {

/**
 * Log levels
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Log categories for filtering
 */
enum class LogCategory {
    General,
    Match,
    Rename,
    Config,
    System
};

/**
 * Single log entry
 */
struct LogEntry {
    int64_t timestamp = 0;        // Unix timestamp in milliseconds
    LogLevel level = LogLevel::Info;
    LogCategory category = LogCategory::General;
    std::string action;           // e.g., "no match", "files renamed"
    std::string message;          // Human-readable message
    std::string details;          // Additional details

    std::string filePath;         // Associated file (if any)

    std::string toJson() const;
    std::string toString() const;
};

/**
 * Log filter for queries
 */
struct LogFilter {
    LogLevel minLevel = LogLevel::Debug;
    std::vector<LogCategory> categories;  // Empty = all
    std::string searchText;
    std::string filePath;
    int limit = 100;              // Max entries to return
    int offset = 0;               // For pagination
};

/**
 * Callback for real-time log events
 */
using LogCallback = std::function<void(const LogEntry&)>;

/**
 * LogManager - Centralized logging for the bulkrename tool
 *
 * Features:
 * - Multiple log levels (Debug, Info, Warning, Error)
 * - Category-based filtering
 * - Optional file storage with daily activity files
 * - Coloured console output
 * - Real-time callbacks
 */
class LogManager {
public:
    /**
     * Get singleton instance
     */
    static LogManager& instance();

    // Prevent copying
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    // ==================== Configuration ====================

    /**
     * Set log directory. Empty disables file output (the default).
     */
    void setLogDirectory(const std::string& path);
    std::string getLogDirectory() const { return m_logDir; }

    void setMinLevel(LogLevel level) { m_minLevel = level; }
    LogLevel getMinLevel() const { return m_minLevel; }

    void setConsoleOutput(bool enabled) { m_consoleOutput = enabled; }
    void setColorOutput(bool enabled) { m_colorOutput = enabled; }

    void setLogCallback(LogCallback callback) { m_logCallback = callback; }

    // ==================== Logging Methods ====================

    void log(LogLevel level, LogCategory category,
             const std::string& action, const std::string& message,
             const std::string& details = "");

    /**
     * Log with the file the entry is about
     */
    void logWithContext(LogLevel level, LogCategory category,
                        const std::string& action, const std::string& message,
                        const std::string& filePath,
                        const std::string& details = "");

    // Convenience methods
    void debug(LogCategory cat, const std::string& action, const std::string& msg);
    void info(LogCategory cat, const std::string& action, const std::string& msg);
    void warning(LogCategory cat, const std::string& action, const std::string& msg);
    void error(LogCategory cat, const std::string& action, const std::string& msg);

    // ==================== Query Methods ====================

    /**
     * Get log entries with filter, newest first
     */
    std::vector<LogEntry> getEntries(const LogFilter& filter = {});

    std::vector<LogEntry> getRecentEntries(int count = 50);

    std::vector<LogEntry> getErrors(int limit = 100);

    // ==================== Maintenance ====================

    /**
     * Drop cached entries and reopen log files
     */
    void clearAll();

    /**
     * Flush pending writes to disk
     */
    void flush();

    // ==================== Utilities ====================

    static std::string levelToString(LogLevel level);
    static LogLevel stringToLevel(const std::string& str);
    static bool isValidLevelName(const std::string& str);

    static std::string categoryToString(LogCategory cat);

    static int64_t currentTimeMs();

    static std::string formatTimestamp(int64_t timestamp);

private:
    LogManager();
    ~LogManager();

    // Configuration
    std::string m_logDir;
    LogLevel m_minLevel = LogLevel::Info;
    bool m_consoleOutput = true;
    bool m_colorOutput = false;
    LogCallback m_logCallback;

    // File handles
    std::ofstream m_activityLog;
    std::ofstream m_errorLog;
    std::string m_currentLogDate;

    std::mutex m_mutex;

    // In-memory cache for recent entries
    std::deque<LogEntry> m_recentEntries;
    static const size_t MAX_CACHED_ENTRIES = 1000;

    // Write buffer for batched disk writes
    std::vector<std::string> m_writeBuffer;
    std::chrono::steady_clock::time_point m_lastFlushTime;
    static const size_t WRITE_BUFFER_SIZE = 100;
    static constexpr std::chrono::seconds FLUSH_INTERVAL{5};

    // Internal methods
    bool ensureLogDirectory();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void flushWriteBuffer();
    std::string getActivityLogPath() const;
    std::string getErrorLogPath() const;
    std::string getCurrentDateString() const;
};

// ==================== Macros for convenient logging ====================

#define BULK_RENAME_LOG_DEBUG(cat, action, msg) \
    BulkRename::LogManager::instance().debug(cat, action, msg)

#define BULK_RENAME_LOG_INFO(cat, action, msg) \
    BulkRename::LogManager::instance().info(cat, action, msg)

#define BULK_RENAME_LOG_WARNING(cat, action, msg) \
    BulkRename::LogManager::instance().warning(cat, action, msg)

#define BULK_RENAME_LOG_ERROR(cat, action, msg) \
    BulkRename::LogManager::instance().error(cat, action, msg)

} // namespace BulkRename

#endif // BULK_RENAME_LOG_MANAGER_H
