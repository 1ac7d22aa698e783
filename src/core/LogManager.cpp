#include "core/LogManager.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace BulkRename {

// ==================== JSON Escaping Helper ====================

static std::string escapeJson(const std::string& str) {
    std::stringstream ss;
    for (char c : str) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setfill('0') << std::setw(4) << static_cast<int>(c);
                } else {
                    ss << c;
                }
        }
    }
    return ss.str();
}

// ==================== LogEntry ====================

std::string LogEntry::toJson() const {
    std::stringstream ss;
    ss << "{";
    ss << "\"timestamp\":" << timestamp << ",";
    ss << "\"level\":\"" << LogManager::levelToString(level) << "\",";
    ss << "\"category\":\"" << LogManager::categoryToString(category) << "\",";
    ss << "\"action\":\"" << escapeJson(action) << "\",";
    ss << "\"message\":\"" << escapeJson(message) << "\"";
    if (!details.empty()) ss << ",\"details\":\"" << escapeJson(details) << "\"";
    if (!filePath.empty()) ss << ",\"filePath\":\"" << escapeJson(filePath) << "\"";
    ss << "}";
    return ss.str();
}

std::string LogEntry::toString() const {
    std::stringstream ss;
    ss << LogManager::formatTimestamp(timestamp) << " ";
    ss << "[" << LogManager::levelToString(level) << "] ";
    ss << "[" << LogManager::categoryToString(category) << "] ";
    ss << action;
    if (!message.empty()) ss << ": " << message;
    if (!filePath.empty()) ss << " (file: " << filePath << ")";
    if (!details.empty()) ss << " " << details;
    return ss.str();
}

// ==================== LogManager Singleton ====================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::LogManager() {
    m_lastFlushTime = std::chrono::steady_clock::now();
}

LogManager::~LogManager() {
    flush();
    closeLogFiles();
}

// ==================== Configuration ====================

void LogManager::setLogDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
    closeLogFiles();
    m_logDir = path;
    if (m_logDir.empty()) {
        return;
    }
    if (ensureLogDirectory()) {
        openLogFiles();
    }
}

bool LogManager::ensureLogDirectory() {
    std::error_code ec;
    fs::create_directories(m_logDir, ec);
    if (ec) {
        std::cerr << "LogManager: Failed to create log directory '" << m_logDir
                  << "': " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string LogManager::getCurrentDateString() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    struct tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
             tm_now.tm_year + 1900, tm_now.tm_mon + 1, tm_now.tm_mday);
    return buffer;
}

std::string LogManager::getActivityLogPath() const {
    return m_logDir + "/activity_" + getCurrentDateString() + ".log";
}

std::string LogManager::getErrorLogPath() const {
    return m_logDir + "/errors.log";
}

void LogManager::openLogFiles() {
    if (m_logDir.empty()) return;

    std::string currentDate = getCurrentDateString();

    // New day, new activity file
    if (m_currentLogDate != currentDate) {
        if (m_activityLog.is_open()) m_activityLog.close();
        m_currentLogDate = currentDate;
    }

    if (!m_activityLog.is_open()) {
        std::string activityPath = getActivityLogPath();
        m_activityLog.open(activityPath, std::ios::app);
        if (!m_activityLog.is_open()) {
            std::cerr << "LogManager: Failed to open activity log file: " << activityPath << std::endl;
        }
    }

    if (!m_errorLog.is_open()) {
        std::string errorPath = getErrorLogPath();
        m_errorLog.open(errorPath, std::ios::app);
        if (!m_errorLog.is_open()) {
            std::cerr << "LogManager: Failed to open error log file: " << errorPath << std::endl;
        }
    }
}

void LogManager::closeLogFiles() {
    if (m_activityLog.is_open()) m_activityLog.close();
    if (m_errorLog.is_open()) m_errorLog.close();
    m_currentLogDate.clear();
}

// ==================== Static Utilities ====================

int64_t LogManager::currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string LogManager::formatTimestamp(int64_t timestamp) {
    time_t seconds = timestamp / 1000;
    int millis = timestamp % 1000;
    struct tm tm_info;
    localtime_r(&seconds, &tm_info);

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_info.tm_year + 1900, tm_info.tm_mon + 1, tm_info.tm_mday,
             tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec, millis);
    return buffer;
}

std::string LogManager::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel LogManager::stringToLevel(const std::string& str) {
    if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
    if (str == "INFO" || str == "info") return LogLevel::Info;
    if (str == "WARN" || str == "WARNING" || str == "warn" || str == "warning") return LogLevel::Warning;
    if (str == "ERROR" || str == "error") return LogLevel::Error;
    return LogLevel::Info;
}

bool LogManager::isValidLevelName(const std::string& str) {
    static const char* names[] = {
        "DEBUG", "debug", "INFO", "info", "WARN", "WARNING", "warn", "warning", "ERROR", "error"
    };
    for (const char* name : names) {
        if (str == name) return true;
    }
    return false;
}

std::string LogManager::categoryToString(LogCategory cat) {
    switch (cat) {
        case LogCategory::General: return "GENERAL";
        case LogCategory::Match: return "MATCH";
        case LogCategory::Rename: return "RENAME";
        case LogCategory::Config: return "CONFIG";
        case LogCategory::System: return "SYSTEM";
        default: return "UNKNOWN";
    }
}

// ==================== Logging Methods ====================

void LogManager::log(LogLevel level, LogCategory category,
                     const std::string& action, const std::string& message,
                     const std::string& details) {
    logWithContext(level, category, action, message, "", details);
}

void LogManager::logWithContext(LogLevel level, LogCategory category,
                                const std::string& action, const std::string& message,
                                const std::string& filePath,
                                const std::string& details) {
    if (level < m_minLevel) return;

    LogEntry entry;
    entry.timestamp = currentTimeMs();
    entry.level = level;
    entry.category = category;
    entry.action = action;
    entry.message = message;
    entry.details = details;
    entry.filePath = filePath;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_recentEntries.push_back(entry);
        if (m_recentEntries.size() > MAX_CACHED_ENTRIES) {
            m_recentEntries.pop_front();
        }

        if (!m_logDir.empty()) {
            writeToFile(entry);
        }

        if (m_consoleOutput) {
            writeToConsole(entry);
        }
    }

    // Callback (outside lock)
    if (m_logCallback) {
        m_logCallback(entry);
    }
}

void LogManager::writeToConsole(const LogEntry& entry) {
    std::ostream& out = (entry.level >= LogLevel::Warning) ? std::cerr : std::cout;
    if (!m_colorOutput) {
        out << entry.toString() << std::endl;
        return;
    }

    const char* color = "";
    switch (entry.level) {
        case LogLevel::Debug: color = "\x1b[2m"; break;
        case LogLevel::Info: color = "\x1b[32m"; break;
        case LogLevel::Warning: color = "\x1b[33m"; break;
        case LogLevel::Error: color = "\x1b[31m"; break;
    }
    out << color << entry.toString() << "\x1b[0m" << std::endl;
}

void LogManager::writeToFile(const LogEntry& entry) {
    std::string currentDate = getCurrentDateString();
    if (m_currentLogDate != currentDate) {
        flushWriteBuffer();
        openLogFiles();
    }

    std::string logLine = entry.toJson();
    m_writeBuffer.push_back(logLine);

    // Errors always go to error log immediately
    if (entry.level == LogLevel::Error && m_errorLog.is_open()) {
        m_errorLog << logLine << "\n";
        m_errorLog.flush();
    }

    auto now = std::chrono::steady_clock::now();
    bool shouldFlush = (m_writeBuffer.size() >= WRITE_BUFFER_SIZE) ||
                       ((now - m_lastFlushTime) >= FLUSH_INTERVAL) ||
                       (entry.level == LogLevel::Error);

    if (shouldFlush) {
        flushWriteBuffer();
    }
}

void LogManager::flushWriteBuffer() {
    if (m_writeBuffer.empty()) return;

    if (m_activityLog.is_open()) {
        for (const auto& line : m_writeBuffer) {
            m_activityLog << line << "\n";
        }
        m_activityLog.flush();
    }

    m_writeBuffer.clear();
    m_lastFlushTime = std::chrono::steady_clock::now();
}

void LogManager::debug(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Debug, cat, action, msg);
}

void LogManager::info(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Info, cat, action, msg);
}

void LogManager::warning(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Warning, cat, action, msg);
}

void LogManager::error(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Error, cat, action, msg);
}

// ==================== Query Methods ====================

std::vector<LogEntry> LogManager::getEntries(const LogFilter& filter) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<LogEntry> results;
    int skipped = 0;

    for (auto it = m_recentEntries.rbegin();
         it != m_recentEntries.rend() && static_cast<int>(results.size()) < filter.limit;
         ++it) {

        if (it->level < filter.minLevel) continue;

        if (!filter.categories.empty()) {
            bool found = false;
            for (auto cat : filter.categories) {
                if (it->category == cat) { found = true; break; }
            }
            if (!found) continue;
        }

        if (!filter.searchText.empty()) {
            if (it->message.find(filter.searchText) == std::string::npos &&
                it->action.find(filter.searchText) == std::string::npos) {
                continue;
            }
        }

        if (!filter.filePath.empty() && it->filePath != filter.filePath) continue;

        if (skipped < filter.offset) {
            skipped++;
            continue;
        }

        results.push_back(*it);
    }

    return results;
}

std::vector<LogEntry> LogManager::getRecentEntries(int count) {
    LogFilter filter;
    filter.limit = count;
    return getEntries(filter);
}

std::vector<LogEntry> LogManager::getErrors(int limit) {
    LogFilter filter;
    filter.minLevel = LogLevel::Error;
    filter.limit = limit;
    return getEntries(filter);
}

// ==================== Maintenance ====================

void LogManager::clearAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recentEntries.clear();
    m_writeBuffer.clear();
    closeLogFiles();
    openLogFiles();
}

void LogManager::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
    if (m_activityLog.is_open()) m_activityLog.flush();
    if (m_errorLog.is_open()) m_errorLog.flush();
}

} // namespace BulkRename
