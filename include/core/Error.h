#ifndef BULK_RENAME_ERROR_H
#define BULK_RENAME_ERROR_H

#include <string>
#include <exception>
#include <optional>
#include <vector>
#include <filesystem>

namespace BulkRename {

/**
 * Error categories for BulkRename operations
 */
enum class ErrorCategory {
    None = 0,          // No error
    FileSystem,        // Local file access errors
    Rename,            // Pattern, template and target errors
    Validation,        // Input validation errors
    Configuration,     // Config file errors
    Internal,          // Internal/unexpected errors
};

/**
 * Common error codes across BulkRename
 */
enum class ErrorCode {
    // Success
    OK = 0,

    // File System (300-399)
    FS_FILE_NOT_FOUND = 300,
    FS_DIRECTORY_NOT_FOUND = 301,
    FS_ACCESS_DENIED = 302,
    FS_DISK_FULL = 303,
    FS_FILE_EXISTS = 304,
    FS_INVALID_PATH = 305,
    FS_CROSS_DEVICE = 306,
    FS_CREATE_DIRECTORY_FAILED = 307,
    FS_RENAME_FAILED = 308,
    FS_LIST_FAILED = 309,

    // Rename (400-499)
    RENAME_INVALID_PATTERN = 400,
    RENAME_INVALID_TEMPLATE = 401,
    RENAME_DUPLICATE_TARGET = 402,
    RENAME_MISSING_REPLACEMENT = 403,
    RENAME_MISSING_TARGET = 404,
    RENAME_MATCH_FAILED = 405,

    // Validation (600-699)
    VALIDATION_INVALID_ARGUMENT = 600,
    VALIDATION_MISSING_ARGUMENT = 601,
    VALIDATION_INVALID_NUMBER = 602,

    // Configuration (700-799)
    CONFIG_FILE_NOT_FOUND = 700,
    CONFIG_PARSE_ERROR = 701,
    CONFIG_INVALID_VALUE = 702,
    CONFIG_WRITE_ERROR = 703,

    // Other (900-999)
    UNKNOWN_ERROR = 999,
};

/**
 * Get human-readable category name
 */
inline const char* getCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::FileSystem: return "FileSystem";
        case ErrorCategory::Rename: return "Rename";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

/**
 * Get category for an error code
 */
inline ErrorCategory getCategoryForCode(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c == 0) return ErrorCategory::None;
    if (c >= 300 && c < 400) return ErrorCategory::FileSystem;
    if (c >= 400 && c < 500) return ErrorCategory::Rename;
    if (c >= 600 && c < 700) return ErrorCategory::Validation;
    if (c >= 700 && c < 800) return ErrorCategory::Configuration;
    return ErrorCategory::Internal;
}

/**
 * Detailed error information
 *
 * Can be used as return type or with exceptions.
 * Supports conversion to bool for easy checking.
 */
class Error {
public:
    /**
     * Create success (no error)
     */
    Error() : m_code(ErrorCode::OK) {}

    /**
     * Create error with code and message
     */
    Error(ErrorCode code, const std::string& message)
        : m_code(code), m_message(message) {}

    /**
     * Create error with code, message, and details
     */
    Error(ErrorCode code, const std::string& message, const std::string& details)
        : m_code(code), m_message(message), m_details(details) {}

    bool isOk() const { return m_code == ErrorCode::OK; }
    bool isError() const { return m_code != ErrorCode::OK; }

    /**
     * Boolean conversion - true if no error
     */
    explicit operator bool() const { return isOk(); }

    // Accessors
    ErrorCode code() const { return m_code; }
    ErrorCategory category() const { return getCategoryForCode(m_code); }
    const std::string& message() const { return m_message; }
    const std::string& details() const { return m_details; }

    /**
     * Set additional details
     */
    Error& withDetails(const std::string& details) {
        m_details = details;
        return *this;
    }

    /**
     * Set underlying OS error number
     */
    Error& withSystemError(int errorNumber) {
        m_systemError = errorNumber;
        return *this;
    }

    int systemError() const { return m_systemError.value_or(0); }
    bool hasSystemError() const { return m_systemError.has_value(); }

    /**
     * Format full error string
     */
    std::string toString() const {
        if (isOk()) return "OK";

        std::string result = "[" + std::string(getCategoryName(category())) + "] ";
        result += m_message;
        if (!m_details.empty()) {
            result += " (" + m_details + ")";
        }
        return result;
    }

    // Factory methods for common errors
    static Error directoryNotFound(const std::string& path) {
        return Error(ErrorCode::FS_DIRECTORY_NOT_FOUND, "Directory not found", path);
    }

    static Error invalidPattern(const std::string& reason) {
        return Error(ErrorCode::RENAME_INVALID_PATTERN, "Invalid regex pattern", reason);
    }

    static Error invalidTemplate(const std::string& reason) {
        return Error(ErrorCode::RENAME_INVALID_TEMPLATE, "Invalid replacement template", reason);
    }

    static Error missingReplacement() {
        return Error(ErrorCode::RENAME_MISSING_REPLACEMENT,
                     "Replacement pattern is required for renaming");
    }

    static Error duplicateTargets(const std::vector<std::string>& names);

    static Error fromFilesystemError(const std::filesystem::filesystem_error& e);

private:
    ErrorCode m_code;
    std::string m_message;
    std::string m_details;
    std::optional<int> m_systemError;
};

/**
 * Exception wrapper for Error
 *
 * Fatal batch conditions are raised as ErrorException; callers
 * inspect code() to tell them apart.
 */
class ErrorException : public std::exception {
public:
    explicit ErrorException(const Error& error) : m_error(error) {
        m_what = m_error.toString();
    }

    ErrorException(ErrorCode code, const std::string& message)
        : m_error(code, message) {
        m_what = m_error.toString();
    }

    const char* what() const noexcept override {
        return m_what.c_str();
    }

    const Error& error() const { return m_error; }
    ErrorCode code() const { return m_error.code(); }

private:
    Error m_error;
    std::string m_what;
};

/**
 * Result type combining success value with possible error
 *
 * Used where a failure belongs to one item and the caller decides
 * whether the batch goes on.
 *
 * Example:
 *   Result<std::string> readName(const std::string& path) {
 *       if (missing) return Error(ErrorCode::FS_FILE_NOT_FOUND, "File not found", path);
 *       return name;  // Success
 *   }
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_value(value), m_error() {}
    Result(T&& value) : m_value(std::move(value)), m_error() {}

    Result(const Error& error) : m_value(std::nullopt), m_error(error) {}
    Result(Error&& error) : m_value(std::nullopt), m_error(std::move(error)) {}

    bool isOk() const { return m_value.has_value(); }
    bool isError() const { return !m_value.has_value(); }
    explicit operator bool() const { return isOk(); }

    /**
     * Get the value (throws if error)
     */
    const T& value() const {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T& value() {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T valueOr(const T& defaultValue) const {
        return m_value.value_or(defaultValue);
    }

    const Error& error() const { return m_error; }

private:
    std::optional<T> m_value;
    Error m_error;
};

/**
 * Specialization for void (operation without return value)
 */
template<>
class Result<void> {
public:
    Result() : m_error() {}
    Result(const Error& error) : m_error(error) {}

    bool isOk() const { return m_error.isOk(); }
    bool isError() const { return m_error.isError(); }
    explicit operator bool() const { return isOk(); }

    const Error& error() const { return m_error; }

private:
    Error m_error;
};

} // namespace BulkRename

#endif // BULK_RENAME_ERROR_H
