#include "cli/CommandSupport.h"
#include "core/LogManager.h"

#include <filesystem>
#include <ostream>

namespace fs = std::filesystem;

namespace BulkRename {
namespace CLI {

Result<void> loadUserConfig(const std::string& explicitPath) {
    ConfigManager& config = ConfigManager::getInstance();

    std::string path = explicitPath;
    if (path.empty()) {
        path = ConfigManager::getDefaultConfigPath();
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            BULK_RENAME_LOG_DEBUG(LogCategory::Config, "using defaults", "no config file at " + path);
            return Result<void>();
        }
    }

    Result<void> loaded = config.loadConfig(path);
    if (!loaded) {
        return loaded;
    }

    std::vector<std::string> problems = config.validate();
    if (!problems.empty()) {
        std::string details = path + ": ";
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) details += "; ";
            details += problems[i];
        }
        return Error(ErrorCode::CONFIG_INVALID_VALUE, "Invalid configuration", details);
    }

    return Result<void>();
}

Result<void> applyLogConfig(const ConfigManager::LogConfig& logConfig) {
    if (!LogManager::isValidLevelName(logConfig.level)) {
        return Error(ErrorCode::CONFIG_INVALID_VALUE, "Unknown log level", logConfig.level);
    }

    LogManager& log = LogManager::instance();
    log.setMinLevel(LogManager::stringToLevel(logConfig.level));
    log.setConsoleOutput(logConfig.console);
    log.setColorOutput(logConfig.color);
    log.setLogDirectory(logConfig.directory);
    return Result<void>();
}

int reportError(const Error& error, std::ostream& err) {
    err << "Error: " << error.toString() << "\n";
    return 1;
}

} // namespace CLI
} // namespace BulkRename
