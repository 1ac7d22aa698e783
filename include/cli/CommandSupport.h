#ifndef BULK_RENAME_CLI_COMMAND_SUPPORT_H
#define BULK_RENAME_CLI_COMMAND_SUPPORT_H

#include <string>
#include <iosfwd>

#include "core/Error.h"
#include "core/ConfigManager.h"

namespace BulkRename {
namespace CLI {

/**
 * Load the user configuration into ConfigManager
 *
 * With an explicit path the file must exist. Without one the default
 * path is used when present, otherwise the built-in defaults stay.
 * The loaded values are checked with ConfigManager::validate().
 */
Result<void> loadUserConfig(const std::string& explicitPath);

/**
 * Point LogManager at the configured level, console, colour and directory
 */
Result<void> applyLogConfig(const ConfigManager::LogConfig& logConfig);

/**
 * Print "Error: <error>" and return the failure exit code
 */
int reportError(const Error& error, std::ostream& err);

} // namespace CLI
} // namespace BulkRename

#endif // BULK_RENAME_CLI_COMMAND_SUPPORT_H
