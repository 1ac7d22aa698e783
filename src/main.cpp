/**
 * bulkrename
 * Main entry point
 */

#include <iostream>
#include <memory>

#include "cli/CommandRegistry.h"
#include "cli/CommandSupport.h"
#include "cli/ConfigCommand.h"
#include "cli/RenameCommand.h"
#include "core/LogManager.h"

int main(int argc, char* argv[]) {
    using namespace BulkRename::CLI;

    CommandRegistry& registry = CommandRegistry::instance();
    registry.setAppInfo("bulkrename", "1.0.0", "Regex based bulk file renaming");

    BulkRename::Result<void> registered = registry.registerCommand(std::make_unique<RenameCommand>());
    if (registered) {
        registered = registry.registerCommand(std::make_unique<ConfigCommand>());
    }
    if (!registered) {
        return reportError(registered.error(), std::cerr);
    }

    int exitCode = registry.dispatch(argc, argv);
    BulkRename::LogManager::instance().flush();
    return exitCode;
}
