#ifndef BULK_RENAME_CLI_COMMAND_REGISTRY_H
#define BULK_RENAME_CLI_COMMAND_REGISTRY_H

#include "Command.h"
#include "core/Error.h"
#include <map>
#include <string>
#include <vector>
#include <iosfwd>

namespace BulkRename {
namespace CLI {

/**
 * Singleton registry for CLI commands
 *
 * Example:
 *   CommandRegistry::instance().registerCommand(std::make_unique<RenameCommand>());
 *   return CommandRegistry::instance().dispatch(argc, argv);
 */
class CommandRegistry {
public:
    static CommandRegistry& instance();

    // Non-copyable
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /**
     * Register a command (registry takes ownership)
     * @return VALIDATION_INVALID_ARGUMENT if the name or an alias is already taken
     */
    Result<void> registerCommand(CommandPtr command);

    /**
     * Get a command by name or alias
     * @return Pointer to command or nullptr if not found
     */
    Command* getCommand(const std::string& name) const;

    /**
     * Get all registered commands, sorted by name
     */
    std::vector<Command*> getAllCommands() const;

    /**
     * Dispatch argv (program name first) to a command
     * @return Exit code from command, 0 for help/version, 1 for usage errors
     */
    int dispatch(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err);
    int dispatch(int argc, char* argv[]);

    void printHelp(const std::string& programName, std::ostream& out) const;
    void printVersion(std::ostream& out) const;

    void setAppInfo(const std::string& name, const std::string& version,
                    const std::string& description);

    /**
     * Drop every command; used by tests
     */
    void clear();

private:
    CommandRegistry() = default;

    // Sorted by name
    std::vector<CommandPtr> m_commands;

    // Names and aliases -> owning entry in m_commands
    std::map<std::string, Command*> m_lookup;

    std::string m_appName = "bulkrename";
    std::string m_appVersion = "1.0.0";
    std::string m_appDescription = "Regex based bulk file renaming";
};

} // namespace CLI
} // namespace BulkRename

#endif // BULK_RENAME_CLI_COMMAND_REGISTRY_H
