#ifndef BULK_RENAME_CLI_COMMAND_H
#define BULK_RENAME_CLI_COMMAND_H

#include <string>
#include <vector>
#include <memory>

namespace BulkRename {
namespace CLI {

/**
 * Base class for all CLI command handlers
 *
 * Commands are registered with CommandRegistry and dispatched
 * based on the first argument to the program.
 *
 * Example usage:
 *   class RenameCommand : public Command {
 *   public:
 *       std::string name() const override { return "rename"; }
 *       std::string description() const override { return "Rename files by regex"; }
 *       int execute(const std::vector<std::string>& args) override;
 *       void printHelp() const override;
 *   };
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Get the command name (used for dispatching)
     * Example: "rename" for "bulkrename rename '(\d+)' 'f\1'"
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text
     */
    virtual std::string description() const = 0;

    /**
     * Alternative names that also trigger this command
     */
    virtual std::vector<std::string> aliases() const { return {}; }

    /**
     * Execute the command with given arguments
     * @param args Arguments after the command name
     * @return Exit code (0 = success)
     */
    virtual int execute(const std::vector<std::string>& args) = 0;

    /**
     * Print detailed help for this command
     * Called when user runs "bulkrename <command> --help"
     */
    virtual void printHelp() const = 0;
};

using CommandPtr = std::unique_ptr<Command>;

} // namespace CLI
} // namespace BulkRename

#endif // BULK_RENAME_CLI_COMMAND_H
