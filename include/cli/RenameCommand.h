#ifndef BULK_RENAME_CLI_RENAME_COMMAND_H
#define BULK_RENAME_CLI_RENAME_COMMAND_H

#include <optional>
#include <string>
#include <vector>

#include "cli/Command.h"
#include "core/ConfigManager.h"
#include "core/Error.h"
#include "features/RenameOptions.h"

namespace BulkRename {
namespace CLI {

/**
 * Command line for "bulkrename rename"
 *
 * Switches only turn settings on, so a configured true value cannot
 * be switched off from the command line.
 */
struct RenameArguments {
    std::string pattern;
    std::optional<std::string> replacement;
    bool rename = false;
    bool fullMatch = false;
    bool recursive = false;
    bool continueOnError = false;
    std::optional<int> padding;
    std::optional<std::string> directory;
    std::string configFile;
    bool verbose = false;
    bool noColor = false;
};

class RenameCommand : public Command {
public:
    std::string name() const override { return "rename"; }
    std::string description() const override { return "Match (and rename) files with a regex"; }
    std::vector<std::string> aliases() const override { return {"rn"}; }

    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

    /**
     * @return VALIDATION_* errors for unknown options, missing values,
     *         bad numbers or a wrong positional count
     */
    static Result<RenameArguments> parseArguments(const std::vector<std::string>& args);

    /**
     * Combine configured values with the command line
     */
    static RenameOptions buildOptions(const RenameArguments& arguments,
                                      const ConfigManager::RenameConfig& config);
};

} // namespace CLI
} // namespace BulkRename

#endif // BULK_RENAME_CLI_RENAME_COMMAND_H
