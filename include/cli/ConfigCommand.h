#ifndef BULK_RENAME_CLI_CONFIG_COMMAND_H
#define BULK_RENAME_CLI_CONFIG_COMMAND_H

#include "cli/Command.h"

namespace BulkRename {
namespace CLI {

/**
 * "bulkrename config show|init|validate"
 */
class ConfigCommand : public Command {
public:
    std::string name() const override { return "config"; }
    std::string description() const override { return "Show, create or check the configuration"; }

    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

private:
    int show(const std::vector<std::string>& args);
    int init(const std::vector<std::string>& args);
    int validate(const std::vector<std::string>& args);
};

} // namespace CLI
} // namespace BulkRename

#endif // BULK_RENAME_CLI_CONFIG_COMMAND_H
