#include "cli/ConfigCommand.h"
#include "cli/CommandSupport.h"
#include "core/ConfigManager.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace BulkRename {
namespace CLI {

int ConfigCommand::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp();
        return 1;
    }

    const std::string& cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (rest.size() > 1) {
        return reportError(Error(ErrorCode::VALIDATION_INVALID_ARGUMENT, "Too many arguments", rest[1]),
                           std::cerr);
    }

    if (cmd == "show") {
        return show(rest);
    } else if (cmd == "init") {
        return init(rest);
    } else if (cmd == "validate") {
        return validate(rest);
    }

    std::cerr << "Unknown config command: " << cmd << "\n";
    std::cerr << "Use 'bulkrename config --help' for usage.\n";
    return 1;
}

int ConfigCommand::show(const std::vector<std::string>& args) {
    Result<void> loaded = loadUserConfig(args.empty() ? "" : args[0]);
    if (!loaded) {
        return reportError(loaded.error(), std::cerr);
    }

    ConfigManager& config = ConfigManager::getInstance();
    const std::string& source = config.getConfigFilePath();

    std::cout << "Configuration: " << (source.empty() ? "built-in defaults" : source) << "\n\n";

    auto renameCfg = config.getRenameConfig();
    std::cout << "[Rename]\n";
    std::cout << "  Full match:  " << (renameCfg.fullMatch ? "yes" : "no") << "\n";
    std::cout << "  Recursive:   " << (renameCfg.recursive ? "yes" : "no") << "\n";
    std::cout << "  Padding:     " << renameCfg.padding << "\n";
    std::cout << "  On error:    " << renameCfg.onError << "\n";
    std::cout << "  Root:        " << renameCfg.root << "\n\n";

    auto logCfg = config.getLogConfig();
    std::cout << "[Log]\n";
    std::cout << "  Level:       " << logCfg.level << "\n";
    std::cout << "  Console:     " << (logCfg.console ? "yes" : "no") << "\n";
    std::cout << "  Color:       " << (logCfg.color ? "yes" : "no") << "\n";
    std::cout << "  Directory:   " << (logCfg.directory.empty() ? "(none)" : logCfg.directory) << "\n";
    return 0;
}

int ConfigCommand::init(const std::vector<std::string>& args) {
    const std::string path = args.empty() ? ConfigManager::getDefaultConfigPath() : args[0];

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return reportError(Error(ErrorCode::FS_FILE_EXISTS, "Config file already exists", path),
                           std::cerr);
    }

    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return reportError(Error(ErrorCode::FS_CREATE_DIRECTORY_FAILED, "Failed to create directory",
                                     parent.string() + ": " + ec.message()),
                               std::cerr);
        }
    }

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    Result<void> saved = config.saveConfig(path);
    if (!saved) {
        return reportError(saved.error(), std::cerr);
    }

    std::cout << "Wrote default configuration to " << path << "\n";
    return 0;
}

int ConfigCommand::validate(const std::vector<std::string>& args) {
    const std::string path = args.empty() ? ConfigManager::getDefaultConfigPath() : args[0];

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    Result<void> loaded = config.loadConfig(path);
    if (!loaded) {
        return reportError(loaded.error(), std::cerr);
    }

    std::vector<std::string> problems = config.validate();
    if (problems.empty()) {
        std::cout << path << ": OK\n";
        return 0;
    }

    for (const auto& problem : problems) {
        std::cerr << path << ": " << problem << "\n";
    }
    return 1;
}

void ConfigCommand::printHelp() const {
    std::cout << "Configuration Commands:\n";
    std::cout << "  show [FILE]      Show the effective configuration\n";
    std::cout << "  init [FILE]      Write the default configuration\n";
    std::cout << "  validate [FILE]  Check a configuration file\n";
    std::cout << "\nFILE defaults to ~/.bulkrename/config.json\n";
    std::cout << "\nExamples:\n";
    std::cout << "  bulkrename config init\n";
    std::cout << "  bulkrename config validate ./bulkrename.json\n";
}

} // namespace CLI
} // namespace BulkRename
