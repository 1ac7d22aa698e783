#include "cli/CommandRegistry.h"
#include "cli/CommandSupport.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace BulkRename {
namespace CLI {

namespace {

bool isHelpFlag(const std::string& arg) {
    return arg == "--help" || arg == "-h";
}

std::string displayName(const Command& command) {
    std::string label = command.name();
    const auto aliases = command.aliases();
    if (!aliases.empty()) {
        label += " (";
        for (size_t i = 0; i < aliases.size(); ++i) {
            label += (i ? ", " : "") + aliases[i];
        }
        label += ")";
    }
    return label;
}

} // namespace

CommandRegistry& CommandRegistry::instance() {
    static CommandRegistry instance;
    return instance;
}

Result<void> CommandRegistry::registerCommand(CommandPtr command) {
    if (!command) {
        return Error(ErrorCode::VALIDATION_INVALID_ARGUMENT, "Cannot register a null command");
    }

    std::vector<std::string> keys = command->aliases();
    keys.insert(keys.begin(), command->name());

    for (size_t i = 0; i < keys.size(); ++i) {
        bool repeated = std::find(keys.begin(), keys.begin() + i, keys[i]) != keys.begin() + i;
        if (repeated || m_lookup.count(keys[i])) {
            return Error(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                         "Command name already registered", keys[i]);
        }
    }

    for (const auto& key : keys) {
        m_lookup[key] = command.get();
    }

    auto pos = std::lower_bound(m_commands.begin(), m_commands.end(), command->name(),
                                [](const CommandPtr& entry, const std::string& name) {
                                    return entry->name() < name;
                                });
    m_commands.insert(pos, std::move(command));
    return Result<void>();
}

Command* CommandRegistry::getCommand(const std::string& name) const {
    auto it = m_lookup.find(name);
    return it != m_lookup.end() ? it->second : nullptr;
}

std::vector<Command*> CommandRegistry::getAllCommands() const {
    std::vector<Command*> commands;
    commands.reserve(m_commands.size());
    for (const auto& command : m_commands) {
        commands.push_back(command.get());
    }
    return commands;
}

int CommandRegistry::dispatch(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) {
    const std::string programName = argv.empty() ? m_appName : argv[0];

    if (argv.size() < 2) {
        printHelp(programName, err);
        return 1;
    }

    const std::string& commandName = argv[1];

    if (commandName == "help" || isHelpFlag(commandName)) {
        printHelp(programName, out);
        return 0;
    }

    if (commandName == "version" || commandName == "--version") {
        printVersion(out);
        return 0;
    }

    Command* command = getCommand(commandName);
    if (!command) {
        reportError(Error(ErrorCode::VALIDATION_INVALID_ARGUMENT, "Unknown command", commandName), err);
        err << "Use '" << programName << " help' for usage information.\n";
        return 1;
    }

    std::vector<std::string> args(argv.begin() + 2, argv.end());
    if (!args.empty() && isHelpFlag(args[0])) {
        command->printHelp();
        return 0;
    }

    return command->execute(args);
}

int CommandRegistry::dispatch(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }
    return dispatch(args, std::cout, std::cerr);
}

void CommandRegistry::printHelp(const std::string& programName, std::ostream& out) const {
    out << m_appName << " v" << m_appVersion << " - " << m_appDescription << "\n\n"
        << "Usage: " << programName << " <command> [options]\n\n"
        << "Commands:\n";

    size_t width = 0;
    for (const auto& command : m_commands) {
        width = std::max(width, displayName(*command).length());
    }

    for (const auto& command : m_commands) {
        out << "  " << std::left << std::setw(static_cast<int>(width + 2))
            << displayName(*command) << command->description() << "\n";
    }

    out << "\nUse '" << programName << " <command> --help' for command-specific help.\n";
}

void CommandRegistry::printVersion(std::ostream& out) const {
    out << m_appName << " version " << m_appVersion << "\n";
}

void CommandRegistry::setAppInfo(const std::string& name, const std::string& version,
                                 const std::string& description) {
    m_appName = name;
    m_appVersion = version;
    m_appDescription = description;
}

void CommandRegistry::clear() {
    m_lookup.clear();
    m_commands.clear();
}

} // namespace CLI
} // namespace BulkRename
