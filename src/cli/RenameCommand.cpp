#include "cli/RenameCommand.h"
#include "cli/CommandSupport.h"
#include "core/LogManager.h"
#include "features/BulkRenamer.h"
#include "features/FileLister.h"
#include "features/MatchReporter.h"

#include <iostream>

namespace BulkRename {
namespace CLI {

namespace {

Result<int> parseNumber(const std::string& option, const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        return Error(ErrorCode::VALIDATION_INVALID_NUMBER, "Expected a number for " + option, text);
    }
    if (consumed != text.size()) {
        return Error(ErrorCode::VALIDATION_INVALID_NUMBER, "Expected a number for " + option, text);
    }
    return value;
}

} // namespace

Result<RenameArguments> RenameCommand::parseArguments(const std::vector<std::string>& args) {
    RenameArguments arguments;
    std::vector<std::string> positional;
    bool optionsEnded = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-") {
            positional.push_back(arg);
            continue;
        }

        // Options that take a value
        if (arg == "--pad-to" || arg == "--dir" || arg == "--config") {
            if (i + 1 >= args.size()) {
                return Error(ErrorCode::VALIDATION_MISSING_ARGUMENT, "Missing value for " + arg);
            }
            const std::string& value = args[++i];
            if (arg == "--pad-to") {
                Result<int> number = parseNumber(arg, value);
                if (!number) return number.error();
                if (number.value() < 0) {
                    return Error(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                 "Padding must not be negative", value);
                }
                arguments.padding = number.value();
            } else if (arg == "--dir") {
                arguments.directory = value;
            } else {
                arguments.configFile = value;
            }
            continue;
        }

        if (arg == "--") optionsEnded = true;
        else if (arg == "--rename") arguments.rename = true;
        else if (arg == "--full") arguments.fullMatch = true;
        else if (arg == "-r" || arg == "--recursive") arguments.recursive = true;
        else if (arg == "--continue-on-error") arguments.continueOnError = true;
        else if (arg == "-v" || arg == "--verbose") arguments.verbose = true;
        else if (arg == "--no-color") arguments.noColor = true;
        else {
            return Error(ErrorCode::VALIDATION_INVALID_ARGUMENT, "Unknown option", arg);
        }
    }

    if (positional.empty()) {
        return Error(ErrorCode::VALIDATION_MISSING_ARGUMENT, "Missing regex pattern");
    }
    if (positional.size() > 2) {
        return Error(ErrorCode::VALIDATION_INVALID_ARGUMENT, "Too many arguments", positional[2]);
    }

    arguments.pattern = positional[0];
    if (positional.size() == 2) {
        arguments.replacement = positional[1];
    }

    return arguments;
}

RenameOptions RenameCommand::buildOptions(const RenameArguments& arguments,
                                          const ConfigManager::RenameConfig& config) {
    RenameOptions options;
    options.pattern = arguments.pattern;
    options.replacement = arguments.replacement;
    options.dryRun = !arguments.rename;
    options.fullMatch = arguments.fullMatch || config.fullMatch;
    options.recursive = arguments.recursive || config.recursive;
    options.padding = arguments.padding.value_or(config.padding);
    options.root = arguments.directory.value_or(config.root);

    const bool continueOnError = arguments.continueOnError || config.onError == "continue";
    options.errorPolicy = continueOnError ? ErrorPolicy::ContinueOnError
                                          : ErrorPolicy::StopOnFirstError;
    return options;
}

int RenameCommand::execute(const std::vector<std::string>& args) {
    Result<RenameArguments> parsed = parseArguments(args);
    if (!parsed) {
        reportError(parsed.error(), std::cerr);
        std::cerr << "Use 'bulkrename rename --help' for usage.\n";
        return 1;
    }
    const RenameArguments& arguments = parsed.value();

    Result<void> loaded = loadUserConfig(arguments.configFile);
    if (!loaded) {
        return reportError(loaded.error(), std::cerr);
    }

    ConfigManager& config = ConfigManager::getInstance();

    ConfigManager::LogConfig logConfig = config.getLogConfig();
    if (arguments.verbose) logConfig.level = "debug";
    if (arguments.noColor) logConfig.color = false;
    Result<void> logging = applyLogConfig(logConfig);
    if (!logging) {
        return reportError(logging.error(), std::cerr);
    }

    RenameOptions options = buildOptions(arguments, config.getRenameConfig());

    FilesystemLister lister;
    LogManager& log = LogManager::instance();
    LogMatchReporter reporter(log);

    std::vector<Match> matches;
    try {
        matches = bulkRename(options, lister, reporter);
    } catch (const ErrorException& e) {
        log.flush();
        return reportError(e.error(), std::cerr);
    }
    log.flush();

    if (options.dryRun) {
        std::cout << matches.size() << " file(s) matched";
        if (options.hasReplacement()) {
            std::cout << " (dry run, use --rename to apply)";
        }
        std::cout << "\n";
    } else {
        std::cout << matches.size() << " file(s) renamed\n";
    }

    return 0;
}

void RenameCommand::printHelp() const {
    std::cout << "Usage: bulkrename rename <pattern> [replacement] [options]\n\n";
    std::cout << "Matches every file under the root directory against <pattern> and,\n";
    std::cout << "with a replacement template, computes the new name of each match.\n";
    std::cout << "Nothing is renamed without --rename.\n\n";
    std::cout << "Template references:\n";
    std::cout << "  \\N       Group N as matched (N = 1, 2, ...)\n";
    std::cout << "  \\L\\N     Group N in lower case\n";
    std::cout << "  \\U\\N     Group N in upper case\n\n";
    std::cout << "Options:\n";
    std::cout << "  --rename             Perform the renames (default is a dry run)\n";
    std::cout << "  --full               The whole name must match the pattern\n";
    std::cout << "  -r, --recursive      Include files in subdirectories\n";
    std::cout << "  --pad-to N           Zero-fill numeric groups to N digits\n";
    std::cout << "  --dir PATH           Root directory (default: current directory)\n";
    std::cout << "  --continue-on-error  Attempt every rename, report failures at the end\n";
    std::cout << "  --config FILE        Configuration file (default: ~/.bulkrename/config.json)\n";
    std::cout << "  -v, --verbose        Debug logging\n";
    std::cout << "  --no-color           Plain console output\n\n";
    std::cout << "Examples:\n";
    std::cout << "  bulkrename rename '(\\d+)\\.jpg' 'photo_\\1.jpg' --pad-to 3\n";
    std::cout << "  bulkrename rename '(\\w+)_(\\w+)\\.txt' '\\U\\2-\\1.txt' --rename\n";
}

} // namespace CLI
} // namespace BulkRename
