#include "features/MatchReporter.h"
#include "core/LogManager.h"

#include <sstream>

namespace BulkRename {

LogMatchReporter::LogMatchReporter(LogManager& logManager)
    : m_log(logManager) {
}

void LogMatchReporter::onBatchStart(const RenameOptions& options) {
    std::ostringstream ss;
    ss << "pattern=" << options.pattern
       << " replacement=" << (options.replacement ? *options.replacement : "<none>")
       << " full_match=" << (options.fullMatch ? "true" : "false")
       << " recursive=" << (options.recursive ? "true" : "false")
       << " padding=" << options.padding
       << " dry_run=" << (options.dryRun ? "true" : "false");
    m_log.log(LogLevel::Debug, LogCategory::Match, "matching regex pattern", ss.str());
}

void LogMatchReporter::onStage(BatchStage stage) {
    m_log.log(LogLevel::Debug, LogCategory::General, "stage", stageName(stage));
}

void LogMatchReporter::onNoMatch(const std::string& filename) {
    m_log.logWithContext(LogLevel::Warning, LogCategory::Match, "no match", "", filename);
}

void LogMatchReporter::onMatch(const Match& match, bool dryRun) {
    std::string message = match.sourceName();
    if (match.hasTarget()) {
        message += " -> " + *match.targetName();
    }
    m_log.log(LogLevel::Info, LogCategory::Match,
              dryRun ? "matched" : "renaming", message, match.describeGroups());
}

void LogMatchReporter::onRenamed(const Match& match) {
    m_log.logWithContext(LogLevel::Debug, LogCategory::Rename, "renamed",
                         match.targetName().value_or(""), match.sourceName());
}

void LogMatchReporter::onRenameFailed(const Match& match, const Error& error) {
    m_log.logWithContext(LogLevel::Error, LogCategory::Rename, "rename failed",
                         error.toString(), match.sourceName());
}

void LogMatchReporter::onBatchFinished(size_t matchCount, bool dryRun) {
    if (dryRun) {
        m_log.log(LogLevel::Debug, LogCategory::Match, "files matched",
                  "count=" + std::to_string(matchCount));
    } else {
        m_log.log(LogLevel::Info, LogCategory::Rename, "files renamed",
                  "count=" + std::to_string(matchCount));
    }
}

} // namespace BulkRename
