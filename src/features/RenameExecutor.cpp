/**
 * RenameExecutor.cpp - Filesystem renames for a validated match set
 */

#include "features/RenameExecutor.h"
#include "features/MatchReporter.h"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace BulkRename {

RenameExecutor::RenameExecutor(std::string root, MatchReporter& reporter, ErrorPolicy policy)
    : m_root(std::move(root)), m_reporter(reporter), m_policy(policy) {
}

Result<void> RenameExecutor::renameOne(const Match& match) const {
    if (!match.hasTarget()) {
        return Error(ErrorCode::RENAME_MISSING_TARGET, "Match has no target name", match.sourceName());
    }

    const fs::path rootPath(m_root);
    const fs::path source = rootPath / match.sourceName();
    const fs::path target = rootPath / *match.targetName();

    const fs::path parent = target.parent_path();
    if (!parent.empty()) {
        try {
            fs::create_directories(parent);
        } catch (const fs::filesystem_error& e) {
            Error cause = Error::fromFilesystemError(e);
            return Error(ErrorCode::FS_CREATE_DIRECTORY_FAILED, "Failed to create directory",
                         cause.details());
        }
    }

    try {
        fs::rename(source, target);
    } catch (const fs::filesystem_error& e) {
        return Error::fromFilesystemError(e);
    }

    return Result<void>();
}

size_t RenameExecutor::apply(const std::vector<Match>& matches) const {
    size_t renamed = 0;
    std::string failures;
    size_t failureCount = 0;

    for (const auto& match : matches) {
        Result<void> result = renameOne(match);
        if (result) {
            m_reporter.onRenamed(match);
            ++renamed;
            continue;
        }

        m_reporter.onRenameFailed(match, result.error());

        if (m_policy == ErrorPolicy::StopOnFirstError) {
            Error error = result.error();
            error.withDetails(error.details() + "; " + std::to_string(renamed) + " of " +
                              std::to_string(matches.size()) + " renames applied before the failure");
            throw ErrorException(error);
        }

        ++failureCount;
        if (!failures.empty()) failures += "; ";
        failures += match.sourceName() + ": " + result.error().toString();
    }

    if (failureCount > 0) {
        throw ErrorException(Error(ErrorCode::FS_RENAME_FAILED,
            std::to_string(failureCount) + " of " + std::to_string(matches.size()) + " renames failed",
            failures));
    }

    return renamed;
}

} // namespace BulkRename
