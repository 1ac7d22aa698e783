#ifndef BULK_RENAME_RENAME_EXECUTOR_H
#define BULK_RENAME_RENAME_EXECUTOR_H

#include <string>
#include <vector>

#include "core/Error.h"
#include "features/Match.h"
#include "features/RenameOptions.h"

namespace BulkRename {

class MatchReporter;

/**
 * Applies validated renames to the filesystem
 *
 * Each rename is independent: there is no rollback, so a failure
 * part way through leaves the earlier renames in place.
 */
class RenameExecutor {
public:
    /**
     * @param root Directory source and target names are relative to
     * @param reporter Receives one event per rename
     * @param policy Stop at the first failure, or attempt every file
     */
    RenameExecutor(std::string root, MatchReporter& reporter,
                   ErrorPolicy policy = ErrorPolicy::StopOnFirstError);

    /**
     * Rename every match in order, creating missing target directories
     * @return Number of files renamed
     * @throws ErrorException with an FS_* code when a rename fails
     */
    size_t apply(const std::vector<Match>& matches) const;

    /**
     * Rename a single match
     */
    Result<void> renameOne(const Match& match) const;

private:
    std::string m_root;
    MatchReporter& m_reporter;
    ErrorPolicy m_policy;
};

} // namespace BulkRename

#endif // BULK_RENAME_RENAME_EXECUTOR_H
