#ifndef BULK_RENAME_DUPLICATE_CHECKER_H
#define BULK_RENAME_DUPLICATE_CHECKER_H

#include <string>
#include <vector>

#include "features/Match.h"

namespace BulkRename {

/**
 * Detects matches that would be renamed to the same target
 */
class DuplicateChecker {
public:
    /**
     * Target names shared by two or more matches, sorted, each listed once
     * @throws ErrorException RENAME_MISSING_TARGET if a match has no target
     */
    static std::vector<std::string> findDuplicates(const std::vector<Match>& matches);

    /**
     * Abort the batch if any target name collides
     * @throws ErrorException RENAME_DUPLICATE_TARGET naming every colliding target
     */
    static void check(const std::vector<Match>& matches);
};

} // namespace BulkRename

#endif // BULK_RENAME_DUPLICATE_CHECKER_H
