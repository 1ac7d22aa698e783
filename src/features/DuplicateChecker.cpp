#include "features/DuplicateChecker.h"
#include "core/Error.h"

#include <map>

namespace BulkRename {

std::vector<std::string> DuplicateChecker::findDuplicates(const std::vector<Match>& matches) {
    std::map<std::string, size_t> counts;

    for (const auto& match : matches) {
        if (!match.hasTarget()) {
            throw ErrorException(Error(ErrorCode::RENAME_MISSING_TARGET,
                                       "Match has no target name", match.sourceName()));
        }
        ++counts[*match.targetName()];
    }

    std::vector<std::string> duplicates;
    for (const auto& entry : counts) {
        if (entry.second > 1) {
            duplicates.push_back(entry.first);
        }
    }
    return duplicates;
}

void DuplicateChecker::check(const std::vector<Match>& matches) {
    std::vector<std::string> duplicates = findDuplicates(matches);
    if (!duplicates.empty()) {
        throw ErrorException(Error::duplicateTargets(duplicates));
    }
}

} // namespace BulkRename
