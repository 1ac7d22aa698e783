#ifndef BULK_RENAME_BULK_RENAMER_H
#define BULK_RENAME_BULK_RENAMER_H

#include <vector>

#include "features/Match.h"
#include "features/RenameOptions.h"

namespace BulkRename {

class FileLister;
class MatchReporter;

/**
 * Regex based bulk file renaming
 *
 * One run goes through
 *   matching -> expanding (with a template) -> validating duplicates
 *   (with a template) -> renaming (unless dry run) -> done
 *
 * Nothing is renamed unless every name matched, expanded and passed the
 * duplicate check.
 */
class BulkRenamer {
public:
    BulkRenamer(const FileLister& lister, MatchReporter& reporter);

    /**
     * Match (and rename) the files under options.root
     * @return Matches in source name order
     * @throws ErrorException RENAME_MISSING_REPLACEMENT when renaming without a
     *         template, RENAME_INVALID_PATTERN, RENAME_INVALID_TEMPLATE,
     *         RENAME_MATCH_FAILED, RENAME_DUPLICATE_TARGET, FS_* for listing
     *         or rename failures
     */
    std::vector<Match> run(const RenameOptions& options);

    /**
     * Stage reached by the last run; Done only after a complete run
     */
    BatchStage stage() const { return m_stage; }

private:
    void enterStage(BatchStage stage);

    const FileLister& m_lister;
    MatchReporter& m_reporter;
    BatchStage m_stage = BatchStage::Idle;
};

/**
 * Convenience wrapper around BulkRenamer::run
 */
std::vector<Match> bulkRename(const RenameOptions& options,
                              const FileLister& lister,
                              MatchReporter& reporter);

} // namespace BulkRename

#endif // BULK_RENAME_BULK_RENAMER_H
