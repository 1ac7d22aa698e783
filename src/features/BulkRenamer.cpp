/**
 * BulkRenamer.cpp - Regex based bulk file renaming
 */

#include "features/BulkRenamer.h"
#include "features/DuplicateChecker.h"
#include "features/FileLister.h"
#include "features/MatchReporter.h"
#include "features/MatchSetBuilder.h"
#include "features/RenameExecutor.h"
#include "core/Error.h"

namespace BulkRename {

BulkRenamer::BulkRenamer(const FileLister& lister, MatchReporter& reporter)
    : m_lister(lister), m_reporter(reporter) {
}

void BulkRenamer::enterStage(BatchStage stage) {
    m_stage = stage;
    m_reporter.onStage(stage);
}

std::vector<Match> BulkRenamer::run(const RenameOptions& options) {
    m_stage = BatchStage::Idle;

    if (!options.dryRun && !options.hasReplacement()) {
        throw ErrorException(Error::missingReplacement());
    }

    m_reporter.onBatchStart(options);

    enterStage(BatchStage::Matching);
    MatchSetBuilder builder(m_lister, m_reporter);
    std::vector<Match> matches = builder.build(options);
    if (options.hasReplacement()) {
        m_stage = BatchStage::Expanding;
    }

    for (const auto& match : matches) {
        m_reporter.onMatch(match, options.dryRun);
    }

    if (options.hasReplacement()) {
        enterStage(BatchStage::ValidatingDuplicates);
        DuplicateChecker::check(matches);
    }

    if (!options.dryRun) {
        enterStage(BatchStage::Renaming);
        RenameExecutor executor(options.root, m_reporter, options.errorPolicy);
        executor.apply(matches);
    }

    m_reporter.onBatchFinished(matches.size(), options.dryRun);
    enterStage(BatchStage::Done);
    return matches;
}

std::vector<Match> bulkRename(const RenameOptions& options,
                              const FileLister& lister,
                              MatchReporter& reporter) {
    BulkRenamer renamer(lister, reporter);
    return renamer.run(options);
}

} // namespace BulkRename
