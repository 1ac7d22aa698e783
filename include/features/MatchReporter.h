#ifndef BULK_RENAME_MATCH_REPORTER_H
#define BULK_RENAME_MATCH_REPORTER_H

#include <string>
#include <cstddef>

#include "features/Match.h"
#include "features/RenameOptions.h"
#include "core/Error.h"

namespace BulkRename {

class LogManager;

/**
 * Receives progress of a bulk rename
 *
 * Purely observational: nothing a reporter does changes the outcome
 * of the batch.
 */
class MatchReporter {
public:
    virtual ~MatchReporter() = default;

    virtual void onBatchStart(const RenameOptions& options) { (void)options; }
    virtual void onStage(BatchStage stage) { (void)stage; }

    /**
     * A listed file did not match the pattern and was skipped
     */
    virtual void onNoMatch(const std::string& filename) = 0;

    /**
     * Called once per match after the whole set is built
     */
    virtual void onMatch(const Match& match, bool dryRun) = 0;

    virtual void onRenamed(const Match& match) { (void)match; }
    virtual void onRenameFailed(const Match& match, const Error& error) { (void)match; (void)error; }

    virtual void onBatchFinished(size_t matchCount, bool dryRun) { (void)matchCount; (void)dryRun; }
};

/**
 * Reporter writing to a LogManager
 */
class LogMatchReporter : public MatchReporter {
public:
    explicit LogMatchReporter(LogManager& logManager);

    void onBatchStart(const RenameOptions& options) override;
    void onStage(BatchStage stage) override;
    void onNoMatch(const std::string& filename) override;
    void onMatch(const Match& match, bool dryRun) override;
    void onRenamed(const Match& match) override;
    void onRenameFailed(const Match& match, const Error& error) override;
    void onBatchFinished(size_t matchCount, bool dryRun) override;

private:
    LogManager& m_log;
};

} // namespace BulkRename

#endif // BULK_RENAME_MATCH_REPORTER_H
