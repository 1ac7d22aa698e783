#ifndef BULK_RENAME_RENAME_OPTIONS_H
#define BULK_RENAME_RENAME_OPTIONS_H

#include <string>
#include <optional>

namespace BulkRename {

/**
 * What the executor does when one rename fails
 */
enum class ErrorPolicy {
    StopOnFirstError,   // Raise immediately, later files are not touched
    ContinueOnError     // Attempt every file, raise once at the end
};

/**
 * Stages of one bulk rename invocation
 */
enum class BatchStage {
    Idle,
    Matching,
    Expanding,
    ValidatingDuplicates,
    Renaming,
    Done
};

inline const char* stageName(BatchStage stage) {
    switch (stage) {
        case BatchStage::Idle: return "idle";
        case BatchStage::Matching: return "matching";
        case BatchStage::Expanding: return "expanding";
        case BatchStage::ValidatingDuplicates: return "validating duplicates";
        case BatchStage::Renaming: return "renaming";
        case BatchStage::Done: return "done";
        default: return "unknown";
    }
}

/**
 * Bulk rename configuration
 */
struct RenameOptions {
    std::string pattern;                      // Regex matched against each relative path
    std::optional<std::string> replacement;   // Template with \N, \L\N, \U\N references
    bool dryRun = true;                       // Report only, never touch the filesystem
    bool fullMatch = false;                   // Whole name must match
    bool recursive = false;                   // Descend into subdirectories
    int padding = 0;                          // Zero-fill numeric groups to this width
    std::string root = ".";                   // Directory the relative names resolve against
    ErrorPolicy errorPolicy = ErrorPolicy::StopOnFirstError;

    /**
     * An empty template counts as no template
     */
    bool hasReplacement() const { return replacement.has_value() && !replacement->empty(); }
};

} // namespace BulkRename

#endif // BULK_RENAME_RENAME_OPTIONS_H
