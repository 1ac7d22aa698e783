#ifndef BULK_RENAME_MATCH_SET_BUILDER_H
#define BULK_RENAME_MATCH_SET_BUILDER_H

#include <string>
#include <vector>
#include <optional>

#include "features/Match.h"
#include "features/PatternMatcher.h"
#include "features/RenameOptions.h"

namespace BulkRename {

class FileLister;
class MatchReporter;

/**
 * Builds the ordered match set of one invocation
 *
 * Names are sorted lexicographically, matched against the pattern,
 * padded, and (with a template) expanded into target names. Names that
 * do not match are reported and left out.
 */
class MatchSetBuilder {
public:
    MatchSetBuilder(const FileLister& lister, MatchReporter& reporter);

    /**
     * List options.root and build the match set
     * @throws ErrorException on listing failure, invalid pattern or template
     */
    std::vector<Match> build(const RenameOptions& options) const;

    /**
     * Build the match set from already discovered names
     */
    std::vector<Match> buildFromNames(std::vector<std::string> filenames,
                                      const RenameOptions& options) const;

    /**
     * Turn one successful capture into a Match: pad the groups, then
     * validate and expand the template when one is given.
     * @throws ErrorException RENAME_INVALID_TEMPLATE
     */
    static Match createMatch(const std::string& filename,
                             const CaptureResult& capture,
                             const std::optional<std::string>& replacement,
                             int padding);

private:
    const FileLister& m_lister;
    MatchReporter& m_reporter;
};

} // namespace BulkRename

#endif // BULK_RENAME_MATCH_SET_BUILDER_H
