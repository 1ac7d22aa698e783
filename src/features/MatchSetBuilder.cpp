#include "features/MatchSetBuilder.h"
#include "features/FileLister.h"
#include "features/MatchReporter.h"
#include "features/GroupTransformer.h"
#include "features/ReplacementExpander.h"

#include <algorithm>
#include <utility>

namespace BulkRename {

MatchSetBuilder::MatchSetBuilder(const FileLister& lister, MatchReporter& reporter)
    : m_lister(lister), m_reporter(reporter) {
}

std::vector<Match> MatchSetBuilder::build(const RenameOptions& options) const {
    return buildFromNames(m_lister.listFiles(options.root, options.recursive), options);
}

std::vector<Match> MatchSetBuilder::buildFromNames(std::vector<std::string> filenames,
                                                   const RenameOptions& options) const {
    // Compile before any per-file work so a bad pattern fails the batch up front
    PatternMatcher matcher(options.pattern);

    std::sort(filenames.begin(), filenames.end());

    std::vector<std::pair<std::string, CaptureResult>> captured;
    captured.reserve(filenames.size());

    for (auto& filename : filenames) {
        auto capture = matcher.match(filename, options.fullMatch);
        if (!capture) {
            m_reporter.onNoMatch(filename);
            continue;
        }
        captured.emplace_back(std::move(filename), std::move(*capture));
    }

    std::optional<std::string> replacement;
    if (options.hasReplacement()) {
        replacement = options.replacement;
        m_reporter.onStage(BatchStage::Expanding);
    }

    std::vector<Match> matches;
    matches.reserve(captured.size());
    for (const auto& entry : captured) {
        matches.push_back(createMatch(entry.first, entry.second, replacement, options.padding));
    }

    return matches;
}

Match MatchSetBuilder::createMatch(const std::string& filename,
                                   const CaptureResult& capture,
                                   const std::optional<std::string>& replacement,
                                   int padding) {
    std::vector<CaptureGroup> groups = GroupTransformer::applyPadding(capture.groups, padding);

    if (!replacement || replacement->empty()) {
        return Match(filename, std::nullopt, std::move(groups), capture);
    }

    ReplacementExpander::validate(*replacement, capture);
    std::string target = ReplacementExpander::expand(*replacement, groups);
    return Match(filename, std::move(target), std::move(groups), capture);
}

} // namespace BulkRename
