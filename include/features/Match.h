#ifndef BULK_RENAME_MATCH_H
#define BULK_RENAME_MATCH_H

#include <string>
#include <vector>
#include <optional>

#include "features/PatternMatcher.h"

namespace BulkRename {

/**
 * One matched file and its computed new name
 *
 * Immutable once built. The target name is present only when a
 * replacement template was supplied.
 */
class Match {
public:
    /**
     * @param sourceName Relative path as discovered
     * @param targetName Computed relative path, nullopt without a template
     * @param groups Post-padding groups, groups[0] is group 1
     * @param capture Raw match data the groups were taken from
     */
    Match(std::string sourceName,
          std::optional<std::string> targetName,
          std::vector<CaptureGroup> groups,
          CaptureResult capture);

    const std::string& sourceName() const { return m_sourceName; }
    const std::optional<std::string>& targetName() const { return m_targetName; }
    bool hasTarget() const { return m_targetName.has_value(); }

    /**
     * Post-padding groups, groups()[0] is group 1
     */
    const std::vector<CaptureGroup>& groups() const { return m_groups; }
    size_t groupCount() const { return m_groups.size(); }

    /**
     * Group by 1-based index
     * @throws std::out_of_range for 0 or an index past the last group
     */
    const CaptureGroup& group(size_t index) const;

    const CaptureResult& capture() const { return m_capture; }

    /**
     * Groups rendered as [1="abc", 2=<none>]
     */
    std::string describeGroups() const;

    /**
     * "source -> target [groups]" or "source [groups]"
     */
    std::string describe() const;

private:
    std::string m_sourceName;
    std::optional<std::string> m_targetName;
    std::vector<CaptureGroup> m_groups;
    CaptureResult m_capture;
};

} // namespace BulkRename

#endif // BULK_RENAME_MATCH_H
