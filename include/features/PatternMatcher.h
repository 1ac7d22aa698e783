#ifndef BULK_RENAME_PATTERN_MATCHER_H
#define BULK_RENAME_PATTERN_MATCHER_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <cstddef>

namespace BulkRename {

/**
 * One capture group: the captured text, or nullopt when the group
 * did not take part in the match (distinct from an empty capture).
 */
using CaptureGroup = std::optional<std::string>;

/**
 * Result of applying a pattern to one filename
 */
struct CaptureResult {
    std::vector<CaptureGroup> groups;   // groups[0] is group 1
    size_t matchStart = 0;              // Byte offset of the match in the subject
    size_t matchEnd = 0;                // Byte offset one past the match
    std::string matchedText;            // Whole matched text (group 0)
    std::map<std::string, size_t> namedGroups;  // Group names of the pattern

    size_t groupCount() const { return groups.size(); }
};

/**
 * Compiled regular expression applied to filenames
 *
 * Backed by PCRE2 in UTF mode with Unicode character properties, so
 * \d, \w and \s behave as in Unicode-aware regex dialects. The pattern
 * is compiled once and can be applied to any number of names.
 */
class PatternMatcher {
public:
    /**
     * Compile a pattern
     * @param pattern Regular expression
     * @throws ErrorException RENAME_INVALID_PATTERN if it does not compile
     */
    explicit PatternMatcher(const std::string& pattern);
    ~PatternMatcher();

    PatternMatcher(const PatternMatcher&) = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&) noexcept;
    PatternMatcher& operator=(PatternMatcher&&) noexcept;

    /**
     * Apply the pattern to a filename
     * @param filename Candidate name
     * @param fullMatch true: the whole name must match; false: first match anywhere
     * @return Captures, or nullopt if the name does not match
     */
    std::optional<CaptureResult> match(const std::string& filename, bool fullMatch) const;

    /**
     * Number of capture groups in the pattern
     */
    size_t groupCount() const;

    /**
     * Named groups of the pattern (name -> 1-based index)
     */
    const std::map<std::string, size_t>& namedGroups() const;

    const std::string& pattern() const { return m_pattern; }

private:
    struct Impl;

    std::string m_pattern;
    std::unique_ptr<Impl> m_impl;
};

} // namespace BulkRename

#endif // BULK_RENAME_PATTERN_MATCHER_H
