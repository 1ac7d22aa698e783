#ifndef BULK_RENAME_REPLACEMENT_EXPANDER_H
#define BULK_RENAME_REPLACEMENT_EXPANDER_H

#include <string>
#include <vector>

#include "features/PatternMatcher.h"

namespace BulkRename {

/**
 * One literal find/replace applied during expansion
 */
struct SubstitutionStep {
    enum class Kind {
        Lower,      // \L\N -> group N in lower case
        Upper,      // \U\N -> group N in upper case
        Plain       // \N   -> group N as captured
    };

    size_t groupIndex;   // 1-based
    Kind kind;
    std::string find;
};

/**
 * Expands replacement templates against capture groups
 *
 * Template syntax:
 *   \N     group N
 *   \L\N   group N converted to lower case
 *   \U\N   group N converted to upper case
 *
 * Expansion is textual: for each group in ascending order, the case
 * directive forms are replaced before the plain reference, so "\1"
 * never consumes the reference inside "\L\1".
 */
class ReplacementExpander {
public:
    static constexpr const char* LOWER_DIRECTIVE = "\\L";
    static constexpr const char* UPPER_DIRECTIVE = "\\U";

    /**
     * Check that a template is usable with a match.
     *
     * The case directive markers are stripped first; what remains must be
     * a valid regex replacement template whose group references (\N, \NN,
     * \g<N>, \g<name>) all exist in the pattern.
     *
     * @throws ErrorException RENAME_INVALID_TEMPLATE
     */
    static void validate(const std::string& replacementTemplate, const CaptureResult& capture);

    /**
     * Template with every literal \L and \U removed
     */
    static std::string simplify(const std::string& replacementTemplate);

    /**
     * Ordered substitution steps for a pattern with groupCount groups
     */
    static std::vector<SubstitutionStep> buildSteps(size_t groupCount);

    /**
     * Expand a template. Non-participating groups expand to "".
     * @param groups Post-padding groups, groups[0] is group 1
     */
    static std::string expand(const std::string& replacementTemplate,
                              const std::vector<CaptureGroup>& groups);

    /**
     * Unicode case conversion of UTF-8 text, one code point at a time
     */
    static std::string toLower(const std::string& text);
    static std::string toUpper(const std::string& text);

    /**
     * Replace every non-overlapping occurrence of find, scanning left to
     * right; inserted text is not rescanned.
     */
    static std::string replaceAll(const std::string& text, const std::string& find,
                                  const std::string& replacement);
};

} // namespace BulkRename

#endif // BULK_RENAME_REPLACEMENT_EXPANDER_H
