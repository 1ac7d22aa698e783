#ifndef BULK_RENAME_GROUP_TRANSFORMER_H
#define BULK_RENAME_GROUP_TRANSFORMER_H

#include <string>
#include <vector>

#include "features/PatternMatcher.h"

namespace BulkRename {

/**
 * Zero padding of numeric capture groups
 */
class GroupTransformer {
public:
    /**
     * True if text is non-empty and made only of Unicode decimal digits
     */
    static bool isNumeric(const std::string& text);

    /**
     * Number of code points in UTF-8 text
     */
    static size_t characterCount(const std::string& text);

    /**
     * Left-pad text with '0' until it is at least width code points long
     */
    static std::string zeroFill(const std::string& text, size_t width);

    /**
     * Pad every numeric group to padding characters.
     * Non-numeric and non-participating groups are returned unchanged;
     * padding <= 0 disables the transform.
     */
    static std::vector<CaptureGroup> applyPadding(const std::vector<CaptureGroup>& groups, int padding);
};

} // namespace BulkRename

#endif // BULK_RENAME_GROUP_TRANSFORMER_H
