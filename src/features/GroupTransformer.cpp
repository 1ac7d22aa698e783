#include "features/GroupTransformer.h"

#include <algorithm>

namespace BulkRename {

bool GroupTransformer::isNumeric(const std::string& text) {
    static const PatternMatcher digits(R"(\d+)");
    return !text.empty() && digits.match(text, true).has_value();
}

size_t GroupTransformer::characterCount(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string GroupTransformer::zeroFill(const std::string& text, size_t width) {
    const size_t length = characterCount(text);
    if (length >= width) {
        return text;
    }
    return std::string(width - length, '0') + text;
}

std::vector<CaptureGroup> GroupTransformer::applyPadding(const std::vector<CaptureGroup>& groups, int padding) {
    if (padding <= 0) {
        return groups;
    }

    std::vector<CaptureGroup> result;
    result.reserve(groups.size());

    for (const auto& group : groups) {
        if (group && isNumeric(*group)) {
            result.emplace_back(zeroFill(*group, static_cast<size_t>(padding)));
        } else {
            result.push_back(group);
        }
    }

    return result;
}

} // namespace BulkRename
