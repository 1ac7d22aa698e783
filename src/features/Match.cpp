#include "features/Match.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace BulkRename {

Match::Match(std::string sourceName,
             std::optional<std::string> targetName,
             std::vector<CaptureGroup> groups,
             CaptureResult capture)
    : m_sourceName(std::move(sourceName)),
      m_targetName(std::move(targetName)),
      m_groups(std::move(groups)),
      m_capture(std::move(capture)) {
}

const CaptureGroup& Match::group(size_t index) const {
    if (index == 0 || index > m_groups.size()) {
        throw std::out_of_range("group index " + std::to_string(index) +
                                " out of range 1.." + std::to_string(m_groups.size()));
    }
    return m_groups[index - 1];
}

std::string Match::describeGroups() const {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < m_groups.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << (i + 1) << "=";
        if (m_groups[i]) {
            ss << "\"" << *m_groups[i] << "\"";
        } else {
            ss << "<none>";
        }
    }
    ss << "]";
    return ss.str();
}

std::string Match::describe() const {
    std::string result = m_sourceName;
    if (m_targetName) {
        result += " -> " + *m_targetName;
    }
    result += " " + describeGroups();
    return result;
}

} // namespace BulkRename
