/**
 * PatternMatcher.cpp - PCRE2 backed filename matching
 */

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "features/PatternMatcher.h"
#include "core/Error.h"

namespace BulkRename {

struct PatternMatcher::Impl {
    pcre2_code* code = nullptr;
    pcre2_match_data* matchData = nullptr;
    size_t captureCount = 0;
    std::map<std::string, size_t> namedGroups;

    ~Impl() {
        if (matchData) pcre2_match_data_free(matchData);
        if (code) pcre2_code_free(code);
    }
};

static std::string pcre2ErrorMessage(int errorCode) {
    PCRE2_UCHAR buffer[256];
    int length = pcre2_get_error_message(errorCode, buffer, sizeof(buffer));
    if (length < 0) {
        return "PCRE2 error " + std::to_string(errorCode);
    }
    return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

PatternMatcher::PatternMatcher(const std::string& pattern)
    : m_pattern(pattern), m_impl(std::make_unique<Impl>()) {
    int errorCode = 0;
    PCRE2_SIZE errorOffset = 0;

    m_impl->code = pcre2_compile(
        reinterpret_cast<PCRE2_SPTR>(pattern.c_str()),
        pattern.length(),
        PCRE2_UTF | PCRE2_UCP,
        &errorCode,
        &errorOffset,
        nullptr
    );

    if (!m_impl->code) {
        throw ErrorException(Error::invalidPattern(
            pcre2ErrorMessage(errorCode) + " at offset " + std::to_string(errorOffset) +
            " in '" + pattern + "'"));
    }

    m_impl->matchData = pcre2_match_data_create_from_pattern(m_impl->code, nullptr);
    if (!m_impl->matchData) {
        throw ErrorException(ErrorCode::UNKNOWN_ERROR, "Failed to allocate PCRE2 match data");
    }

    uint32_t captureCount = 0;
    pcre2_pattern_info(m_impl->code, PCRE2_INFO_CAPTURECOUNT, &captureCount);
    m_impl->captureCount = captureCount;

    // Name table entries: 2-byte big-endian group number, then the NUL-terminated name
    uint32_t nameCount = 0;
    uint32_t entrySize = 0;
    PCRE2_SPTR nameTable = nullptr;
    pcre2_pattern_info(m_impl->code, PCRE2_INFO_NAMECOUNT, &nameCount);
    if (nameCount > 0) {
        pcre2_pattern_info(m_impl->code, PCRE2_INFO_NAMEENTRYSIZE, &entrySize);
        pcre2_pattern_info(m_impl->code, PCRE2_INFO_NAMETABLE, &nameTable);

        PCRE2_SPTR entry = nameTable;
        for (uint32_t i = 0; i < nameCount; ++i) {
            size_t groupNumber = (static_cast<size_t>(entry[0]) << 8) | entry[1];
            std::string name(reinterpret_cast<const char*>(entry + 2));
            m_impl->namedGroups[name] = groupNumber;
            entry += entrySize;
        }
    }
}

PatternMatcher::~PatternMatcher() = default;
PatternMatcher::PatternMatcher(PatternMatcher&&) noexcept = default;
PatternMatcher& PatternMatcher::operator=(PatternMatcher&&) noexcept = default;

std::optional<CaptureResult> PatternMatcher::match(const std::string& filename, bool fullMatch) const {
    uint32_t options = 0;
    if (fullMatch) {
        options |= PCRE2_ANCHORED | PCRE2_ENDANCHORED;
    }

    int rc = pcre2_match(
        m_impl->code,
        reinterpret_cast<PCRE2_SPTR>(filename.c_str()),
        filename.length(),
        0,
        options,
        m_impl->matchData,
        nullptr
    );

    // A subject that is not valid UTF-8 cannot match a UTF pattern
    if (rc == PCRE2_ERROR_NOMATCH ||
        (rc <= PCRE2_ERROR_UTF8_ERR1 && rc >= PCRE2_ERROR_UTF8_ERR21)) {
        return std::nullopt;
    }
    if (rc < 0) {
        throw ErrorException(Error(ErrorCode::RENAME_MATCH_FAILED, "Pattern match failed",
                                   filename + ": " + pcre2ErrorMessage(rc)));
    }

    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(m_impl->matchData);

    CaptureResult result;
    result.matchStart = ovector[0];
    result.matchEnd = ovector[1];
    result.matchedText = filename.substr(ovector[0], ovector[1] - ovector[0]);
    result.namedGroups = m_impl->namedGroups;

    // rc is one more than the highest group that was set
    result.groups.reserve(m_impl->captureCount);
    for (size_t i = 1; i <= m_impl->captureCount; ++i) {
        if (static_cast<int>(i) < rc && ovector[2 * i] != PCRE2_UNSET) {
            result.groups.emplace_back(filename.substr(ovector[2 * i], ovector[2 * i + 1] - ovector[2 * i]));
        } else {
            result.groups.emplace_back(std::nullopt);
        }
    }

    return result;
}

size_t PatternMatcher::groupCount() const {
    return m_impl->captureCount;
}

const std::map<std::string, size_t>& PatternMatcher::namedGroups() const {
    return m_impl->namedGroups;
}

} // namespace BulkRename
