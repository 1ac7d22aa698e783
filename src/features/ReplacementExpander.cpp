/**
 * ReplacementExpander.cpp - Replacement template validation and expansion
 */

#include "features/ReplacementExpander.h"
#include "core/Error.h"

#include <cstring>
#include <locale>
#include <stdexcept>

namespace BulkRename {

namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isOctalDigit(char c) {
    return c >= '0' && c <= '7';
}

// Case tables come from the first UTF-8 locale the C library provides
const std::ctype<wchar_t>& caseTable() {
    static const std::locale locale = [] {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
            try {
                return std::locale(name);
            } catch (const std::runtime_error&) {
                continue;
            }
        }
        return std::locale::classic();
    }();
    return std::use_facet<std::ctype<wchar_t>>(locale);
}

// Decode one UTF-8 sequence at text[pos]; returns its length or 0 if malformed
size_t decodeUtf8(const std::string& text, size_t pos, char32_t& codePoint) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        codePoint = (codePoint << 6) | (next & 0x3F);
    }
    return length;
}

void appendUtf8(std::string& out, char32_t codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

// Map each code point through the locale's case table; malformed bytes pass through
std::string mapCase(const std::string& text, bool upper) {
    const std::ctype<wchar_t>& table = caseTable();
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t codePoint = 0;
        const size_t length = decodeUtf8(text, pos, codePoint);
        if (length == 0) {
            result += text[pos++];
            continue;
        }
        const auto wide = static_cast<wchar_t>(codePoint);
        const wchar_t mapped = upper ? table.toupper(wide) : table.tolower(wide);
        appendUtf8(result, static_cast<char32_t>(mapped));
        pos += length;
    }
    return result;
}

bool isAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isIdentifierStart(char c) {
    return isAsciiLetter(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || isAsciiDigit(c);
}

bool isIdentifier(const std::string& name) {
    if (name.empty() || !isIdentifierStart(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!isIdentifierChar(c)) {
            return false;
        }
    }
    return true;
}

[[noreturn]] void failTemplate(const std::string& replacementTemplate,
                               const std::string& reason, size_t position) {
    throw ErrorException(Error::invalidTemplate(
        reason + " at position " + std::to_string(position) +
        " in '" + replacementTemplate + "'"));
}

void checkGroupIndex(const std::string& replacementTemplate, const std::string& digits,
                     size_t groupCount, size_t position) {
    // Anything longer than 9 digits is out of range for any real pattern
    if (digits.length() > 9 || std::stoul(digits) > groupCount) {
        failTemplate(replacementTemplate, "invalid group reference " + digits, position);
    }
}

} // namespace

std::string ReplacementExpander::simplify(const std::string& replacementTemplate) {
    std::string simplified = replaceAll(replacementTemplate, LOWER_DIRECTIVE, "");
    return replaceAll(simplified, UPPER_DIRECTIVE, "");
}

void ReplacementExpander::validate(const std::string& replacementTemplate, const CaptureResult& capture) {
    const std::string simplified = simplify(replacementTemplate);
    const size_t groupCount = capture.groupCount();
    const size_t n = simplified.length();

    size_t i = 0;
    while (i < n) {
        if (simplified[i] != '\\') {
            ++i;
            continue;
        }

        const size_t escapeStart = i;
        if (i + 1 >= n) {
            failTemplate(simplified, "bad escape (end of template)", escapeStart);
        }

        const char c = simplified[i + 1];

        if (c == 'g') {
            // \g<N> or \g<name>
            if (i + 2 >= n || simplified[i + 2] != '<') {
                failTemplate(simplified, "missing <", escapeStart);
            }
            size_t close = simplified.find('>', i + 3);
            if (close == std::string::npos) {
                failTemplate(simplified, "missing >, unterminated name", escapeStart);
            }
            std::string name = simplified.substr(i + 3, close - (i + 3));
            if (name.empty()) {
                failTemplate(simplified, "missing group name", escapeStart);
            }

            bool allDigits = true;
            for (char d : name) {
                if (!isAsciiDigit(d)) { allDigits = false; break; }
            }

            if (allDigits) {
                checkGroupIndex(simplified, name, groupCount, escapeStart);
            } else if (isIdentifier(name)) {
                if (capture.namedGroups.find(name) == capture.namedGroups.end()) {
                    failTemplate(simplified, "unknown group name '" + name + "'", escapeStart);
                }
            } else {
                failTemplate(simplified, "bad character in group name '" + name + "'", escapeStart);
            }
            i = close + 1;
        } else if (c == '0') {
            // Octal escape: \0, \0o, \0oo
            i += 2;
            for (int k = 0; k < 2 && i < n && isOctalDigit(simplified[i]); ++k) {
                ++i;
            }
        } else if (isAsciiDigit(c)) {
            size_t next = i + 2;
            if (next < n && isAsciiDigit(simplified[next])) {
                // Three octal digits form a character escape, otherwise a two-digit group
                if (isOctalDigit(c) && isOctalDigit(simplified[next]) &&
                    next + 1 < n && isOctalDigit(simplified[next + 1])) {
                    std::string octal = simplified.substr(i + 1, 3);
                    if (std::stoul(octal, nullptr, 8) > 0377) {
                        failTemplate(simplified, "octal escape value \\" + octal +
                                     " outside of range 0-0o377", escapeStart);
                    }
                    i = next + 2;
                } else {
                    checkGroupIndex(simplified, simplified.substr(i + 1, 2), groupCount, escapeStart);
                    i = next + 1;
                }
            } else {
                checkGroupIndex(simplified, std::string(1, c), groupCount, escapeStart);
                i = next;
            }
        } else if (std::strchr("abfnrtv\\", c) != nullptr) {
            i += 2;
        } else if (isAsciiLetter(c)) {
            failTemplate(simplified, std::string("bad escape \\") + c, escapeStart);
        } else {
            // Backslash before punctuation is kept literally
            i += 2;
        }
    }
}

std::vector<SubstitutionStep> ReplacementExpander::buildSteps(size_t groupCount) {
    std::vector<SubstitutionStep> steps;
    steps.reserve(groupCount * 3);

    for (size_t index = 1; index <= groupCount; ++index) {
        const std::string reference = "\\" + std::to_string(index);
        steps.push_back({index, SubstitutionStep::Kind::Lower, LOWER_DIRECTIVE + reference});
        steps.push_back({index, SubstitutionStep::Kind::Upper, UPPER_DIRECTIVE + reference});
        steps.push_back({index, SubstitutionStep::Kind::Plain, reference});
    }

    return steps;
}

std::string ReplacementExpander::expand(const std::string& replacementTemplate,
                                        const std::vector<CaptureGroup>& groups) {
    std::string result = replacementTemplate;

    for (const auto& step : buildSteps(groups.size())) {
        const CaptureGroup& group = groups[step.groupIndex - 1];
        const std::string value = group.value_or("");

        switch (step.kind) {
            case SubstitutionStep::Kind::Lower:
                result = replaceAll(result, step.find, toLower(value));
                break;
            case SubstitutionStep::Kind::Upper:
                result = replaceAll(result, step.find, toUpper(value));
                break;
            case SubstitutionStep::Kind::Plain:
                result = replaceAll(result, step.find, value);
                break;
        }
    }

    return result;
}

std::string ReplacementExpander::toLower(const std::string& text) {
    return mapCase(text, false);
}

std::string ReplacementExpander::toUpper(const std::string& text) {
    return mapCase(text, true);
}

std::string ReplacementExpander::replaceAll(const std::string& text, const std::string& find,
                                            const std::string& replacement) {
    if (find.empty()) {
        return text;
    }

    std::string result;
    result.reserve(text.length());

    size_t pos = 0;
    size_t hit;
    while ((hit = text.find(find, pos)) != std::string::npos) {
        result.append(text, pos, hit - pos);
        result += replacement;
        pos = hit + find.length();
    }
    result.append(text, pos, std::string::npos);

    return result;
}

} // namespace BulkRename
