#include "ColumnRenamer.hpp"
#include "AnonymizerError.hpp"
#include <stdexcept>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

ColumnRenamer::ColumnRenamer(const std::string& pattern, const std::string& prefix)
    : pattern_(pattern), prefix_(prefix), regex_(compile(pattern)) {}

std::unique_ptr<icu::RegexPattern> ColumnRenamer::compile(const std::string& pattern) {
    UParseError parse_error;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> regex(icu::RegexPattern::compile(
        icu::UnicodeString::fromUTF8(pattern), UREGEX_CASE_INSENSITIVE, parse_error, status));

    if (U_FAILURE(status)) {
        std::string reason = u_errorName(status);
        if (parse_error.offset >= 0) {
            reason += " at offset " + std::to_string(parse_error.offset);
        }
        throw PatternError(pattern, reason);
    }
    return regex;
}

std::string ColumnRenamer::placeholder(size_t index) const {
    return prefix_ + std::to_string(index);
}

RenameResult ColumnRenamer::rename(const std::string& text) const {
    RenameResult result;

    // The matcher keeps a reference to input
    const icu::UnicodeString input = icu::UnicodeString::fromUTF8(text);

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(regex_->matcher(input, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error("Failed to create matcher for '" + pattern_ + "': " + u_errorName(status));
    }

    icu::UnicodeString output;
    int32_t last_pos = 0;
    while (matcher->find(status)) {
        const int32_t start = matcher->start(status);
        const int32_t end = matcher->end(status);
        if (U_FAILURE(status)) {
            break;
        }
        output.append(input, last_pos, start - last_pos);
        output.append(icu::UnicodeString::fromUTF8(placeholder(++result.replacements)));
        last_pos = end;
    }

    // Stack or time limit exceeded while matching
    if (U_FAILURE(status)) {
        throw std::runtime_error("Matching '" + pattern_ + "' failed: " + u_errorName(status));
    }

    output.append(input, last_pos, input.length() - last_pos);
    output.toUTF8String(result.text);
    return result;
}
