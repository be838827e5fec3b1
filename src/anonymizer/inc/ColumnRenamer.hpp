#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unicode/regex.h>

struct RenameResult {
    std::string text;
    size_t replacements = 0;
};

// Replaces every non-overlapping, case-insensitive match of a pattern with
// <prefix><n>, numbering matches from 1 in left-to-right order. Matching runs
// on code points, so \w, \b and case folding follow Unicode rules.
class ColumnRenamer {
public:
    // Throws PatternError when the pattern does not compile
    ColumnRenamer(const std::string& pattern, const std::string& prefix);

    // Numbering restarts at 1 on every call. Text must be UTF-8.
    RenameResult rename(const std::string& text) const;

    std::string placeholder(size_t index) const;

    const std::string& pattern() const { return pattern_; }
    const std::string& prefix() const { return prefix_; }

private:
    static std::unique_ptr<icu::RegexPattern> compile(const std::string& pattern);

    std::string pattern_;
    std::string prefix_;
    std::unique_ptr<icu::RegexPattern> regex_;
};
