#pragma once

#include <stdexcept>
#include <string>

// Failure categories reported by the anonymizer. Each one maps to its own
// log message in main; anything else is reported as an unexpected error.
class AnonymizerError : public std::runtime_error {
public:
    explicit AnonymizerError(const std::string& msg) : std::runtime_error(msg) {}
};

// Missing path arguments, bad command line or config file, failed detection
class ConfigError : public AnonymizerError {
public:
    explicit ConfigError(const std::string& msg) : AnonymizerError(msg) {}
};

class NotFoundError : public AnonymizerError {
public:
    explicit NotFoundError(const std::string& path)
        : AnonymizerError("Input file '" + path + "' not found."), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class IoError : public AnonymizerError {
public:
    IoError(const std::string& path, const std::string& reason)
        : AnonymizerError(path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class PatternError : public AnonymizerError {
public:
    PatternError(const std::string& pattern, const std::string& reason)
        : AnonymizerError("Invalid regular expression '" + pattern + "': " + reason),
          pattern_(pattern) {}

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
};

// Unknown encoding name or text that cannot be represented in the target
// encoding. Reported as an unexpected error.
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};
