#pragma once

#include <string>

struct AnonymizerConfig {
    static constexpr const char* DEFAULT_COLUMN_NAME_PATTERN =
        R"(\b(\w+_name|\w+_address|\w+_phone|\w+_email|\w+_id)\b)";
    static constexpr const char* DEFAULT_COLUMN_PREFIX = "column_";
    static constexpr const char* DEFAULT_ENCODING = "utf-8";

    std::string input_file;
    std::string output_file;
    std::string column_name_pattern = DEFAULT_COLUMN_NAME_PATTERN;
    std::string column_prefix = DEFAULT_COLUMN_PREFIX;
    std::string encoding = DEFAULT_ENCODING;   // encoding name or "auto"

    bool verbose = false;
    std::string log_file;                      // empty: log to stderr only
};
