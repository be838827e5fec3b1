#pragma once

#include <string>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
};
