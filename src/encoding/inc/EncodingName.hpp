#pragma once

#include <string>

// Selector value that asks for statistical detection instead of a fixed name
constexpr const char* AUTO_ENCODING = "auto";

bool is_auto_encoding(const std::string& selector);

// Map a user supplied encoding name to the spelling iconv understands.
// Names without a known alias are returned trimmed but otherwise unchanged.
std::string to_iconv_name(const std::string& name);
