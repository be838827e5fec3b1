#pragma once

#include <optional>
#include <string>

struct DetectedEncoding {
    std::string name;      // charset name as reported by ICU, e.g. "UTF-8", "ISO-8859-1"
    int confidence = 0;    // 0..100
};

class EncodingDetector {
public:
    // Best guess for the encoding of raw bytes. Empty input, or input ICU
    // cannot match to any charset, yields std::nullopt.
    static std::optional<DetectedEncoding> detect(const std::string& data);
};
