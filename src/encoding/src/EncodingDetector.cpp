#include "EncodingDetector.hpp"
#include "AnonymizerError.hpp"
#include <unicode/ucsdet.h>
#include <unicode/utypes.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>

std::optional<DetectedEncoding> EncodingDetector::detect(const std::string& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<UCharsetDetector, decltype(&ucsdet_close)> detector(
        ucsdet_open(&status), &ucsdet_close);
    if (U_FAILURE(status) || !detector) {
        throw EncodingError(std::string("ucsdet_open failed: ") + u_errorName(status));
    }

    // ICU takes an int32_t length; the leading 2 GiB are more than enough to guess from
    const auto length = static_cast<int32_t>(
        std::min<size_t>(data.size(), static_cast<size_t>(std::numeric_limits<int32_t>::max())));

    ucsdet_setText(detector.get(), data.data(), length, &status);
    if (U_FAILURE(status)) {
        throw EncodingError(std::string("ucsdet_setText failed: ") + u_errorName(status));
    }

    const UCharsetMatch* match = ucsdet_detect(detector.get(), &status);
    if (U_FAILURE(status) || match == nullptr) {
        return std::nullopt;
    }

    const char* name = ucsdet_getName(match, &status);
    if (U_FAILURE(status) || name == nullptr || *name == '\0') {
        return std::nullopt;
    }

    DetectedEncoding result;
    result.name = name;
    result.confidence = static_cast<int>(ucsdet_getConfidence(match, &status));
    if (U_FAILURE(status)) {
        result.confidence = 0;
    }
    return result;
}
