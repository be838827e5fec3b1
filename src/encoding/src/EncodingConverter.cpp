#include "EncodingConverter.hpp"
#include "EncodingName.hpp"
#include "AnonymizerError.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace {

// Closes the conversion descriptor on every exit path
class IconvGuard {
public:
    explicit IconvGuard(iconv_t cd) : cd_(cd) {}
    ~IconvGuard() { iconv_close(cd_); }

    IconvGuard(const IconvGuard&) = delete;
    IconvGuard& operator=(const IconvGuard&) = delete;

    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

// Length of the maximal ill-formed UTF-8 subpart at p: a lead byte plus the
// continuation bytes that still fit a well-formed sequence, at least 1.
size_t utf8_ill_formed_length(const unsigned char* p, size_t n) {
    const unsigned char lead = p[0];
    size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead == 0xE0) {
        need = 3; lo = 0xA0;
    } else if (lead == 0xED) {
        need = 3; hi = 0x9F;
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        need = 3;
    } else if (lead == 0xF0) {
        need = 4; lo = 0x90;
    } else if (lead == 0xF4) {
        need = 4; hi = 0x8F;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 4;
    } else {
        return 1;
    }

    size_t len = 1;
    if (len < n && p[len] >= lo && p[len] <= hi) {
        ++len;
        while (len < need && len < n && p[len] >= 0x80 && p[len] <= 0xBF) {
            ++len;
        }
    }
    return len;
}

}

iconv_t EncodingConverter::open_descriptor(const std::string& tocode, const std::string& fromcode) {
    iconv_t cd = iconv_open(tocode.c_str(), fromcode.c_str());
    if (cd == (iconv_t)(-1)) {
        if (errno == EINVAL) {
            throw EncodingError("Unsupported encoding conversion: " + fromcode + " -> " + tocode);
        }
        throw EncodingError("iconv_open failed: " + std::string(std::strerror(errno)));
    }
    return cd;
}

void EncodingConverter::throw_iconv_error(const std::string& operation, size_t offset) {
    const std::string where = " at byte offset " + std::to_string(offset);
    switch (errno) {
        case EILSEQ: throw EncodingError(operation + ": Illegal or unrepresentable character" + where);
        case EINVAL: throw EncodingError(operation + ": Incomplete multibyte sequence" + where);
        default:     throw EncodingError(operation + ": " + std::strerror(errno) + where);
    }
}

std::string EncodingConverter::convert(const std::string& data,
                                       const std::string& fromcode,
                                       const std::string& tocode,
                                       bool replace_invalid) {
    IconvGuard cd(open_descriptor(tocode, fromcode));

    std::string result;
    result.reserve(data.size());

    char* inbuf = const_cast<char*>(data.data());
    size_t inbytesleft = data.size();

    std::vector<char> outbuf(std::max<size_t>(data.size() * 4, 256));

    while (inbytesleft > 0) {
        char* outptr = outbuf.data();
        size_t outbytesleft = outbuf.size();

        size_t rc = iconv(cd.get(), &inbuf, &inbytesleft, &outptr, &outbytesleft);
        result.append(outbuf.data(), static_cast<size_t>(outptr - outbuf.data()));

        if (rc != (size_t)(-1)) {
            continue;
        }

        const size_t offset = data.size() - inbytesleft;
        if (errno == E2BIG) {
            continue;
        } else if (errno == EILSEQ && replace_invalid) {
            size_t skip = 1;
            if (fromcode == "UTF-8") {
                skip = utf8_ill_formed_length(reinterpret_cast<const unsigned char*>(inbuf), inbytesleft);
            }
            result += REPLACEMENT_CHARACTER;
            inbuf += skip;
            inbytesleft -= skip;
        } else if (errno == EINVAL && replace_invalid) {
            // Truncated sequence at end of input
            result += REPLACEMENT_CHARACTER;
            inbytesleft = 0;
        } else {
            throw_iconv_error("iconv conversion " + fromcode + " -> " + tocode + " failed", offset);
        }
    }

    // Flush any pending shift state
    char* outptr = outbuf.data();
    size_t outbytesleft = outbuf.size();
    if (iconv(cd.get(), nullptr, nullptr, &outptr, &outbytesleft) == (size_t)(-1)) {
        throw_iconv_error("iconv reset " + fromcode + " -> " + tocode + " failed", data.size());
    }
    result.append(outbuf.data(), static_cast<size_t>(outptr - outbuf.data()));

    return result;
}

std::string EncodingConverter::decode(const std::string& data, const std::string& encoding) {
    return convert(data, to_iconv_name(encoding), "UTF-8", true);
}

std::string EncodingConverter::encode(const std::string& text, const std::string& encoding) {
    const std::string tocode = to_iconv_name(encoding);

    // Text is already valid UTF-8 after decode
    if (tocode == "UTF-8") {
        return text;
    }
    return convert(text, "UTF-8", tocode, false);
}
