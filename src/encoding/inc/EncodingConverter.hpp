#pragma once
#include <string>
#include <iconv.h>

// iconv based conversion between a named encoding and the UTF-8 text the
// anonymizer works on.
class EncodingConverter {
public:
    // Decode bytes into UTF-8. Undecodable input never fails: each maximal
    // ill-formed subpart of UTF-8 input (a single byte for other encodings),
    // and a truncated trailing sequence, becomes one U+FFFD.
    static std::string decode(const std::string& data, const std::string& encoding);

    // Encode UTF-8 text. Throws EncodingError when a character has no
    // representation in the target encoding.
    static std::string encode(const std::string& text, const std::string& encoding);

    static constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

private:
    static std::string convert(const std::string& data,
                               const std::string& fromcode,
                               const std::string& tocode,
                               bool replace_invalid);
    static iconv_t open_descriptor(const std::string& tocode, const std::string& fromcode);
    static void throw_iconv_error(const std::string& operation, size_t offset);
};
